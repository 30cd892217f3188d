#include "posix_platform.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iterator>
#include <optional>
#include <thread>

namespace gs_bridge {

static const char* TAG = "gs_bridge";

namespace {

IoError MakeError(int code, const char* what) {
  return IoError{code, std::string(what) + ": " + std::strerror(code)};
}

std::optional<speed_t> BaudToSpeed(uint32_t baud) noexcept {
  switch (baud) {
    case 9600U:
      return B9600;
    case 19200U:
      return B19200;
    case 38400U:
      return B38400;
    case 57600U:
      return B57600;
    case 115200U:
      return B115200;
    case 230400U:
      return B230400;
#ifdef B460800
    case 460800U:
      return B460800;
#endif
#ifdef B921600
    case 921600U:
      return B921600;
#endif
    default:
      return std::nullopt;
  }
}

// Сырой режим 8N1 без управления потоком; чтение по poll()
bool ConfigureRaw(int fd, speed_t speed) {
  struct termios tio;
  std::memset(&tio, 0, sizeof(tio));
  if (::tcgetattr(fd, &tio) != 0) {
    return false;
  }

  tio.c_iflag &= static_cast<tcflag_t>(~(IGNBRK | BRKINT | PARMRK | ISTRIP |
                                         INLCR | IGNCR | ICRNL | IXON | IXOFF |
                                         IXANY));
  tio.c_oflag &= static_cast<tcflag_t>(~OPOST);
  tio.c_lflag &=
      static_cast<tcflag_t>(~(ECHO | ECHONL | ICANON | ISIG | IEXTEN));
  tio.c_cflag &= static_cast<tcflag_t>(~(CSIZE | PARENB | PARODD | CSTOPB));
  tio.c_cflag |= static_cast<tcflag_t>(CLOCAL | CREAD | CS8);
#ifdef CRTSCTS
  tio.c_cflag &= static_cast<tcflag_t>(~CRTSCTS);
#endif

  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;

  ::cfsetispeed(&tio, speed);
  ::cfsetospeed(&tio, speed);

  if (::tcsetattr(fd, TCSANOW, &tio) != 0) {
    return false;
  }
  ::tcflush(fd, TCIOFLUSH);
  return true;
}

bool HasPrefix(const char* name, const char* prefix) {
  return std::strncmp(name, prefix, std::strlen(prefix)) == 0;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// PosixSerialPort
// ═══════════════════════════════════════════════════════════════════════════

PosixSerialPort::PosixSerialPort(int fd, std::string device)
    : fd_(fd), device_(std::move(device)) {}

PosixSerialPort::~PosixSerialPort() { Close(); }

IoResult<size_t> PosixSerialPort::Read(std::span<uint8_t> buf,
                                       uint32_t timeout_ms) {
  int fd;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    fd = fd_;
  }
  if (fd < 0) {
    return IoError{EBADF, device_ + ": port closed"};
  }

  struct pollfd pfd {};
  pfd.fd = fd;
  pfd.events = POLLIN;

  const int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
  if (ready < 0) {
    if (errno == EINTR) return size_t{0};
    return MakeError(errno, "poll");
  }
  if (ready == 0) {
    return size_t{0};
  }
  if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
    // USB-адаптер отключён
    return IoError{EIO, device_ + ": device disconnected"};
  }

  const ssize_t n = ::read(fd, buf.data(), buf.size());
  if (n < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return size_t{0};
    }
    return MakeError(errno, "read");
  }
  if (n == 0) {
    // poll() сообщил о данных, но read() вернул EOF
    return IoError{EIO, device_ + ": end of stream"};
  }
  return static_cast<size_t>(n);
}

size_t PosixSerialPort::BytesWaiting() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ < 0) return 0;

  int available = 0;
  if (::ioctl(fd_, FIONREAD, &available) != 0 || available < 0) {
    return 0;
  }
  return static_cast<size_t>(available);
}

IoResult<size_t> PosixSerialPort::Write(std::span<const uint8_t> data) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ < 0) {
    return IoError{EBADF, device_ + ": port closed"};
  }

  size_t written = 0;
  while (written < data.size()) {
    const ssize_t n =
        ::write(fd_, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        struct pollfd pfd {};
        pfd.fd = fd_;
        pfd.events = POLLOUT;
        if (::poll(&pfd, 1, 100) <= 0) {
          return IoError{ETIMEDOUT, device_ + ": write timeout"};
        }
        continue;
      }
      return MakeError(errno, "write");
    }
    written += static_cast<size_t>(n);
  }
  ::tcdrain(fd_);
  return written;
}

void PosixSerialPort::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool PosixSerialPort::IsOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fd_ >= 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// PosixPlatform
// ═══════════════════════════════════════════════════════════════════════════

PosixPlatform::PosixPlatform() : start_(std::chrono::steady_clock::now()) {}

IoResult<std::shared_ptr<SerialPort>> PosixPlatform::OpenPort(
    const std::string& device, uint32_t baud) {
  const auto speed = BaudToSpeed(baud);
  if (!speed) {
    return IoError{EINVAL, "unsupported baud rate " + std::to_string(baud)};
  }

  const int fd = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) {
    return MakeError(errno, device.c_str());
  }

  if (!ConfigureRaw(fd, *speed)) {
    const int err = errno;
    ::close(fd);
    return MakeError(err, "termios");
  }

  return std::shared_ptr<SerialPort>(
      std::make_shared<PosixSerialPort>(fd, device));
}

std::vector<PortDescriptor> PosixPlatform::ListPorts() {
  static constexpr struct {
    const char* prefix;
    const char* description;
  } kPatterns[] = {
      {"ttyUSB", "USB serial adapter"},
      {"ttyACM", "USB CDC ACM"},
      {"ttyAMA", "On-board UART"},
      {"ttyS", "Serial port"},
  };

  std::vector<PortDescriptor> ports;
  DIR* dir = ::opendir("/dev");
  if (dir == nullptr) {
    return ports;
  }

  while (const struct dirent* entry = ::readdir(dir)) {
    for (const auto& pattern : kPatterns) {
      if (HasPrefix(entry->d_name, pattern.prefix)) {
        ports.push_back(PortDescriptor{std::string("/dev/") + entry->d_name,
                                       pattern.description});
        break;
      }
    }
  }
  ::closedir(dir);

  // USB-адаптеры первыми, затем встроенные UART
  auto rank = [](const PortDescriptor& p) {
    for (size_t i = 0; i < std::size(kPatterns); ++i) {
      if (p.device.compare(5, std::strlen(kPatterns[i].prefix),
                           kPatterns[i].prefix) == 0) {
        return i;
      }
    }
    return std::size(kPatterns);
  };
  std::sort(ports.begin(), ports.end(),
            [&](const PortDescriptor& a, const PortDescriptor& b) {
              const size_t ra = rank(a);
              const size_t rb = rank(b);
              return ra != rb ? ra < rb : a.device < b.device;
            });
  return ports;
}

uint32_t PosixPlatform::GetTimeMs() const noexcept {
  const auto elapsed = std::chrono::steady_clock::now() - start_;
  return static_cast<uint32_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

void PosixPlatform::SleepMs(uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

void PosixPlatform::Log(LogLevel level, std::string_view msg) const {
  char letter = 'I';
  switch (level) {
    case LogLevel::Info:
      letter = 'I';
      break;
    case LogLevel::Warning:
      letter = 'W';
      break;
    case LogLevel::Error:
      letter = 'E';
      break;
  }

  std::lock_guard<std::mutex> lock(log_mutex_);
  std::fprintf(stderr, "%c (%u) %s: %.*s\n", letter,
               static_cast<unsigned>(GetTimeMs()), TAG,
               static_cast<int>(msg.size()), msg.data());
}

}  // namespace gs_bridge
