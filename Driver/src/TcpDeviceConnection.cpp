#include "TcpDeviceConnection.hpp"

#include <DeviceErrors.hpp>
#include <LineEncoding.hpp>
#include <Logger.hpp>

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>
#include <format>
#include <memory>
#include <stdexcept>
#include <utility>

namespace {
bool isValidPort(const std::string& port) {
  int value = 0;
  const auto [ptr, ec] =
      std::from_chars(port.data(), port.data() + port.size(), value);
  return !port.empty() && ec == std::errc{} && ptr == port.data() + port.size() &&
         value > 0 && value <= 65535;
}
}  // namespace

TcpDeviceConnection::TcpDeviceConnection(ConnectionParameters parameters)
    : _parameters(std::move(parameters)) {
  if (!_parameters.address || _parameters.address->empty()) {
    throw std::runtime_error("TCP connection requires an address");
  }
  if (!isValidPort(_parameters.port)) {
    throw std::runtime_error(
        std::format("Invalid TCP port '{}'", _parameters.port));
  }
  requireSupportedEncoding(_parameters.encoding);
  _host = *_parameters.address;
  _service = _parameters.port;
  _parameters.readTimeoutMS = std::max(1u, _parameters.readTimeoutMS);
}

TcpDeviceConnection::~TcpDeviceConnection() { closeNoThrow(); }

void TcpDeviceConnection::open() {
  closeNoThrow();

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* found = nullptr;
  if (const int rc = ::getaddrinfo(_host.c_str(), _service.c_str(), &hints, &found);
      rc != 0) {
    throw ConnectionError(std::format("Cannot resolve {}: {}", describe(),
                                      ::gai_strerror(rc)));
  }
  const std::unique_ptr<addrinfo, void (*)(addrinfo*)> results(found,
                                                               ::freeaddrinfo);

  int lastErrno = 0;
  for (auto* ai = results.get(); ai != nullptr; ai = ai->ai_next) {
    const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      lastErrno = errno;
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      _fd = fd;
      break;
    }
    lastErrno = errno;
    ::close(fd);
  }
  if (_fd < 0) {
    throw ConnectionError(std::format("Failed to connect to {}: {}",
                                      describe(), std::strerror(lastErrno)));
  }
  SPDLOG_DEBUG("Connected to {}", describe());
}

void TcpDeviceConnection::closeNoThrow() noexcept {
  _pending.clear();
  if (_fd < 0) {
    return;
  }
  if (::close(_fd) == -1 && errno != EBADF) {
    SPDLOG_WARN("Closing {} failed, errno={}", describe(), errno);
  }
  _fd = -1;
}

void TcpDeviceConnection::write(std::string_view frame) {
  if (_parameters.strict7Bit) {
    requireSevenBit(frame, describe());
  }
  if (_fd < 0) {
    throw ConnectionError(std::format("{} is not open", describe()));
  }
  discardStaleInput();
  std::size_t sent = 0;
  while (sent < frame.size()) {
    const auto n =
        ::send(_fd, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw ConnectionError(std::format("Write to {} failed: {}", describe(),
                                        std::strerror(errno)));
    }
    sent += static_cast<std::size_t>(n);
  }
}

void TcpDeviceConnection::discardStaleInput() {
  _pending.clear();
  char buffer[256];
  while (true) {
    const auto n = ::recv(_fd, buffer, sizeof(buffer), MSG_DONTWAIT);
    if (n > 0) {
      SPDLOG_DEBUG("Discarded {} stale bytes from {}", n, describe());
      continue;
    }
    if (n == 0) {
      throw ConnectionError(
          std::format("{} closed the connection", describe()));
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return;
    }
    throw ConnectionError(std::format("Read from {} failed: {}", describe(),
                                      std::strerror(errno)));
  }
}

std::string TcpDeviceConnection::readUntil(std::string_view terminator) {
  if (terminator.empty()) {
    throw InvalidArgument("Reply terminator must not be empty");
  }
  if (_fd < 0) {
    throw ConnectionError(std::format("{} is not open", describe()));
  }
  using Clock = std::chrono::steady_clock;
  const auto deadline =
      Clock::now() + std::chrono::milliseconds(_parameters.readTimeoutMS);

  while (true) {
    if (const auto pos = _pending.find(terminator); pos != std::string::npos) {
      std::string line = _pending.substr(0, pos);
      _pending.erase(0, pos + terminator.size());
      if (_parameters.strict7Bit) {
        maskSevenBit(line);
      }
      return line;
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now());
    if (remaining.count() <= 0) {
      throw ConnectionError(std::format(
          "Timed out after {} ms waiting for reply on {} (partial '{}')",
          _parameters.readTimeoutMS, describe(), _pending));
    }

    pollfd pfd{_fd, POLLIN, 0};
    const int pr = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (pr < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw ConnectionError(std::format("Polling {} failed: {}", describe(),
                                        std::strerror(errno)));
    }
    if (pr == 0) {
      continue;
    }

    char buffer[256];
    const auto n = ::recv(_fd, buffer, sizeof(buffer), 0);
    if (n == 0) {
      throw ConnectionError(
          std::format("{} closed the connection", describe()));
    }
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      throw ConnectionError(std::format("Read from {} failed: {}", describe(),
                                        std::strerror(errno)));
    }
    _pending.append(buffer, static_cast<std::size_t>(n));
  }
}

std::string TcpDeviceConnection::describe() const {
  return std::format("tcp({}:{})", _host, _service);
}
