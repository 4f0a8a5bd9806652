#include "internal/sandbox/wire.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <string>

namespace arena::sandbox::wire {

namespace {

bool SendAll(int fd, const char* data, std::size_t size) {
  while (size > 0) {
    const ssize_t n = ::send(fd, data, size, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    data += n;
    size -= static_cast<std::size_t>(n);
  }
  return true;
}

int RemainingMs(const std::optional<std::chrono::steady_clock::time_point>& deadline) {
  if (!deadline) return -1;
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - std::chrono::steady_clock::now()).count();
  return left <= 0 ? 0 : static_cast<int>(left);
}

ReadStatus RecvAll(int fd, char* data, std::size_t size, const std::optional<std::chrono::steady_clock::time_point>& deadline) {
  while (size > 0) {
    pollfd pfd{fd, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, RemainingMs(deadline));
    if (ready < 0) {
      if (errno == EINTR) continue;
      return ReadStatus::kError;
    }
    if (ready == 0) {
      return ReadStatus::kTimeout;
    }

    const ssize_t n = ::recv(fd, data, size, 0);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      return ReadStatus::kError;
    }
    if (n == 0) {
      return ReadStatus::kClosed;
    }
    data += n;
    size -= static_cast<std::size_t>(n);
  }
  return ReadStatus::kOk;
}

} // namespace

bool WriteFrame(int fd, const google::protobuf::MessageLite& message) {
  std::string payload;
  if (!message.SerializeToString(&payload) || payload.size() > kMaxFrameBytes) {
    return false;
  }

  const auto    size      = static_cast<std::uint32_t>(payload.size());
  unsigned char header[4] = {
      static_cast<unsigned char>(size >> 24),
      static_cast<unsigned char>(size >> 16),
      static_cast<unsigned char>(size >> 8),
      static_cast<unsigned char>(size),
  };
  return SendAll(fd, reinterpret_cast<const char*>(header), sizeof(header)) && SendAll(fd, payload.data(), payload.size());
}

ReadStatus ReadFrame(int fd, google::protobuf::MessageLite& message, std::optional<std::chrono::steady_clock::time_point> deadline) {
  unsigned char header[4];
  if (auto status = RecvAll(fd, reinterpret_cast<char*>(header), sizeof(header), deadline); status != ReadStatus::kOk) {
    return status;
  }

  const std::uint32_t size = (static_cast<std::uint32_t>(header[0]) << 24) | (static_cast<std::uint32_t>(header[1]) << 16) |
                             (static_cast<std::uint32_t>(header[2]) << 8) | static_cast<std::uint32_t>(header[3]);
  if (size > kMaxFrameBytes) {
    return ReadStatus::kMalformed;
  }

  std::string payload(size, '\0');
  if (auto status = RecvAll(fd, payload.data(), payload.size(), deadline); status != ReadStatus::kOk) {
    // A frame cut short by EOF is a truncated frame, not a clean close.
    return status == ReadStatus::kClosed ? ReadStatus::kMalformed : status;
  }

  if (!message.ParseFromString(payload)) {
    return ReadStatus::kMalformed;
  }
  return ReadStatus::kOk;
}

} // namespace arena::sandbox::wire
