#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include <google/protobuf/message_lite.h>

namespace arena::sandbox::wire {

// Frames larger than this are treated as malformed.
inline constexpr std::uint32_t kMaxFrameBytes = 16u * 1024u * 1024u;

enum class ReadStatus {
  kOk,
  kClosed,
  kTimeout,
  kMalformed,
  kError,
};

/*
  Length-prefixed protobuf framing over a stream socket:

      [u32 big-endian payload length][payload]

  Writes use MSG_NOSIGNAL so a dead peer yields false instead of SIGPIPE.
*/
bool WriteFrame(int fd, const google::protobuf::MessageLite& message);

// Waits at most until `deadline` (forever when unset) for a complete frame.
ReadStatus ReadFrame(int                                                  fd,
                     google::protobuf::MessageLite&                       message,
                     std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt);

} // namespace arena::sandbox::wire
