#pragma once

#include "condor/domain/tick.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace condor {

struct Heartbeat {
  std::int64_t timestamp_ms{0};
};

using FeedMessage = std::variant<domain::Tick, Heartbeat>;

// -----------------------------------------------------------------------------
// IFeedTransport
// -----------------------------------------------------------------------------
// The streaming quote collaborator. Implemented by ZmqFeedTransport; tests
// script their own.
//
//   open()            subscribe handshake; throws ConnectionError
//   close()           unsubscribe and release the connection; never throws
//   receive(timeout)  next message, std::nullopt on timeout; throws
//                     ConnectionError when the stream is closed
//   requestSnapshot() latest tick per instrument, used to resync after a
//                     reconnect gap; throws ConnectionError
// -----------------------------------------------------------------------------
class IFeedTransport {
 public:
  virtual ~IFeedTransport() = default;

  virtual void open(const std::vector<std::string>& instruments) = 0;
  virtual void close() = 0;
  virtual std::optional<FeedMessage> receive(int timeout_ms) = 0;
  virtual std::vector<domain::Tick> requestSnapshot(
      const std::vector<std::string>& instruments) = 0;
};

}  // namespace condor
