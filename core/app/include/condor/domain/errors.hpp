#pragma once

#include "condor/domain/order.hpp"

#include <stdexcept>
#include <string>

namespace condor {

// Feed handshake or reconnect failure.
class ConnectionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The feed exhausted its reconnect budget. Fatal for the process.
class FeedUnavailable : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Bad configuration. Only ever raised at startup.
class ConfigInvalid : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// BrokerError
// -----------------------------------------------------------------------------
// Raised by IBrokerClient implementations. The OrderRouter converts it into a
// reject report carrying code(); it never crosses the routing thread.
// -----------------------------------------------------------------------------
class BrokerError : public std::runtime_error {
 public:
  BrokerError(domain::RejectCode code, const std::string& what)
      : std::runtime_error(what), code_(code) {}

  domain::RejectCode code() const { return code_; }

 private:
  domain::RejectCode code_;
};

}  // namespace condor
