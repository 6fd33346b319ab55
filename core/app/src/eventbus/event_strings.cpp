#include "condor/events/broker_events.hpp"
#include "condor/events/event_types.hpp"

namespace condor {

const char* toString(FeedStatus status) {
  switch (status) {
    case FeedStatus::Connected:
      return "CONNECTED";
    case FeedStatus::Disconnected:
      return "DISCONNECTED";
    case FeedStatus::Resynced:
      return "RESYNCED";
    case FeedStatus::Unavailable:
      return "UNAVAILABLE";
  }
  return "UNKNOWN";
}

const char* toString(BrokerReportEvent::Kind kind) {
  switch (kind) {
    case BrokerReportEvent::Kind::Ack:
      return "ACK";
    case BrokerReportEvent::Kind::Fill:
      return "FILL";
    case BrokerReportEvent::Kind::Reject:
      return "REJECT";
    case BrokerReportEvent::Kind::Cancelled:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

}  // namespace condor
