#include "condor/network/market_data_thread.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace condor {

MarketDataThread::MarketDataThread(std::unique_ptr<FeedAdapter> adapter)
    : adapter_(std::move(adapter)) {}

MarketDataThread::~MarketDataThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): handshake on the caller's thread, then spawn the receive loop
// -----------------------------------------------------------------------------
void MarketDataThread::start() {
  if (thread_.joinable()) {
    return;
  }

  adapter_->connect();

  thread_ = std::thread([this] {
    std::cout << "[MarketDataThread] receive loop started.\n";
    try {
      adapter_->run();
    } catch (const std::exception& e) {
      std::cerr << "[MarketDataThread] ERROR: receive loop threw: " << e.what()
                << "\n";
    }
    std::cout << "[MarketDataThread] receive loop exited (state="
              << toString(adapter_->state()) << ").\n";
  });
}

// -----------------------------------------------------------------------------
// stop(): signal the adapter and join
// -----------------------------------------------------------------------------
void MarketDataThread::stop() {
  adapter_->stop();
  if (thread_.joinable()) {
    thread_.join();
  }
}

}  // namespace condor
