#pragma once
// In-memory datagram transport for tests. Datagrams pushed with inject() come out of
// recv(); everything passed to send() is recorded and handed to the optional responder,
// which plays the heat pump.

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "pumplink/transport/transport_base.hpp"

namespace pumplink::testing {

class LoopbackTransport : public transport::IDatagramTransport {
public:
  struct Datagram {
    std::vector<uint8_t> bytes;
    transport::Endpoint  peer;
  };

  using Responder = std::function<void(const Datagram& sent)>;

  bool begin(const transport::Config& cfg) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_begin_) return false;
    cfg_  = cfg;
    open_ = true;
    ++begin_count_;
    return true;
  }

  void end() override {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
    cv_.notify_all();
  }

  bool is_open() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
  }

  transport::RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len,
                           transport::Endpoint& from, int timeout_ms) override {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this] { return !inbound_.empty() || !open_; };
    if (timeout_ms < 0) cv_.wait(lock, ready);
    else cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), ready);

    if (!open_) return transport::RxResult::Error;
    if (inbound_.empty()) return transport::RxResult::None;

    Datagram d = std::move(inbound_.front());
    inbound_.pop_front();
    out_len = d.bytes.size() < cap ? d.bytes.size() : cap;
    std::copy(d.bytes.begin(), d.bytes.begin() + out_len, out);
    from = d.peer;
    return transport::RxResult::Ok;
  }

  transport::TxResult send(const uint8_t* data, std::size_t len,
                           const transport::Endpoint& to) override {
    Datagram d{std::vector<uint8_t>(data, data + len), to};
    Responder responder;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!open_) return transport::TxResult::Error;
      if (fail_send_) return transport::TxResult::Error;
      sent_.push_back(d);
      responder = responder_;
    }
    if (responder) responder(d);
    return transport::TxResult::Ok;
  }

  const char* name() const override { return "loopback"; }
  std::size_t mtu() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_.mtu;
  }

  // -------- test controls --------

  void inject(std::vector<uint8_t> bytes, const std::string& host = "10.0.0.2",
              uint16_t port = 9999) {
    std::lock_guard<std::mutex> lock(mutex_);
    inbound_.push_back(Datagram{std::move(bytes), transport::Endpoint{host, port}});
    cv_.notify_all();
  }

  void set_responder(Responder r) {
    std::lock_guard<std::mutex> lock(mutex_);
    responder_ = std::move(r);
  }

  void set_fail_send(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_send_ = fail;
  }

  void set_fail_begin(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_begin_ = fail;
  }

  std::vector<Datagram> sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
  }

  transport::Config config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_;
  }

  int begin_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return begin_count_;
  }

private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<Datagram>    inbound_;
  std::vector<Datagram>   sent_;
  Responder               responder_;
  transport::Config       cfg_{};
  bool                    open_{false};
  bool                    fail_send_{false};
  bool                    fail_begin_{false};
  int                     begin_count_{0};
};

} // namespace pumplink::testing
