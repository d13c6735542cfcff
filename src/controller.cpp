// ============================================================================
// controller.cpp: implementation for controller.hpp
// ============================================================================

#include "pumplink/controller.hpp"
#include "pumplink/log.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>
#include <variant>

namespace pumplink {

const char* request_status_name(RequestStatus s) {
    switch (s) {
        case RequestStatus::Ok:         return "ok";
        case RequestStatus::Timeout:    return "timeout";
        case RequestStatus::Cancelled:  return "cancelled";
        case RequestStatus::SendFailed: return "send_failed";
        case RequestStatus::NotOpen:    return "not_open";
    }
    return "unknown";
}

// -------- Registration --------

Controller::Registration::Registration(Registration&& other) noexcept
    : owner_(other.owner_), id_(other.id_) {
    other.owner_ = nullptr;
    other.id_    = 0;
}

Controller::Registration& Controller::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        reset();
        owner_ = other.owner_;
        id_    = other.id_;
        other.owner_ = nullptr;
        other.id_    = 0;
    }
    return *this;
}

void Controller::Registration::reset() {
    if (owner_) {
        owner_->unlisten(id_);
        owner_ = nullptr;
        id_    = 0;
    }
}

// -------- Controller --------

Controller::Controller(Connection& connection) : connection_(connection) {}

Controller::~Controller() { stop(); }

Controller::Registration Controller::listen(Listener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    const uint64_t id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return Registration(this, id);
}

void Controller::unlisten(uint64_t id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(id);
}

size_t Controller::listener_count() const {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return listeners_.size();
}

void Controller::set_observer(Observer observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer_ = std::move(observer);
}

void Controller::dispatch(const Message& msg) {
    if (msg.has_command()) {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (auto& entry : listeners_) {
            try {
                entry.second(msg.command());
            } catch (const std::exception& e) {
                PUMPLINK_LOG_ERROR("msg=\"listener threw\" id=" << entry.first
                                   << " what=\"" << e.what() << "\"");
            } catch (...) {
                PUMPLINK_LOG_ERROR("msg=\"listener threw\" id=" << entry.first
                                   << " what=\"non-standard exception\"");
            }
        }
    }

    Observer observer;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observer = observer_;
    }
    if (observer) observer(msg);
}

RxStatus Controller::pump_locked(Message& out, int timeout_ms) {
    const RxStatus s = connection_.next(out, timeout_ms);
    if (s == RxStatus::Message) dispatch(out);
    return s;
}

RxStatus Controller::pump(Message& out, int timeout_ms) {
    std::lock_guard<std::mutex> lock(pump_mutex_);
    return pump_locked(out, timeout_ms);
}

// ---------------------------------------------------------------------------
// transact()
// -----------
// Listen, send, then wait. The slot is declared before the registration so the
// listener is gone before the slot it writes to is destroyed.
// ---------------------------------------------------------------------------
RequestStatus Controller::transact(const Command& request, CommandKind reply_kind, uint16_t reg,
                                   Command& reply, int timeout_ms) {
    using clock = std::chrono::steady_clock;

    const uint64_t epoch = cancel_epoch_.load();
    ResponseSlot<Command> slot;

    Registration registration = listen([&slot, reply_kind, reg](const Command& c) {
        if (kind_of(c) != reply_kind) return;
        if (const auto* r = std::get_if<ResponseRead>(&c)) {
            if (r->reg == reg) slot.set(c);
        } else if (const auto* w = std::get_if<ResponseWrite>(&c)) {
            if (w->reg == reg) slot.set(c);
        }
    });

    if (!connection_.is_open()) return RequestStatus::NotOpen;
    if (connection_.send(request) != transport::TxResult::Ok) return RequestStatus::SendFailed;

    const bool forever = timeout_ms < 0;
    const auto deadline = clock::now() + std::chrono::milliseconds(forever ? 0 : timeout_ms);

    while (true) {
        if (auto value = slot.try_get()) {
            reply = std::move(*value);
            return RequestStatus::Ok;
        }
        if (cancel_epoch_.load() != epoch) return RequestStatus::Cancelled;

        int slice = PUMP_SLICE_MS;
        if (!forever) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            if (left.count() <= 0) return RequestStatus::Timeout;
            slice = static_cast<int>(std::min<long long>(left.count(), PUMP_SLICE_MS));
        }

        std::unique_lock<std::mutex> pumping(pump_mutex_, std::try_to_lock);
        if (pumping.owns_lock()) {
            Message msg;
            if (pump_locked(msg, slice) == RxStatus::Closed) return RequestStatus::NotOpen;
        } else {
            slot.wait_for(slice);
        }
    }
}

RequestStatus Controller::read(uint16_t reg, uint32_t& value, int timeout_ms) {
    Command reply;
    const RequestStatus s = transact(RequestRead{reg}, CommandKind::ResponseRead, reg, reply, timeout_ms);
    if (s == RequestStatus::Ok) {
        value = std::get<ResponseRead>(reply).value;
    } else {
        PUMPLINK_LOG_WARN("msg=\"read failed\" reg=" << reg << " status=" << request_status_name(s));
    }
    return s;
}

RequestStatus Controller::write(uint16_t reg, uint32_t value, int timeout_ms) {
    Command reply;
    const RequestStatus s = transact(RequestWrite{reg, value}, CommandKind::ResponseWrite, reg, reply, timeout_ms);
    if (s != RequestStatus::Ok) {
        PUMPLINK_LOG_WARN("msg=\"write failed\" reg=" << reg << " value=" << value
                          << " status=" << request_status_name(s));
    }
    return s;
}

void Controller::cancel_pending() {
    cancel_epoch_.fetch_add(1);
}

bool Controller::start(Observer observer) {
    if (running_.exchange(true)) return false;
    if (observer) set_observer(std::move(observer));
    worker_ = std::thread(&Controller::run_loop, this);
    PUMPLINK_LOG_INFO("msg=\"pump thread started\"");
    return true;
}

void Controller::stop() {
    running_.store(false);
    if (worker_.joinable()) {
        worker_.join();
        PUMPLINK_LOG_INFO("msg=\"pump thread stopped\"");
    }
    cancel_pending();
}

void Controller::run_loop() {
    while (running_.load()) {
        Message msg;
        RxStatus s;
        {
            std::lock_guard<std::mutex> lock(pump_mutex_);
            s = pump_locked(msg, PUMP_SLICE_MS);
        }
        if (s == RxStatus::Closed || s == RxStatus::Error) {
            std::this_thread::sleep_for(std::chrono::milliseconds(PUMP_SLICE_MS));
        }
    }
}

} // namespace pumplink
