/**
 * @page pl-controller pumplink Controller
 * @file controller.hpp
 * @brief Request/response correlation on top of a Connection.
 *
 * @details
 * The heat pump answers requests asynchronously and interleaves its answers with
 * unsolicited data frames. The Controller turns that into blocking calls:
 *
 *   read(reg, value, timeout)    send RequestRead{reg}, wait for ResponseRead with the same reg
 *   write(reg, value, timeout)   send RequestWrite{reg,value}, wait for ResponseWrite with the same reg
 *
 * Every call registers a listener before it sends, so a response that arrives quickly is
 * never missed, and unregisters it on every exit path (Registration is RAII).
 *
 * WHO PUMPS
 * ---------
 * Inbound traffic is moved from the Connection to the listeners by "pumping":
 *
 *   - start() runs a background thread that pumps until stop(),
 *   - without it, a blocked read()/write() pumps by itself in short slices,
 *   - pump() lets the application drive the loop and see every Message.
 *
 * Only one thread pumps at a time. Others wait on their own response slot.
 *
 * MATCHING
 * --------
 * A response is matched by kind and register only. Two in-flight reads of the same
 * register are both satisfied by the first matching response.
 *
 * CANCELLATION
 * ------------
 * cancel_pending() ends every in-flight read()/write() with RequestStatus::Cancelled;
 * stop() does the same after joining the pump thread.
 *
 * LISTENER RULES
 * --------------
 * Listeners run on the pumping thread while the listener table is locked. Once
 * Registration::reset() returns, the listener will not be called again. A listener
 * must not call listen(), read() or write() on the same Controller.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

#include "pumplink/command.hpp"
#include "pumplink/connection.hpp"
#include "pumplink/message.hpp"
#include "pumplink/response_slot.hpp"

namespace pumplink {

enum class RequestStatus : uint8_t {
    Ok = 0,
    Timeout,     ///< no matching response in time
    Cancelled,   ///< cancel_pending() or stop() was called
    SendFailed,  ///< the request could not be sent
    NotOpen,     ///< the connection is closed
};

const char* request_status_name(RequestStatus s);

class Controller {
public:
    using Listener = std::function<void(const Command&)>;
    using Observer = std::function<void(const Message&)>;

    /// Pump slice length: bounds the latency of stop() and cancel_pending().
    static constexpr int PUMP_SLICE_MS = 100;

    /// Move-only handle; destroying or resetting it removes the listener.
    class Registration {
    public:
        Registration() = default;
        ~Registration() { reset(); }

        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;

        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

        void reset();
        bool active() const { return owner_ != nullptr; }

    private:
        friend class Controller;
        Registration(Controller* owner, uint64_t id) : owner_(owner), id_(id) {}

        Controller* owner_{nullptr};
        uint64_t    id_{0};
    };

    explicit Controller(Connection& connection);
    ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    /// Add a listener for every command carried by an inbound master or slave frame.
    Registration listen(Listener listener);
    size_t listener_count() const;

    /// @p timeout_ms counts from the send; negative waits until a reply or cancellation.
    RequestStatus read(uint16_t reg, uint32_t& value, int timeout_ms);
    RequestStatus write(uint16_t reg, uint32_t value, int timeout_ms);

    /**
     * @brief Take one message off the connection and dispatch it.
     *
     * Listeners and the observer see it before it is returned in @p out.
     * Blocks while another thread is pumping.
     */
    RxStatus pump(Message& out, int timeout_ms);

    /// Called with every inbound Message, after the listeners.
    void set_observer(Observer observer);

    /// Start the background pump thread. False if it is already running.
    bool start(Observer observer = {});
    void stop();
    bool running() const { return running_.load(); }

    void cancel_pending();

    Connection& connection() { return connection_; }

private:
    RequestStatus transact(const Command& request, CommandKind reply_kind, uint16_t reg,
                           Command& reply, int timeout_ms);
    RxStatus pump_locked(Message& out, int timeout_ms);
    void dispatch(const Message& msg);
    void unlisten(uint64_t id);
    void run_loop();

    Connection& connection_;

    mutable std::mutex            listeners_mutex_;
    std::map<uint64_t, Listener>  listeners_;
    uint64_t                      next_listener_id_{1};

    std::mutex pump_mutex_;

    std::mutex observer_mutex_;
    Observer   observer_;

    std::atomic<bool>     running_{false};
    std::atomic<uint64_t> cancel_epoch_{0};
    std::thread           worker_;
};

} // namespace pumplink
