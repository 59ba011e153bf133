// AceProxy - AceStream Multiplexing Proxy
// Request Context - cancellation and deadline propagation
//
// Responsibilities:
// - Carry a cancellation flag and optional deadline across blocking calls
// - Derive child contexts that inherit the parent's cancellation
// - Wake blocked waiters promptly through cancel listeners
// - Provide an interruptible sleep for retry backoff

#ifndef ACEPROXY_CORE_CONTEXT_HPP
#define ACEPROXY_CORE_CONTEXT_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include "aceproxy/core/error_codes.hpp"

namespace aceproxy {
namespace core {

/**
 * @brief Cancellation and deadline scope for one unit of work.
 *
 * A Context is "done" once cancel() has been called on it or on any
 * ancestor, or once its deadline has passed. Blocking components register
 * a cancel listener so they can wake their own condition variables; waits
 * with a deadline also bound themselves by deadline().
 *
 * Thread Safety:
 * - All methods are thread-safe
 * - Listeners run on the thread that calls cancel(), outside the context's
 *   state lock. A listener must not remove itself from the same context.
 *
 * Lifetime:
 * - A child must not outlive its parent
 */
class Context {
public:
    using Clock = std::chrono::steady_clock;
    using ListenerId = uint64_t;
    using Listener = std::function<void()>;

    /**
     * @brief Root context with no deadline.
     */
    Context();

    /**
     * @brief Root context that expires at the given deadline.
     */
    explicit Context(Clock::time_point deadline);

    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
    Context(Context&&) = delete;
    Context& operator=(Context&&) = delete;

    /**
     * @brief Derive a child that is cancelled with its parent.
     */
    static std::unique_ptr<Context> withCancel(Context& parent);

    /**
     * @brief Derive a child that also expires after the given timeout.
     *
     * The child deadline is the earlier of the parent's deadline and
     * now + timeout.
     */
    static std::unique_ptr<Context> withTimeout(Context& parent, Clock::duration timeout);

    /**
     * @brief Cancel this context and every child. Idempotent.
     */
    void cancel();

    /**
     * @brief True once cancelled or past the deadline.
     */
    bool isDone() const;

    /**
     * @brief True only if cancel() was called (not deadline expiry).
     */
    bool isCancelled() const;

    /**
     * @brief Reason the context is done.
     *
     * Cancelled for explicit cancellation, Timeout for deadline expiry,
     * Success when the context is still live.
     */
    Error err() const;

    std::optional<Clock::time_point> deadline() const;

    /**
     * @brief Sleep for the given duration unless the context finishes first.
     *
     * @return true if the full duration elapsed, false if interrupted
     */
    bool sleepFor(Clock::duration duration);

    /**
     * @brief Register a callback invoked once on cancellation.
     *
     * If the context is already cancelled the listener runs immediately on
     * the calling thread and 0 is returned.
     */
    ListenerId addCancelListener(Listener listener);

    /**
     * @brief Remove a listener. Blocks while listeners are being dispatched.
     */
    void removeCancelListener(ListenerId id);

private:
    Context(Context* parent, std::optional<Clock::time_point> deadline);

    bool deadlinePassed() const;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
    std::optional<Clock::time_point> deadline_;
    std::map<ListenerId, Listener> listeners_;
    ListenerId nextListenerId_ = 1;

    // Serializes listener dispatch against removal so a listener never runs
    // after its owner returned from removeCancelListener.
    std::mutex dispatchMutex_;

    Context* parent_ = nullptr;
    ListenerId parentListenerId_ = 0;
};

/**
 * @brief Scoped cancel listener registration.
 */
class CancelListenerGuard {
public:
    CancelListenerGuard(Context& ctx, Context::Listener listener)
        : ctx_(ctx), id_(ctx.addCancelListener(std::move(listener))) {}

    ~CancelListenerGuard() {
        if (id_ != 0) {
            ctx_.removeCancelListener(id_);
        }
    }

    CancelListenerGuard(const CancelListenerGuard&) = delete;
    CancelListenerGuard& operator=(const CancelListenerGuard&) = delete;

private:
    Context& ctx_;
    Context::ListenerId id_;
};

} // namespace core
} // namespace aceproxy

#endif // ACEPROXY_CORE_CONTEXT_HPP
