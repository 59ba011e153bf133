// AceProxy - AceStream Multiplexing Proxy
// Connection IO - Asio event loop owning one accepted HTTP connection
//
// Responsibilities:
// - Own the accepted socket and a private io_context run by an IO thread
// - Run socket operations for the blocking connection thread, each
//   bounded by a deadline
// - Report a client hang-up while a handler is producing the response
// - Abort pending operations from any thread

#ifndef ACEPROXY_API_CONNECTION_IO_HPP
#define ACEPROXY_API_CONNECTION_IO_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/error.hpp>

#include "aceproxy/core/types.hpp"

namespace aceproxy {
namespace api {

/**
 * @brief One connection's socket and the event loop that drives it.
 *
 * Socket operations only ever run on the IO thread. The connection thread
 * hands them over through run(), which blocks until the operation
 * completes or its deadline passes. On expiry the operation is cancelled and
 * run() returns beast::error::timeout.
 */
class ConnectionIo {
public:
    using Deadline = std::chrono::steady_clock::time_point;
    using Completion = std::function<void(boost::beast::error_code)>;

    ConnectionIo();
    ~ConnectionIo();

    ConnectionIo(const ConnectionIo&) = delete;
    ConnectionIo& operator=(const ConnectionIo&) = delete;

    /// Socket to accept into. Touch it only before start().
    boost::asio::ip::tcp::socket& socket() { return socket_; }

    /**
     * @brief Peer address of the accepted socket. Call before start().
     */
    core::ClientInfo peer() const;

    /**
     * @brief Start the IO thread.
     */
    void start();

    /**
     * @brief Run an operation on the IO thread and wait for it.
     *
     * @param initiate Called on the IO thread with the socket and a
     *        completion; it must start exactly one asynchronous operation
     *        that eventually invokes the completion.
     */
    template <typename Initiate>
    boost::beast::error_code run(Initiate initiate, Deadline deadline);

    /**
     * @brief Watch the socket for end of stream; @p onHangup runs on the IO
     *        thread once the client closes or the socket fails.
     *
     * Bytes the client sends meanwhile are discarded.
     */
    void watchForHangup(std::function<void()> onHangup);

    /**
     * @brief Cancel every pending operation and fail later ones with
     *        operation_aborted. Safe from any thread.
     */
    void abort();

    /**
     * @brief Shut the socket down, finish outstanding work and join the
     *        IO thread. Idempotent.
     */
    void close();

private:
    struct PendingResult {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        boost::beast::error_code ec;

        void complete(boost::beast::error_code result);
        bool waitUntil(Deadline deadline);
        void wait();
    };

    void readUntilHangup();
    void cancelPending();

    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    boost::asio::ip::tcp::socket socket_;
    std::thread thread_;
    std::mutex closeMutex_;
    bool closed_ = false;
    std::atomic<bool> aborted_{false};

    std::function<void()> onHangup_;
    char discard_[512];
};

template <typename Initiate>
boost::beast::error_code ConnectionIo::run(Initiate initiate, Deadline deadline) {
    {
        std::lock_guard<std::mutex> lock(closeMutex_);
        if (closed_ || aborted_.load()) {
            return boost::asio::error::operation_aborted;
        }
    }
    auto pending = std::make_shared<PendingResult>();

    boost::asio::post(ioc_, [this, initiate, pending]() mutable {
        if (aborted_.load()) {
            pending->complete(boost::asio::error::operation_aborted);
            return;
        }
        initiate(socket_, Completion([pending](boost::beast::error_code ec) {
            pending->complete(ec);
        }));
    });

    if (pending->waitUntil(deadline)) {
        return pending->ec;
    }

    // Deadline passed: cancel and wait for the handler so the caller's
    // buffers are no longer referenced when run() returns.
    cancelPending();
    pending->wait();
    return boost::beast::error::timeout;
}

} // namespace api
} // namespace aceproxy

#endif // ACEPROXY_API_CONNECTION_IO_HPP
