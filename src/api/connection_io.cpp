// AceProxy - AceStream Multiplexing Proxy
// Connection IO Implementation

#include "aceproxy/api/connection_io.hpp"

#include <boost/asio/buffer.hpp>

namespace aceproxy {
namespace api {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

// =============================================================================
// Pending Result
// =============================================================================

void ConnectionIo::PendingResult::complete(beast::error_code result) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        ec = result;
        done = true;
    }
    cv.notify_all();
}

bool ConnectionIo::PendingResult::waitUntil(Deadline deadline) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_until(lock, deadline, [this]() { return done; });
}

void ConnectionIo::PendingResult::wait() {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [this]() { return done; });
}

// =============================================================================
// ConnectionIo
// =============================================================================

ConnectionIo::ConnectionIo()
    : work_(asio::make_work_guard(ioc_))
    , socket_(ioc_)
{
}

ConnectionIo::~ConnectionIo() {
    close();
}

core::ClientInfo ConnectionIo::peer() const {
    core::ClientInfo client;
    beast::error_code ec;
    tcp::endpoint remote = socket_.remote_endpoint(ec);
    if (!ec) {
        client.ip = remote.address().to_string();
        client.port = remote.port();
    }
    return client;
}

void ConnectionIo::start() {
    thread_ = std::thread([this]() { ioc_.run(); });
}

void ConnectionIo::watchForHangup(std::function<void()> onHangup) {
    asio::post(ioc_, [this, onHangup = std::move(onHangup)]() mutable {
        onHangup_ = std::move(onHangup);
        if (aborted_.load()) {
            onHangup_();
            return;
        }
        readUntilHangup();
    });
}

void ConnectionIo::readUntilHangup() {
    socket_.async_read_some(asio::buffer(discard_), [this](beast::error_code ec, size_t) {
        if (ec) {
            if (onHangup_) {
                onHangup_();
            }
            return;
        }
        readUntilHangup();
    });
}

void ConnectionIo::abort() {
    aborted_.store(true);
    cancelPending();
}

void ConnectionIo::cancelPending() {
    asio::post(ioc_, [this]() {
        beast::error_code ignored;
        socket_.cancel(ignored);
    });
}

void ConnectionIo::close() {
    {
        std::lock_guard<std::mutex> lock(closeMutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }

    auto shutdown = [this]() {
        beast::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_send, ignored);
        socket_.close(ignored);
    };

    if (!thread_.joinable()) {
        shutdown();
        return;
    }

    asio::post(ioc_, shutdown);
    work_.reset();
    thread_.join();
}

} // namespace api
} // namespace aceproxy
