// AceProxy - AceStream Multiplexing Proxy
// Beast Response Writer Implementation

#include "aceproxy/api/beast_response_writer.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/http/chunk_encode.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/write.hpp>

namespace aceproxy {
namespace api {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

BeastResponseWriter::BeastResponseWriter(
    ConnectionIo& io,
    unsigned version,
    std::chrono::milliseconds defaultWriteTimeout)
    : io_(io)
    , defaultWriteTimeout_(defaultWriteTimeout)
{
    header_.version(version);
}

void BeastResponseWriter::setHeader(const std::string& name, const std::string& value) {
    if (headersSent_) {
        return;
    }
    header_.set(name, value);
}

void BeastResponseWriter::setWriteDeadline(std::chrono::steady_clock::time_point deadline) {
    deadline_ = deadline;
}

ConnectionIo::Deadline BeastResponseWriter::currentDeadline() const {
    return deadline_ ? *deadline_ : std::chrono::steady_clock::now() + defaultWriteTimeout_;
}

core::Error BeastResponseWriter::writeError(const beast::error_code& ec) const {
    if (ec == beast::error::timeout) {
        return core::Error(core::ErrorCode::Timeout, "write deadline exceeded");
    }
    return core::Error(core::ErrorCode::ConnectionClosed, "failed to write response: " + ec.message());
}

// =============================================================================
// Header
// =============================================================================

core::Result<void, core::Error> BeastResponseWriter::writeHeader(int status) {
    if (headersSent_) {
        return core::Result<void, core::Error>::success();
    }

    header_.result(static_cast<unsigned>(status));
    header_.reason(statusText(status));
    header_.set(http::field::connection, "close");

    const bool hasLength = header_.find(http::field::content_length) != header_.end();
    chunked_ = !hasLength && header_.version() == 11 && status != 204 && status != 304;
    if (chunked_) {
        header_.chunked(true);
    }

    headersSent_ = true;
    status_ = status;

    http::response_serializer<http::empty_body> serializer{header_};
    auto ec = io_.run([&serializer](tcp::socket& socket, ConnectionIo::Completion done) {
        http::async_write_header(socket, serializer, [done](beast::error_code result, size_t) {
            done(result);
        });
    }, currentDeadline());

    if (ec) {
        return core::Result<void, core::Error>::error(writeError(ec));
    }
    return core::Result<void, core::Error>::success();
}

// =============================================================================
// Body
// =============================================================================

core::Result<size_t, core::Error> BeastResponseWriter::write(const uint8_t* data, size_t size) {
    if (!headersSent_) {
        auto header = writeHeader(200);
        if (header.isError()) {
            return core::Result<size_t, core::Error>::error(header.error());
        }
    }
    if (finished_) {
        return core::Result<size_t, core::Error>::error(
            core::Error(core::ErrorCode::InvalidState, "response already finished"));
    }
    if (size == 0) {
        return core::Result<size_t, core::Error>::success(0);
    }

    const bool chunked = chunked_;
    auto ec = io_.run([data, size, chunked](tcp::socket& socket, ConnectionIo::Completion done) {
        auto handler = [done](beast::error_code result, size_t) { done(result); };
        if (chunked) {
            asio::async_write(socket, http::make_chunk(asio::buffer(data, size)), handler);
        } else {
            asio::async_write(socket, asio::buffer(data, size), handler);
        }
    }, currentDeadline());

    if (ec) {
        return core::Result<size_t, core::Error>::error(writeError(ec));
    }
    bodyBytesSent_ += size;
    return core::Result<size_t, core::Error>::success(size);
}

core::Result<void, core::Error> BeastResponseWriter::finish() {
    if (finished_) {
        return core::Result<void, core::Error>::success();
    }
    if (!headersSent_) {
        setHeader("Content-Length", "0");
        auto header = writeHeader(200);
        if (header.isError()) {
            return header;
        }
    }
    finished_ = true;
    if (!chunked_) {
        return core::Result<void, core::Error>::success();
    }

    auto ec = io_.run([](tcp::socket& socket, ConnectionIo::Completion done) {
        asio::async_write(socket, http::make_chunk_last(), [done](beast::error_code result, size_t) {
            done(result);
        });
    }, currentDeadline());

    if (ec) {
        return core::Result<void, core::Error>::error(writeError(ec));
    }
    return core::Result<void, core::Error>::success();
}

} // namespace api
} // namespace aceproxy
