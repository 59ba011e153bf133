// AceProxy - AceStream Multiplexing Proxy
// Beast Response Writer - HTTP/1.x responses serialized by Boost.Beast
//
// Responsibilities:
// - Serialize the status line and headers once
// - Frame bodies without Content-Length as Beast chunks for HTTP/1.1
// - Bound every socket write by the armed deadline

#ifndef ACEPROXY_API_BEAST_RESPONSE_WRITER_HPP
#define ACEPROXY_API_BEAST_RESPONSE_WRITER_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/message.hpp>

#include "aceproxy/api/connection_io.hpp"
#include "aceproxy/api/http_types.hpp"

namespace aceproxy {
namespace api {

/**
 * @brief IResponseWriter over a ConnectionIo.
 *
 * Every response carries "Connection: close". A body without an explicit
 * Content-Length is sent chunked to HTTP/1.1 clients and delimited by
 * connection close for HTTP/1.0 clients. Not thread-safe; owned by the
 * connection thread.
 */
class BeastResponseWriter : public IResponseWriter {
public:
    /**
     * @param version HTTP version of the request, 10 or 11
     */
    BeastResponseWriter(ConnectionIo& io, unsigned version, std::chrono::milliseconds defaultWriteTimeout);

    void setHeader(const std::string& name, const std::string& value) override;
    core::Result<void, core::Error> writeHeader(int status) override;
    bool headersSent() const override { return headersSent_; }
    int status() const override { return status_; }

    core::Result<size_t, core::Error> write(const uint8_t* data, size_t size) override;
    bool supportsDeadline() const override { return true; }
    void setWriteDeadline(std::chrono::steady_clock::time_point deadline) override;

    /**
     * @brief Complete the response: sends headers if none were sent and the
     *        last chunk of a chunked body.
     */
    core::Result<void, core::Error> finish();

    bool isChunked() const { return chunked_; }
    uint64_t bodyBytesSent() const { return bodyBytesSent_; }

private:
    ConnectionIo::Deadline currentDeadline() const;
    core::Error writeError(const boost::beast::error_code& ec) const;

    ConnectionIo& io_;
    std::chrono::milliseconds defaultWriteTimeout_;
    std::optional<ConnectionIo::Deadline> deadline_;

    boost::beast::http::response<boost::beast::http::empty_body> header_;
    bool headersSent_ = false;
    bool chunked_ = false;
    bool finished_ = false;
    int status_ = 0;
    uint64_t bodyBytesSent_ = 0;
};

} // namespace api
} // namespace aceproxy

#endif // ACEPROXY_API_BEAST_RESPONSE_WRITER_HPP
