// AceProxy - AceStream Multiplexing Proxy
// HTTP Types - Request model and response writer abstraction
//
// Handlers see a fully parsed HttpRequest and write through an
// IResponseWriter. The writer is also an IStreamWriter so stream bytes can
// be relayed straight into a client response.

#ifndef ACEPROXY_API_HTTP_TYPES_HPP
#define ACEPROXY_API_HTTP_TYPES_HPP

#include <map>
#include <string>

#include "aceproxy/core/types.hpp"
#include "aceproxy/streaming/stream_writer.hpp"

namespace aceproxy {
namespace api {

// =============================================================================
// Request
// =============================================================================

/**
 * @brief A parsed HTTP request.
 *
 * Header names are stored lower-cased. Query values and path parameters
 * are URL-decoded.
 */
struct HttpRequest {
    std::string method;
    std::string path;
    std::string rawQuery;
    std::string version = "HTTP/1.1";
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> pathParams;
    std::string body;
    core::ClientInfo client;

    /// Empty when absent.
    std::string queryParam(const std::string& name) const;
    std::string header(const std::string& name) const;
    std::string pathParam(const std::string& name) const;
};

// =============================================================================
// Response
// =============================================================================

/**
 * @brief Response sink handed to request handlers.
 *
 * Headers may be set until writeHeader() is called. write() sends a 200
 * status line first if no status was written yet.
 */
class IResponseWriter : public streaming::IStreamWriter {
public:
    ~IResponseWriter() override = default;

    virtual void setHeader(const std::string& name, const std::string& value) = 0;

    /**
     * @brief Send the status line and headers. Only the first call has effect.
     */
    virtual core::Result<void, core::Error> writeHeader(int status) = 0;

    virtual bool headersSent() const = 0;

    /// Status written, or 0 before writeHeader().
    virtual int status() const = 0;
};

/**
 * @brief Reason phrase for a status code.
 */
const char* statusText(int status);

/**
 * @brief Write a complete JSON response with Content-Length.
 */
core::Result<void, core::Error> sendJson(IResponseWriter& writer, int status, const std::string& body);

/**
 * @brief Write a complete response of any content type with Content-Length.
 */
core::Result<void, core::Error> sendBody(
    IResponseWriter& writer,
    int status,
    const std::string& contentType,
    const std::string& body
);

/**
 * @brief Write {"error": message} with the given status.
 */
core::Result<void, core::Error> sendError(IResponseWriter& writer, int status, const std::string& message);

} // namespace api
} // namespace aceproxy

#endif // ACEPROXY_API_HTTP_TYPES_HPP
