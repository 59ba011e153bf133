// AceProxy - AceStream Multiplexing Proxy
// HTTP Types Implementation

#include "aceproxy/api/http_types.hpp"
#include "aceproxy/core/json.hpp"

#include <algorithm>
#include <cctype>

namespace aceproxy {
namespace api {

namespace {

std::string lookup(const std::map<std::string, std::string>& values, const std::string& name) {
    auto it = values.find(name);
    return it != values.end() ? it->second : std::string();
}

} // namespace

std::string HttpRequest::queryParam(const std::string& name) const {
    return lookup(query, name);
}

std::string HttpRequest::header(const std::string& name) const {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lookup(headers, lower);
}

std::string HttpRequest::pathParam(const std::string& name) const {
    return lookup(pathParams, name);
}

const char* statusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 302: return "Found";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "Unknown";
    }
}

core::Result<void, core::Error> sendJson(IResponseWriter& writer, int status, const std::string& body) {
    return sendBody(writer, status, "application/json", body);
}

core::Result<void, core::Error> sendBody(
    IResponseWriter& writer,
    int status,
    const std::string& contentType,
    const std::string& body)
{
    writer.setHeader("Content-Type", contentType);
    writer.setHeader("Content-Length", std::to_string(body.size()));

    auto header = writer.writeHeader(status);
    if (header.isError()) {
        return header;
    }

    size_t offset = 0;
    while (offset < body.size()) {
        auto written = writer.write(reinterpret_cast<const uint8_t*>(body.data()) + offset,
                                    body.size() - offset);
        if (written.isError()) {
            return core::Result<void, core::Error>::error(written.error());
        }
        if (written.value() == 0) {
            return core::Result<void, core::Error>::error(
                core::Error(core::ErrorCode::ShortWrite, "response writer accepted no bytes"));
        }
        offset += written.value();
    }
    return writer.flush();
}

core::Result<void, core::Error> sendError(IResponseWriter& writer, int status, const std::string& message) {
    core::JsonWriter json;
    json.beginObject().key("error").value(message).endObject();
    return sendJson(writer, status, json.str());
}

} // namespace api
} // namespace aceproxy
