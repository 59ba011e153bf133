// AceProxy - AceStream Multiplexing Proxy
// Router Implementation

#include "aceproxy/api/router.hpp"
#include "aceproxy/api/query_string.hpp"

namespace aceproxy {
namespace api {

void Router::addRoute(const std::string& method, const std::string& pattern, Handler handler) {
    Route route;
    route.method = method;
    route.pattern = pattern;
    route.segments = splitPath(pattern);
    route.handler = std::move(handler);
    routes_.push_back(std::move(route));
}

core::Result<void, core::Error> Router::dispatch(
    core::Context& ctx,
    HttpRequest& request,
    IResponseWriter& writer) const
{
    const std::vector<std::string> segments = splitPath(request.path);
    std::string allowed;

    for (const auto& route : routes_) {
        std::map<std::string, std::string> params;
        if (!match(route, segments, params)) {
            continue;
        }
        if (route.method != request.method) {
            if (allowed.find(route.method) == std::string::npos) {
                allowed += allowed.empty() ? route.method : ", " + route.method;
            }
            continue;
        }

        request.pathParams = std::move(params);
        return route.handler(ctx, request, writer);
    }

    if (!allowed.empty()) {
        writer.setHeader("Allow", allowed);
        return sendError(writer, 405, "method not allowed");
    }
    return sendError(writer, 404, "not found");
}

std::vector<std::string> Router::splitPath(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start < path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        if (end > start) {
            segments.push_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return segments;
}

bool Router::match(
    const Route& route,
    const std::vector<std::string>& segments,
    std::map<std::string, std::string>& params)
{
    if (route.segments.size() != segments.size()) {
        return false;
    }

    for (size_t i = 0; i < segments.size(); ++i) {
        const std::string& expected = route.segments[i];
        if (expected.size() > 2 && expected.front() == '{' && expected.back() == '}') {
            params[expected.substr(1, expected.size() - 2)] = urlDecode(segments[i]);
        } else if (expected != segments[i]) {
            return false;
        }
    }
    return true;
}

} // namespace api
} // namespace aceproxy
