// AceProxy - AceStream Multiplexing Proxy
// Router - Method and path dispatch with {param} segments

#ifndef ACEPROXY_API_ROUTER_HPP
#define ACEPROXY_API_ROUTER_HPP

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "aceproxy/api/http_types.hpp"
#include "aceproxy/core/context.hpp"

namespace aceproxy {
namespace api {

/**
 * @brief Request handler.
 *
 * Domain failures are answered through the writer. The returned error, if
 * any, is the transport failure that prevented the response from being
 * delivered.
 */
using Handler = std::function<core::Result<void, core::Error>(
    core::Context&, const HttpRequest&, IResponseWriter&)>;

/**
 * @brief Routes requests by method and path pattern.
 *
 * Patterns are split on '/'. A segment written as {name} matches any
 * non-empty segment and binds it, URL-decoded, into pathParams. Routes are
 * tried in registration order. A path that matches only under another
 * method answers 405 with an Allow header; anything else answers 404.
 *
 * Routes must be registered before the server starts dispatching.
 */
class Router {
public:
    void addRoute(const std::string& method, const std::string& pattern, Handler handler);

    void get(const std::string& pattern, Handler handler) { addRoute("GET", pattern, std::move(handler)); }
    void post(const std::string& pattern, Handler handler) { addRoute("POST", pattern, std::move(handler)); }

    /**
     * @brief Dispatch @p request, binding its pathParams.
     */
    core::Result<void, core::Error> dispatch(
        core::Context& ctx,
        HttpRequest& request,
        IResponseWriter& writer
    ) const;

    size_t routeCount() const { return routes_.size(); }

private:
    struct Route {
        std::string method;
        std::string pattern;
        std::vector<std::string> segments;
        Handler handler;
    };

    static std::vector<std::string> splitPath(const std::string& path);
    static bool match(
        const Route& route,
        const std::vector<std::string>& segments,
        std::map<std::string, std::string>& params
    );

    std::vector<Route> routes_;
};

} // namespace api
} // namespace aceproxy

#endif // ACEPROXY_API_ROUTER_HPP
