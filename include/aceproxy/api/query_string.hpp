// AceProxy - AceStream Multiplexing Proxy
// Query String - URL component decoding for request targets

#ifndef ACEPROXY_API_QUERY_STRING_HPP
#define ACEPROXY_API_QUERY_STRING_HPP

#include <map>
#include <string>

namespace aceproxy {
namespace api {

/**
 * @brief Percent-decode a URL component. '+' becomes a space when
 *        @p plusAsSpace is set. Malformed escapes are kept literally.
 */
std::string urlDecode(const std::string& input, bool plusAsSpace = false);

/**
 * @brief Split "a=1&b=2" into decoded pairs. The first occurrence wins.
 */
std::map<std::string, std::string> parseQueryString(const std::string& query);

} // namespace api
} // namespace aceproxy

#endif // ACEPROXY_API_QUERY_STRING_HPP
