// AceProxy - AceStream Multiplexing Proxy
// Query String Implementation

#include "aceproxy/api/query_string.hpp"

namespace aceproxy {
namespace api {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string urlDecode(const std::string& input, bool plusAsSpace) {
    std::string out;
    out.reserve(input.size());

    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c == '%' && i + 2 < input.size()) {
            int hi = hexValue(input[i + 1]);
            int lo = hexValue(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        if (c == '+' && plusAsSpace) {
            out.push_back(' ');
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::map<std::string, std::string> parseQueryString(const std::string& query) {
    std::map<std::string, std::string> params;

    size_t start = 0;
    while (start <= query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string::npos) {
            end = query.size();
        }

        std::string pair = query.substr(start, end - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = urlDecode(pair.substr(0, eq), true);
            std::string value = eq == std::string::npos ? std::string() : urlDecode(pair.substr(eq + 1), true);
            params.emplace(std::move(key), std::move(value));
        }
        start = end + 1;
    }
    return params;
}

} // namespace api
} // namespace aceproxy
