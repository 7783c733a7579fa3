#pragma once

#include <string>
#include <unordered_map>
#include <utility>

namespace energy_rollup {

/**
 * HTTP request line and query string parsing
 */
class HttpParameterParser {
public:
    /**
     * Extract query string from HTTP request
     * @param request Full HTTP request string
     * @return Query string portion, or empty string if not found
     */
    static std::string extract_query_string(const std::string& request);

    /**
     * Parse query string into key-value pairs. Values are URL decoded,
     * a key without '=' maps to an empty value.
     * @param query_string URL query string (without '?')
     */
    static std::unordered_map<std::string, std::string> parse_query_string(const std::string& query_string);

    static std::string url_decode(const std::string& encoded);

    /**
     * Extract HTTP method and path from request
     * @param request Full HTTP request string
     * @return Pair of (method, path without query), or empty strings if parsing fails
     */
    static std::pair<std::string, std::string> extract_method_and_path(const std::string& request);

private:
    /**
     * @return Value of a hex digit, or -1 if invalid
     */
    static int hex_to_int(char hex);

    static std::string first_line(const std::string& request);
};

} // namespace energy_rollup
