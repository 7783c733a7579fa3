#include "http_utils.hpp"
#include <sstream>

namespace energy_rollup {

std::string HttpParameterParser::first_line(const std::string& request) {
    size_t line_end = request.find("\r\n");
    if (line_end == std::string::npos) {
        line_end = request.find('\n');
    }
    return line_end == std::string::npos ? request : request.substr(0, line_end);
}

std::string HttpParameterParser::extract_query_string(const std::string& request) {
    const std::string line = first_line(request);

    size_t query_start = line.find('?');
    if (query_start == std::string::npos) {
        return "";
    }

    size_t query_end = line.find(" HTTP/", query_start);
    if (query_end == std::string::npos) {
        query_end = line.length();
    }

    return line.substr(query_start + 1, query_end - query_start - 1);
}

std::unordered_map<std::string, std::string> HttpParameterParser::parse_query_string(const std::string& query_string) {
    std::unordered_map<std::string, std::string> params;

    std::istringstream stream(query_string);
    std::string pair;

    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) {
            continue;
        }

        size_t equals_pos = pair.find('=');
        if (equals_pos != std::string::npos) {
            params[url_decode(pair.substr(0, equals_pos))] = url_decode(pair.substr(equals_pos + 1));
        } else {
            params[url_decode(pair)] = "";
        }
    }

    return params;
}

std::string HttpParameterParser::url_decode(const std::string& encoded) {
    std::string decoded;
    decoded.reserve(encoded.length());

    for (size_t i = 0; i < encoded.length(); ++i) {
        if (encoded[i] == '%' && i + 2 < encoded.length()) {
            int high = hex_to_int(encoded[i + 1]);
            int low = hex_to_int(encoded[i + 2]);

            if (high >= 0 && low >= 0) {
                decoded += static_cast<char>((high << 4) | low);
                i += 2;
            } else {
                decoded += encoded[i];
            }
        } else if (encoded[i] == '+') {
            decoded += ' ';
        } else {
            decoded += encoded[i];
        }
    }

    return decoded;
}

std::pair<std::string, std::string> HttpParameterParser::extract_method_and_path(const std::string& request) {
    // "METHOD /path?query HTTP/1.1"
    std::istringstream stream(first_line(request));
    std::string method, path, version;

    if (stream >> method >> path >> version) {
        size_t query_pos = path.find('?');
        if (query_pos != std::string::npos) {
            path = path.substr(0, query_pos);
        }
        return {method, path};
    }

    return {"", ""};
}

int HttpParameterParser::hex_to_int(char hex) {
    if (hex >= '0' && hex <= '9') {
        return hex - '0';
    } else if (hex >= 'A' && hex <= 'F') {
        return hex - 'A' + 10;
    } else if (hex >= 'a' && hex <= 'f') {
        return hex - 'a' + 10;
    }
    return -1;
}

} // namespace energy_rollup
