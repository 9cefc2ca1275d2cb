#include "text_util.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace chatgate {

std::string truncate(const std::string& text, size_t max_len) {
    if (max_len <= 3 || text.size() <= max_len) return text;
    return text.substr(0, max_len - 3) + "...";
}

std::string sanitize_field(const std::string& input, size_t max_length) {
    if (input.empty()) return input;

    std::string result;
    result.reserve(std::min(input.size(), max_length));

    for (size_t i = 0; i < input.size() && result.size() < max_length; ++i) {
        char c = input[i];

        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == ':' || c == '.') {
            result += c;
        } else {
            result += ' ';
        }
    }

    return result;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

namespace {

std::string format_with(std::chrono::system_clock::time_point tp, const char* pattern) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    struct tm gmt;
    gmtime_r(&time_t, &gmt);

    std::stringstream ss;
    ss << std::put_time(&gmt, pattern);
    return ss.str();
}

}

std::string format_utc(std::chrono::system_clock::time_point tp) {
    return format_with(tp, "%Y-%m-%dT%H:%M:%SZ");
}

std::string format_clock(std::chrono::system_clock::time_point tp) {
    return format_with(tp, "%H:%M:%S");
}

}
