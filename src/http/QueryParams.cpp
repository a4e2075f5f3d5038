#include "http/QueryParams.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace {

int hexValue(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

// application/x-www-form-urlencoded: '+' is a space, malformed escapes pass through untouched.
std::string urlDecode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '+') {
            out += ' ';
            continue;
        }
        if (text[i] == '%' && i + 2 < text.size()) {
            const int high = hexValue(text[i + 1]);
            const int low = hexValue(text[i + 2]);
            if (high >= 0 && low >= 0) {
                out += static_cast<char>(high * 16 + low);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

}  // namespace

namespace mdc::http {

std::optional<std::string> opt_string(const mdc::api::Request& request, const char* key) {
    if (key == nullptr) {
        return std::nullopt;
    }

    std::string_view remaining{request.query};
    while (!remaining.empty()) {
        const auto amp = remaining.find('&');
        const auto pair = remaining.substr(0, amp);
        remaining = amp == std::string_view::npos ? std::string_view{} : remaining.substr(amp + 1);

        const auto eq = pair.find('=');
        const auto name = pair.substr(0, eq);
        if (urlDecode(name) == key) {
            return eq == std::string_view::npos ? std::string{} : urlDecode(pair.substr(eq + 1));
        }
    }
    return std::nullopt;
}

}  // namespace mdc::http
