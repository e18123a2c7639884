#include "url.hpp"

#include <stdexcept>

namespace pqoidc {

namespace {

bool is_unreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '~';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string url_encode(const std::string &value) {
    static const char digits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (is_unreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(digits[c >> 4]);
            out.push_back(digits[c & 0x0F]);
        }
    }
    return out;
}

std::string url_decode(const std::string &value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%') {
            if (i + 2 >= value.size()) {
                throw std::invalid_argument("truncated percent escape");
            }
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi < 0 || lo < 0) {
                throw std::invalid_argument("invalid percent escape");
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string append_query(const std::string &base, const QueryParams &params) {
    std::string out = base;
    char sep = base.find('?') == std::string::npos ? '?' : '&';
    for (const auto &kv : params) {
        out.push_back(sep);
        out += url_encode(kv.first);
        out.push_back('=');
        out += url_encode(kv.second);
        sep = '&';
    }
    return out;
}

std::map<std::string, std::string> parse_query(const std::string &url) {
    std::map<std::string, std::string> params;

    auto start = url.find('?');
    if (start == std::string::npos) {
        return params;
    }
    ++start;
    auto end = url.find('#', start);
    if (end == std::string::npos) {
        end = url.size();
    }

    while (start < end) {
        auto amp = url.find('&', start);
        if (amp == std::string::npos || amp > end) {
            amp = end;
        }
        const std::string pair = url.substr(start, amp - start);
        if (!pair.empty()) {
            const auto eq = pair.find('=');
            std::string key = url_decode(pair.substr(0, eq));
            std::string val = eq == std::string::npos ? std::string() : url_decode(pair.substr(eq + 1));
            params.emplace(std::move(key), std::move(val));
        }
        start = amp + 1;
    }
    return params;
}

} // namespace pqoidc
