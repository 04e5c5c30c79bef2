#include <urival/uri/matchers.h>
#include <urival/core/config.h>

#include <cstddef>
#include <string_view>

namespace urival::uri {

namespace {

// ---------------------------------------------------------------------------
// Character classes (RFC 3986 section 2)
// ---------------------------------------------------------------------------

bool is_ascii_alpha(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_ascii_hex(char c) {
    return is_ascii_digit(c) || (c >= 'A' && c <= 'F') || (c >= 'a' && c <= 'f');
}

bool is_unreserved(char c) {
    return is_ascii_alpha(c) || is_ascii_digit(c) ||
           c == '-' || c == '.' || c == '_' || c == '~';
}

bool is_sub_delim(char c) {
    switch (c) {
        case '!': case '$': case '&': case '\'': case '(': case ')':
        case '*': case '+': case ',': case ';': case '=':
            return true;
        default:
            return false;
    }
}

bool is_pchar(char c) {
    return is_unreserved(c) || is_sub_delim(c) || c == ':' || c == '@';
}

bool is_scheme_char(char c) {
    return is_ascii_alpha(c) || is_ascii_digit(c) || c == '+' || c == '-' || c == '.';
}

bool is_userinfo_char(char c) {
    return is_unreserved(c) || is_sub_delim(c) || c == ':';
}

bool is_reg_name_char(char c) {
    return is_unreserved(c) || is_sub_delim(c);
}

bool is_query_char(char c) {
    return is_pchar(c) || c == '/' || c == '?';
}

// Walks `input` accepting characters for which `allowed` holds and
// complete pct-encoded triplets. A '%' not followed by two hex digits
// rejects the whole string.
template <typename Pred>
bool consists_of(std::string_view input, Pred allowed) {
    for (size_t i = 0; i < input.size(); ++i) {
        const char c = input[i];
        if (c == '%') {
            if (i + 2 >= input.size() ||
                !is_ascii_hex(input[i + 1]) || !is_ascii_hex(input[i + 2])) {
                return false;
            }
            i += 2;
        } else if (!allowed(c)) {
            return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// Host forms
// ---------------------------------------------------------------------------

bool looks_like_ipv4(std::string_view input) {
    size_t octets = 0;
    size_t i = 0;
    while (true) {
        const size_t start = i;
        while (i < input.size() && is_ascii_digit(input[i])) {
            ++i;
        }
        const size_t digits = i - start;
        if (digits == 0 || digits > 3) {
            return false;
        }
        ++octets;
        if (i == input.size()) {
            break;
        }
        if (input[i] != '.' || octets == core::config::kIpv4OctetCount) {
            return false;
        }
        ++i;
    }
    return octets == core::config::kIpv4OctetCount;
}

// h16 pieces separated by ':', at most one "::", optionally ending in an
// embedded dotted-quad that counts as two pieces.
bool is_ipv6_address(std::string_view input) {
    if (input.empty()) {
        return false;
    }

    size_t pieces = 0;
    bool compressed = false;
    size_t i = 0;

    if (input.starts_with("::")) {
        compressed = true;
        i = 2;
    } else if (input[0] == ':') {
        return false;
    }

    while (i < input.size()) {
        std::string_view rest = input.substr(i);
        if (rest.find(':') == std::string_view::npos &&
            rest.find('.') != std::string_view::npos) {
            if (!looks_like_ipv4(rest) || !valid_ipv4_host_address(rest)) {
                return false;
            }
            pieces += 2;
            break;
        }

        const size_t start = i;
        while (i < input.size() && i - start < 4 && is_ascii_hex(input[i])) {
            ++i;
        }
        if (i == start) {
            return false;
        }
        if (i < input.size() && is_ascii_hex(input[i])) {
            // h16 is at most four hex digits
            return false;
        }
        ++pieces;

        if (i == input.size()) {
            break;
        }
        if (input[i] != ':') {
            return false;
        }
        ++i;
        if (i < input.size() && input[i] == ':') {
            if (compressed) {
                return false;
            }
            compressed = true;
            ++i;
        } else if (i == input.size()) {
            return false;
        }
    }

    if (compressed) {
        return pieces < core::config::kMaxIpv6Pieces;
    }
    return pieces == core::config::kMaxIpv6Pieces;
}

// IPv6addrz from RFC 6874 ("%25" zone) plus the bare '%' form of RFC 4007
bool is_ipv6_address_with_zone(std::string_view input) {
    const size_t percent = input.find('%');
    if (percent == std::string_view::npos) {
        return is_ipv6_address(input);
    }

    std::string_view zone = input.substr(percent + 1);
    // "%25" always introduces the zone, so "%25" alone leaves it empty
    if (zone.starts_with("25")) {
        zone.remove_prefix(2);
    }
    if (zone.empty() || !consists_of(zone, is_unreserved)) {
        return false;
    }
    return is_ipv6_address(input.substr(0, percent));
}

// IPvFuture = "v" 1*HEXDIG "." 1*( unreserved / sub-delims / ":" )
bool is_ipv_future(std::string_view input) {
    if (input.size() < 4 || (input[0] != 'v' && input[0] != 'V')) {
        return false;
    }
    size_t i = 1;
    while (i < input.size() && is_ascii_hex(input[i])) {
        ++i;
    }
    if (i == 1 || i >= input.size() || input[i] != '.') {
        return false;
    }
    ++i;
    if (i == input.size()) {
        return false;
    }
    for (; i < input.size(); ++i) {
        if (!is_userinfo_char(input[i])) {
            return false;
        }
    }
    return true;
}

bool is_ip_literal(std::string_view input) {
    if (input.size() < 2 || input.front() != '[' || input.back() != ']') {
        return false;
    }
    std::string_view inner = input.substr(1, input.size() - 2);
    return is_ipv6_address_with_zone(inner) || is_ipv_future(inner);
}

// ---------------------------------------------------------------------------
// Productions
// ---------------------------------------------------------------------------

bool match_scheme(std::string_view input) {
    if (input.empty() || !is_ascii_alpha(input[0])) {
        return false;
    }
    for (char c : input.substr(1)) {
        if (!is_scheme_char(c)) {
            return false;
        }
    }
    return true;
}

bool match_userinfo(std::string_view input) {
    return !input.empty() && consists_of(input, is_userinfo_char);
}

bool match_host(std::string_view input) {
    if (!input.empty() && input.front() == '[') {
        return is_ip_literal(input);
    }
    // IPv4address is a subset of reg-name at the character level
    return consists_of(input, is_reg_name_char);
}

bool match_port(std::string_view input) {
    if (input.size() > core::config::kMaxPortDigits) {
        return false;
    }
    for (char c : input) {
        if (!is_ascii_digit(c)) {
            return false;
        }
    }
    return true;
}

bool match_subauthority(std::string_view input) {
    const size_t at = input.find('@');
    if (at != std::string_view::npos) {
        if (!match_userinfo(input.substr(0, at))) {
            return false;
        }
        input.remove_prefix(at + 1);
    }

    std::string_view host;
    std::string_view rest;
    if (!input.empty() && input.front() == '[') {
        const size_t close = input.find(']');
        if (close == std::string_view::npos) {
            return false;
        }
        host = input.substr(0, close + 1);
        rest = input.substr(close + 1);
    } else {
        const size_t colon = input.find(':');
        host = input.substr(0, colon);
        if (colon != std::string_view::npos) {
            rest = input.substr(colon);
        }
    }

    if (!match_host(host)) {
        return false;
    }
    if (rest.empty()) {
        return true;
    }
    return rest.front() == ':' && match_port(rest.substr(1));
}

bool match_path(std::string_view input) {
    return consists_of(input, [](char c) { return is_pchar(c) || c == '/'; });
}

bool match_query(std::string_view input) {
    return consists_of(input, is_query_char);
}

constexpr Matcher kScheme{"scheme", match_scheme};
constexpr Matcher kSubauthority{"subauthority", match_subauthority};
constexpr Matcher kUserinfo{"userinfo", match_userinfo};
constexpr Matcher kHost{"host", match_host};
constexpr Matcher kPort{"port", match_port};
constexpr Matcher kPath{"path", match_path};
constexpr Matcher kQuery{"query", match_query};
constexpr Matcher kFragment{"fragment", match_query};
constexpr Matcher kIpv4{"ipv4", looks_like_ipv4};

} // namespace

const Matcher& scheme_matcher() { return kScheme; }
const Matcher& subauthority_matcher() { return kSubauthority; }
const Matcher& userinfo_matcher() { return kUserinfo; }
const Matcher& host_matcher() { return kHost; }
const Matcher& port_matcher() { return kPort; }
const Matcher& path_matcher() { return kPath; }
const Matcher& query_matcher() { return kQuery; }
const Matcher& fragment_matcher() { return kFragment; }
const Matcher& ipv4_matcher() { return kIpv4; }

bool valid_ipv4_host_address(std::string_view host) {
    size_t parts = 0;
    size_t start = 0;
    while (true) {
        const size_t dot = host.find('.', start);
        std::string_view part = host.substr(start, dot == std::string_view::npos
                                                       ? std::string_view::npos
                                                       : dot - start);
        if (part.empty()) {
            return false;
        }
        unsigned value = 0;
        for (char c : part) {
            if (!is_ascii_digit(c)) {
                return false;
            }
            value = value * 10 + static_cast<unsigned>(c - '0');
            if (value > core::config::kMaxIpv4Octet) {
                return false;
            }
        }
        ++parts;
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    return parts == core::config::kIpv4OctetCount;
}

} // namespace urival::uri
