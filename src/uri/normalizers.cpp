#include <urival/uri/normalizers.h>
#include <urival/core/config.h>

#include <algorithm>
#include <charconv>
#include <system_error>

namespace urival::uri {

std::string to_lower_ascii(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (char c : input) {
        result += (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }
    return result;
}

std::string normalize_scheme(std::string_view scheme) {
    return to_lower_ascii(scheme);
}

std::string normalize_host(std::string_view host) {
    if (!host.starts_with('[')) {
        return to_lower_ascii(host);
    }

    const size_t percent = host.find('%');
    if (percent == std::string_view::npos) {
        return to_lower_ascii(host);
    }

    std::string_view zone = host.substr(percent + 1);
    if (zone.starts_with("25")) {
        zone.remove_prefix(2);
    }

    std::string result = to_lower_ascii(host.substr(0, percent));
    result += "%25";
    result += zone;
    return result;
}

std::optional<std::uint16_t> normalize_port(std::string_view port) {
    if (port.empty() || port.size() > core::config::kMaxPortDigits ||
        !std::all_of(port.begin(), port.end(),
                     [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    std::uint32_t value = 0;
    const auto [end, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
    if (ec != std::errc{} || end != port.data() + port.size() ||
        value > core::config::kMaxPort) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

} // namespace urival::uri
