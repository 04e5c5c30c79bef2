#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace urival::uri {

// ASCII-only; bytes outside A-Z pass through unchanged.
std::string to_lower_ascii(std::string_view input);

// Schemes are case-insensitive (RFC 3986 section 3.1).
std::string normalize_scheme(std::string_view scheme);

// Lowercases the host. The zone ID of an IPv6 literal keeps its case and
// a bare '%' zone delimiter is rewritten as "%25".
std::string normalize_host(std::string_view host);

// Decimal port in [0, 65535], or nullopt for anything else.
std::optional<std::uint16_t> normalize_port(std::string_view port);

} // namespace urival::uri
