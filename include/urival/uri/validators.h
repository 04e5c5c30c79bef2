#pragma once
#include <urival/uri/matchers.h>

#include <optional>
#include <string_view>

namespace urival::uri {

// With `require` set, the value must be present and match. Without it,
// an absent value is valid too. An empty string is present.
bool is_valid(std::optional<std::string_view> value, const Matcher& matcher, bool require);

// Matches `authority` against the subauthority grammar. A `host` shaped
// like a dotted quad is re-checked octet by octet, so "999.1.1.1" fails
// even though the grammar accepts it as a reg-name.
bool authority_is_valid(std::optional<std::string_view> authority,
                        std::optional<std::string_view> host = std::nullopt,
                        bool require = false);

bool scheme_is_valid(std::optional<std::string_view> scheme, bool require = false);
bool userinfo_is_valid(std::optional<std::string_view> userinfo, bool require = false);
bool host_is_valid(std::optional<std::string_view> host, bool require = false);

// Also rejects values above 65535.
bool port_is_valid(std::optional<std::string_view> port, bool require = false);

bool path_is_valid(std::optional<std::string_view> path, bool require = false);
bool query_is_valid(std::optional<std::string_view> query, bool require = false);
bool fragment_is_valid(std::optional<std::string_view> fragment, bool require = false);

} // namespace urival::uri
