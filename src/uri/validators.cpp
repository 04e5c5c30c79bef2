#include <urival/uri/validators.h>
#include <urival/uri/normalizers.h>

namespace urival::uri {

namespace {

bool passes_ipv4_recheck(std::string_view host) {
    return !ipv4_matcher().matches(host) || valid_ipv4_host_address(host);
}

} // namespace

bool is_valid(std::optional<std::string_view> value, const Matcher& matcher, bool require) {
    if (!value) {
        return !require;
    }
    return matcher.matches(*value);
}

bool authority_is_valid(std::optional<std::string_view> authority,
                        std::optional<std::string_view> host, bool require) {
    const bool validated = is_valid(authority, subauthority_matcher(), require);
    if (validated && host) {
        return passes_ipv4_recheck(*host);
    }
    return validated;
}

bool scheme_is_valid(std::optional<std::string_view> scheme, bool require) {
    return is_valid(scheme, scheme_matcher(), require);
}

bool userinfo_is_valid(std::optional<std::string_view> userinfo, bool require) {
    return is_valid(userinfo, userinfo_matcher(), require);
}

bool host_is_valid(std::optional<std::string_view> host, bool require) {
    return is_valid(host, host_matcher(), require) && (!host || passes_ipv4_recheck(*host));
}

bool port_is_valid(std::optional<std::string_view> port, bool require) {
    if (!is_valid(port, port_matcher(), require)) {
        return false;
    }
    // "" is a syntactically valid (empty) port
    return !port || port->empty() || normalize_port(*port).has_value();
}

bool path_is_valid(std::optional<std::string_view> path, bool require) {
    return is_valid(path, path_matcher(), require);
}

bool query_is_valid(std::optional<std::string_view> query, bool require) {
    return is_valid(query, query_matcher(), require);
}

bool fragment_is_valid(std::optional<std::string_view> fragment, bool require) {
    return is_valid(fragment, fragment_matcher(), require);
}

} // namespace urival::uri
