#include <urival/uri/parsed_uri.h>

#include <cstddef>

namespace urival::uri {

namespace {

using Field = std::optional<std::string> ParsedUri::*;

// Indexed by Component
constexpr std::array<Field, 7> kFields = {
    &ParsedUri::scheme, &ParsedUri::userinfo, &ParsedUri::host, &ParsedUri::port,
    &ParsedUri::path,   &ParsedUri::query,    &ParsedUri::fragment,
};

std::optional<std::string> non_empty(std::string_view value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return std::string(value);
}

void split_authority(std::string_view authority, ParsedUri& out) {
    const size_t at = authority.rfind('@');
    if (at != std::string_view::npos) {
        out.userinfo = std::string(authority.substr(0, at));
        authority.remove_prefix(at + 1);
    }

    size_t search_from = 0;
    if (authority.starts_with('[')) {
        const size_t close = authority.find(']');
        if (close != std::string_view::npos) {
            search_from = close + 1;
        }
    }

    std::string_view host = authority;
    const size_t colon = authority.find(':', search_from);
    if (colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        out.port = non_empty(authority.substr(colon + 1));
    }
    out.host = std::string(host);
}

} // namespace

std::string_view component_name(Component component) {
    return kComponentNames[static_cast<size_t>(component)];
}

std::optional<Component> component_from_name(std::string_view name) {
    for (size_t i = 0; i < kComponentNames.size(); ++i) {
        if (kComponentNames[i] == name) {
            return kAllComponents[i];
        }
    }
    return std::nullopt;
}

const std::optional<std::string>& component_value(const ParsedUri& uri, Component component) {
    return uri.*kFields[static_cast<size_t>(component)];
}

std::optional<std::string> ParsedUri::authority() const {
    // Without a host there is no "//" authority to attach userinfo or
    // port to.
    if (!host) {
        return std::nullopt;
    }
    std::string result;
    if (userinfo) {
        result += *userinfo;
        result += '@';
    }
    result += *host;
    if (port) {
        result += ':';
        result += *port;
    }
    return result;
}

std::string ParsedUri::serialize() const {
    std::string result;
    if (scheme) {
        result += *scheme;
        result += ':';
    }
    if (auto auth = authority()) {
        result += "//";
        result += *auth;
    }
    if (path) {
        result += *path;
    }
    if (query) {
        result += '?';
        result += *query;
    }
    if (fragment) {
        result += '#';
        result += *fragment;
    }
    return result;
}

ParsedUri split_uri_reference(std::string_view input) {
    ParsedUri result;

    // ^(([^:/?#]+):)?
    const size_t delim = input.find_first_of(":/?#");
    if (delim != std::string_view::npos && delim > 0 && input[delim] == ':') {
        result.scheme = std::string(input.substr(0, delim));
        input.remove_prefix(delim + 1);
    }

    // (//([^/?#]*))?
    if (input.starts_with("//")) {
        input.remove_prefix(2);
        const size_t end = input.find_first_of("/?#");
        split_authority(input.substr(0, end), result);
        input.remove_prefix(end == std::string_view::npos ? input.size() : end);
    }

    // ([^?#]*)
    const size_t path_end = input.find_first_of("?#");
    result.path = non_empty(input.substr(0, path_end));
    input.remove_prefix(path_end == std::string_view::npos ? input.size() : path_end);

    // (\?([^#]*))?
    if (input.starts_with('?')) {
        const size_t hash = input.find('#');
        result.query = std::string(input.substr(1, hash == std::string_view::npos
                                                       ? std::string_view::npos
                                                       : hash - 1));
        input.remove_prefix(hash == std::string_view::npos ? input.size() : hash);
    }

    // (#(.*))?
    if (input.starts_with('#')) {
        result.fragment = std::string(input.substr(1));
    }

    return result;
}

} // namespace urival::uri
