#pragma once
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace urival::uri {

enum class Component {
    Scheme,
    Userinfo,
    Host,
    Port,
    Path,
    Query,
    Fragment,
};

inline constexpr std::array<std::string_view, 7> kComponentNames = {
    "scheme", "userinfo", "host", "port", "path", "query", "fragment",
};

inline constexpr std::array<Component, 7> kAllComponents = {
    Component::Scheme, Component::Userinfo, Component::Host, Component::Port,
    Component::Path,   Component::Query,    Component::Fragment,
};

std::string_view component_name(Component component);

// Exact, case-sensitive lookup in kComponentNames.
std::optional<Component> component_from_name(std::string_view name);

// A URI reference split into its components. An absent component is
// distinct from an empty one: "http://h?" has an empty query while
// "http://h" has none.
struct ParsedUri {
    std::optional<std::string> scheme;
    std::optional<std::string> userinfo;
    std::optional<std::string> host;
    std::optional<std::string> port;
    std::optional<std::string> path;
    std::optional<std::string> query;
    std::optional<std::string> fragment;

    // [ userinfo "@" ] host [ ":" port ], nullopt when host is absent
    std::optional<std::string> authority() const;

    // Recomposition per RFC 3986 section 5.3
    std::string serialize() const;

    bool operator==(const ParsedUri&) const = default;
};

const std::optional<std::string>& component_value(const ParsedUri& uri, Component component);

// RFC 3986 Appendix B decomposition. Every input splits; checking the
// pieces is left to the validators.
ParsedUri split_uri_reference(std::string_view input);

} // namespace urival::uri
