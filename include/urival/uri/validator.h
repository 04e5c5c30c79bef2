#pragma once
#include <urival/uri/parsed_uri.h>

#include <array>
#include <cstdint>
#include <initializer_list>
#include <set>
#include <string>
#include <string_view>

namespace urival::core {
class DiagnosticEmitter;
}

namespace urival::uri {

// Accumulates policy for URIs and checks parsed URIs against it.
//
//   Validator validator;
//   validator.require_components({"scheme", "host"})
//            .allow_schemes({"http", "https"})
//            .forbid_use_of_password();
//   validator.validate(split_uri_reference("https://example.com/"));
//
// Every configuration call adds to what earlier calls set up. Once
// configured, validate() may be called concurrently as long as no
// diagnostics emitter is attached.
class Validator {
public:
    Validator& allow_schemes(std::initializer_list<std::string_view> schemes);
    Validator& allow_hosts(std::initializer_list<std::string_view> hosts);

    // Ports outside [0, 65535] are ignored. A string that is not a
    // decimal integer throws ConfigurationError.
    Validator& allow_ports(std::initializer_list<std::string_view> ports);
    Validator& allow_ports(std::initializer_list<int> ports);

    Validator& allow_use_of_password();
    Validator& forbid_use_of_password();

    // Names are case-insensitive. Throws ConfigurationError without
    // changing anything if one of them is not a component name.
    Validator& require_components(std::initializer_list<std::string_view> components);
    Validator& check_validity_of(std::initializer_list<std::string_view> components);

    // Non-owning; pass nullptr to detach.
    Validator& set_diagnostics(core::DiagnosticEmitter* emitter);

    // Throws PasswordForbidden, MissingComponentError,
    // InvalidComponentsError or UnpermittedComponentError, checked in
    // that order.
    void validate(const ParsedUri& uri) const;

    const std::set<std::string>& allowed_schemes() const { return allowed_schemes_; }
    const std::set<std::string>& allowed_hosts() const { return allowed_hosts_; }
    const std::set<std::uint16_t>& allowed_ports() const { return allowed_ports_; }
    bool allow_password() const { return allow_password_; }
    bool requires_presence_of(Component component) const;
    bool validates(Component component) const;

private:
    using ComponentFlags = std::array<bool, kComponentNames.size()>;

    void check_password(const ParsedUri& uri) const;
    void ensure_required_components_exist(const ParsedUri& uri) const;
    void ensure_components_are_valid(const ParsedUri& uri) const;
    void ensure_one_of_allowed(const ParsedUri& uri) const;
    void report(std::string_view stage, const std::string& message) const;

    std::set<std::string> allowed_schemes_;
    std::set<std::string> allowed_hosts_;
    std::set<std::uint16_t> allowed_ports_;
    bool allow_password_ = true;
    ComponentFlags require_presence_of_{};
    ComponentFlags validated_components_{};
    core::DiagnosticEmitter* diagnostics_ = nullptr;
};

} // namespace urival::uri
