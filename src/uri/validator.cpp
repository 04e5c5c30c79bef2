#include <urival/uri/validator.h>
#include <urival/uri/errors.h>
#include <urival/uri/normalizers.h>
#include <urival/uri/validators.h>
#include <urival/core/config.h>
#include <urival/core/diagnostics.h>

#include <algorithm>
#include <charconv>
#include <string>
#include <system_error>
#include <type_traits>
#include <vector>

namespace urival::uri {

namespace {

constexpr const char* kModule = "validator";

// Resolves every name before anything is flagged, so a bad name leaves
// the flags untouched.
template <size_t N>
void set_component_flags(std::array<bool, N>& flags,
                         std::initializer_list<std::string_view> names) {
    std::vector<Component> resolved;
    resolved.reserve(names.size());
    for (std::string_view name : names) {
        const std::string lowered = to_lower_ascii(name);
        auto component = component_from_name(lowered);
        if (!component) {
            throw ConfigurationError("\"" + lowered + "\" is not a valid component");
        }
        resolved.push_back(*component);
    }
    for (Component component : resolved) {
        flags[static_cast<size_t>(component)] = true;
    }
}

bool component_is_valid(Component component, const std::optional<std::string>& value) {
    switch (component) {
        case Component::Scheme:   return scheme_is_valid(value);
        case Component::Userinfo: return userinfo_is_valid(value);
        case Component::Host:     return host_is_valid(value);
        case Component::Port:     return port_is_valid(value);
        case Component::Path:     return path_is_valid(value);
        case Component::Query:    return query_is_valid(value);
        case Component::Fragment: return fragment_is_valid(value);
    }
    return false;
}

template <typename Set>
std::vector<std::string> to_strings(const Set& values) {
    std::vector<std::string> result;
    result.reserve(values.size());
    for (const auto& value : values) {
        if constexpr (std::is_same_v<typename Set::value_type, std::string>) {
            result.push_back(value);
        } else {
            result.push_back(std::to_string(value));
        }
    }
    return result;
}

std::string join(const std::vector<std::string>& values) {
    std::string result;
    for (const auto& value : values) {
        if (!result.empty()) {
            result += ", ";
        }
        result += value;
    }
    return result;
}

} // namespace

Validator& Validator::allow_schemes(std::initializer_list<std::string_view> schemes) {
    for (std::string_view scheme : schemes) {
        allowed_schemes_.insert(normalize_scheme(scheme));
    }
    return *this;
}

Validator& Validator::allow_hosts(std::initializer_list<std::string_view> hosts) {
    for (std::string_view host : hosts) {
        allowed_hosts_.insert(normalize_host(host));
    }
    return *this;
}

Validator& Validator::allow_ports(std::initializer_list<std::string_view> ports) {
    for (std::string_view port : ports) {
        long long value = 0;
        const char* first = port.data();
        const char* last = port.data() + port.size();
        // from_chars takes '-' but not '+'
        if (first != last && *first == '+') {
            ++first;
            if (first == last || *first == '+' || *first == '-') {
                throw ConfigurationError("\"" + std::string(port) + "\" is not a valid port number");
            }
        }
        const auto [end, ec] = std::from_chars(first, last, value);
        if (ec == std::errc::invalid_argument || end != last) {
            throw ConfigurationError("\"" + std::string(port) + "\" is not a valid port number");
        }
        // Overflowing integers are out of range like any other
        if (ec == std::errc{} && value >= 0 && value <= core::config::kMaxPort) {
            allowed_ports_.insert(static_cast<std::uint16_t>(value));
        }
    }
    return *this;
}

Validator& Validator::allow_ports(std::initializer_list<int> ports) {
    for (int port : ports) {
        if (port >= 0 && static_cast<std::uint32_t>(port) <= core::config::kMaxPort) {
            allowed_ports_.insert(static_cast<std::uint16_t>(port));
        }
    }
    return *this;
}

Validator& Validator::allow_use_of_password() {
    allow_password_ = true;
    return *this;
}

Validator& Validator::forbid_use_of_password() {
    allow_password_ = false;
    return *this;
}

Validator& Validator::require_components(std::initializer_list<std::string_view> components) {
    set_component_flags(require_presence_of_, components);
    return *this;
}

Validator& Validator::check_validity_of(std::initializer_list<std::string_view> components) {
    set_component_flags(validated_components_, components);
    return *this;
}

Validator& Validator::set_diagnostics(core::DiagnosticEmitter* emitter) {
    diagnostics_ = emitter;
    return *this;
}

bool Validator::requires_presence_of(Component component) const {
    return require_presence_of_[static_cast<size_t>(component)];
}

bool Validator::validates(Component component) const {
    return validated_components_[static_cast<size_t>(component)];
}

void Validator::validate(const ParsedUri& uri) const {
    if (!allow_password_) {
        check_password(uri);
    }
    ensure_required_components_exist(uri);
    ensure_components_are_valid(uri);
    ensure_one_of_allowed(uri);
}

void Validator::check_password(const ParsedUri& uri) const {
    if (!uri.userinfo) {
        return;
    }
    const size_t colon = uri.userinfo->find(':');
    if (colon == std::string::npos || colon + 1 == uri.userinfo->size()) {
        return;
    }
    report("password", "password present in " + uri.serialize());
    throw PasswordForbidden(uri);
}

void Validator::ensure_required_components_exist(const ParsedUri& uri) const {
    std::vector<std::string> missing;
    for (Component component : kAllComponents) {
        if (requires_presence_of(component) && !component_value(uri, component)) {
            missing.emplace_back(component_name(component));
        }
    }
    if (missing.empty()) {
        return;
    }
    std::sort(missing.begin(), missing.end());
    report("required", "missing " + join(missing));
    throw MissingComponentError(uri, std::move(missing));
}

void Validator::ensure_components_are_valid(const ParsedUri& uri) const {
    std::vector<std::string> invalid;
    for (Component component : kAllComponents) {
        if (validates(component) && !component_is_valid(component, component_value(uri, component))) {
            invalid.emplace_back(component_name(component));
        }
    }
    if (invalid.empty()) {
        return;
    }
    std::sort(invalid.begin(), invalid.end());
    report("syntax", "invalid " + join(invalid));
    throw InvalidComponentsError(uri, std::move(invalid));
}

void Validator::ensure_one_of_allowed(const ParsedUri& uri) const {
    if (!allowed_schemes_.empty() && uri.scheme &&
        !allowed_schemes_.contains(normalize_scheme(*uri.scheme))) {
        report("allowed", "scheme " + *uri.scheme + " not permitted");
        throw UnpermittedComponentError(uri, "scheme", *uri.scheme, to_strings(allowed_schemes_));
    }

    if (!allowed_hosts_.empty() && uri.host &&
        !allowed_hosts_.contains(normalize_host(*uri.host))) {
        report("allowed", "host " + *uri.host + " not permitted");
        throw UnpermittedComponentError(uri, "host", *uri.host, to_strings(allowed_hosts_));
    }

    if (!allowed_ports_.empty() && uri.port) {
        const auto port = normalize_port(*uri.port);
        if (!port || !allowed_ports_.contains(*port)) {
            report("allowed", "port " + *uri.port + " not permitted");
            throw UnpermittedComponentError(uri, "port", *uri.port, to_strings(allowed_ports_));
        }
    }
}

void Validator::report(std::string_view stage, const std::string& message) const {
    if (diagnostics_ != nullptr) {
        diagnostics_->emit(core::Severity::Warning, kModule, std::string(stage), message);
    }
}

} // namespace urival::uri
