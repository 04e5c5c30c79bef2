#pragma once
#include <urival/uri/parsed_uri.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace urival::uri {

// Misuse of the Validator builder, such as an unknown component name.
// Raised while configuring, never from validate().
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Base of every policy violation reported by Validator::validate().
class ValidationError : public std::runtime_error {
public:
    ValidationError(ParsedUri uri, const std::string& message);

    const ParsedUri& uri() const { return uri_; }

private:
    ParsedUri uri_;
};

class PasswordForbidden : public ValidationError {
public:
    explicit PasswordForbidden(ParsedUri uri);
};

class MissingComponentError : public ValidationError {
public:
    // `components` must already be sorted
    MissingComponentError(ParsedUri uri, std::vector<std::string> components);

    const std::vector<std::string>& components() const { return components_; }

private:
    std::vector<std::string> components_;
};

class InvalidComponentsError : public ValidationError {
public:
    InvalidComponentsError(ParsedUri uri, std::vector<std::string> components);

    const std::vector<std::string>& components() const { return components_; }

private:
    std::vector<std::string> components_;
};

class UnpermittedComponentError : public ValidationError {
public:
    UnpermittedComponentError(ParsedUri uri, std::string component_name,
                              std::string component_value,
                              std::vector<std::string> allowed_values);

    const std::string& component_name() const { return component_name_; }
    const std::string& component_value() const { return component_value_; }
    const std::vector<std::string>& allowed_values() const { return allowed_values_; }

private:
    std::string component_name_;
    std::string component_value_;
    std::vector<std::string> allowed_values_;
};

} // namespace urival::uri
