#include <urival/uri/errors.h>

#include <utility>

namespace urival::uri {

namespace {

std::string join_quoted(const std::vector<std::string>& values) {
    std::string result;
    for (const auto& value : values) {
        if (!result.empty()) {
            result += ", ";
        }
        result += '"';
        result += value;
        result += '"';
    }
    return result;
}

std::string was_or_were(const std::vector<std::string>& values) {
    return values.size() == 1 ? "was" : "were";
}

} // namespace

ValidationError::ValidationError(ParsedUri uri, const std::string& message)
    : std::runtime_error(message), uri_(std::move(uri)) {}

PasswordForbidden::PasswordForbidden(ParsedUri uri)
    : ValidationError(uri, uri.serialize() + " contained a password when validation forbade it") {}

MissingComponentError::MissingComponentError(ParsedUri uri, std::vector<std::string> components)
    : ValidationError(std::move(uri), join_quoted(components) + " " + was_or_were(components) +
                                          " required but missing"),
      components_(std::move(components)) {}

InvalidComponentsError::InvalidComponentsError(ParsedUri uri, std::vector<std::string> components)
    : ValidationError(std::move(uri), join_quoted(components) + " " + was_or_were(components) +
                                          " found to be invalid"),
      components_(std::move(components)) {}

UnpermittedComponentError::UnpermittedComponentError(ParsedUri uri, std::string component_name,
                                                     std::string component_value,
                                                     std::vector<std::string> allowed_values)
    : ValidationError(std::move(uri), "\"" + component_name + "\" was required to be one of [" +
                                          join_quoted(allowed_values) + "] but was \"" +
                                          component_value + "\""),
      component_name_(std::move(component_name)),
      component_value_(std::move(component_value)),
      allowed_values_(std::move(allowed_values)) {}

} // namespace urival::uri
