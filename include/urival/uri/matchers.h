#pragma once
#include <string_view>

namespace urival::uri {

// A full-string predicate for one RFC 3986 production. Instances are
// constants defined in matchers.cpp and never change after static
// initialization, so they can be shared freely between threads.
class Matcher {
public:
    using Predicate = bool (*)(std::string_view);

    constexpr Matcher(std::string_view name, Predicate predicate)
        : name_(name), predicate_(predicate) {}

    // True only if the whole of `input` conforms to the production.
    bool matches(std::string_view input) const { return predicate_(input); }

    std::string_view name() const { return name_; }

private:
    std::string_view name_;
    Predicate predicate_;
};

// scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
const Matcher& scheme_matcher();

// [ userinfo "@" ] host [ ":" port ], i.e. authority without "//"
const Matcher& subauthority_matcher();

// 1*( unreserved / pct-encoded / sub-delims / ":" )
const Matcher& userinfo_matcher();

// IP-literal / IPv4address / reg-name
const Matcher& host_matcher();

// *5DIGIT
const Matcher& port_matcher();

// path-abempty / path-absolute / path-noscheme / path-rootless / path-empty
const Matcher& path_matcher();

// *( pchar / "/" / "?" )
const Matcher& query_matcher();
const Matcher& fragment_matcher();

// Dotted-quad shape only (1*3DIGIT "." x4); octet ranges are not checked.
const Matcher& ipv4_matcher();

// Exactly four dot-separated decimal octets, each in [0, 255]. Leading
// zeros are tolerated.
bool valid_ipv4_host_address(std::string_view host);

} // namespace urival::uri
