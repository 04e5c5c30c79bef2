#ifndef URIVAL_CORE_CONFIG_H
#define URIVAL_CORE_CONFIG_H

#include <cstddef>
#include <cstdint>

namespace urival::core::config {

inline constexpr std::uint32_t kMaxPort = 65535;
inline constexpr std::size_t kMaxPortDigits = 5;
inline constexpr std::uint32_t kMaxIpv4Octet = 255;
inline constexpr std::size_t kIpv4OctetCount = 4;
inline constexpr std::size_t kMaxIpv6Pieces = 8;

} // namespace urival::core::config

#endif  // URIVAL_CORE_CONFIG_H
