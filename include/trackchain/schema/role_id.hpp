#pragma once

#include <trackchain/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role id.
// Custody workflow: capability recorded per identity. Administrators are
// seeded at genesis; manufacturers are granted and revoked by administrators.
namespace trackchain::schema {

enum class role_id_t : uint8_t { admin = 0, manufacturer = 1 };

inline constexpr auto kRoleIdMappings = enum_mappings_t<role_id_t, 2>{
    std::pair<std::string_view, role_id_t>{"admin", role_id_t::admin},
    std::pair<std::string_view, role_id_t>{"manufacturer",
                                           role_id_t::manufacturer},
};

template <>
inline std::optional<role_id_t> try_from_string<role_id_t>(
    const std::string_view value) {
  return from_string(value, kRoleIdMappings);
}

inline constexpr std::string_view to_string(const role_id_t value) {
  return to_string(value, kRoleIdMappings).value_or("unknown");
}

}  // namespace trackchain::schema
