#pragma once

#include <trackchain/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: custody action.
// Custody workflow: life-cycle step recorded by a custody ledger entry.
// `sold` is reserved; no operation produces it.
namespace trackchain::schema {

enum class custody_action_t : uint8_t {
  created = 0,
  in_transit = 1,
  received = 2,
  sold = 3
};

inline constexpr auto kCustodyActionMappings =
    enum_mappings_t<custody_action_t, 4>{
        std::pair<std::string_view, custody_action_t>{
            "created", custody_action_t::created},
        std::pair<std::string_view, custody_action_t>{
            "in_transit", custody_action_t::in_transit},
        std::pair<std::string_view, custody_action_t>{
            "received", custody_action_t::received},
        std::pair<std::string_view, custody_action_t>{"sold",
                                                      custody_action_t::sold},
    };

template <>
inline std::optional<custody_action_t> try_from_string<custody_action_t>(
    const std::string_view value) {
  return from_string(value, kCustodyActionMappings);
}

inline constexpr std::string_view to_string(const custody_action_t value) {
  return to_string(value, kCustodyActionMappings).value_or("unknown");
}

}  // namespace trackchain::schema
