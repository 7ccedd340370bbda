#pragma once

#include <trackchain/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: custody event type.
// Custody workflow: notification kind published on the event stream.
namespace trackchain::schema {

enum class custody_event_type_t : uint8_t {
  product_created = 0,
  ownership_transferred = 1,
  custody_received = 2
};

inline constexpr auto kCustodyEventTypeMappings =
    enum_mappings_t<custody_event_type_t, 3>{
        std::pair<std::string_view, custody_event_type_t>{
            "product_created", custody_event_type_t::product_created},
        std::pair<std::string_view, custody_event_type_t>{
            "ownership_transferred",
            custody_event_type_t::ownership_transferred},
        std::pair<std::string_view, custody_event_type_t>{
            "custody_received", custody_event_type_t::custody_received},
    };

template <>
inline std::optional<custody_event_type_t>
try_from_string<custody_event_type_t>(const std::string_view value) {
  return from_string(value, kCustodyEventTypeMappings);
}

inline constexpr std::string_view to_string(const custody_event_type_t value) {
  return to_string(value, kCustodyEventTypeMappings).value_or("unknown");
}

}  // namespace trackchain::schema
