#pragma once

#include <trackchain/schema/custody_action.hpp>
#include <trackchain/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: custody entry.
// Custody workflow: one row of a product's provenance trail. Rows are only
// ever appended.
namespace trackchain::schema {

template <uint16_t Version>
struct custody_entry;

template <>
struct custody_entry<1> final {
  uint16_t version{1};
  identity_t actor{};
  identity_t counterparty{};
  timestamp_milliseconds_t timestamp{};
  custody_action_t action{custody_action_t::created};
  std::string content_hash;
};

using custody_entry_t = custody_entry<1>;

}  // namespace trackchain::schema
