#pragma once

#include <trackchain/schema/custody_event_type.hpp>
#include <trackchain/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: custody event record.
// Custody workflow: durable notification stream row. Ids form a gap-free
// sequence starting at 1.
namespace trackchain::schema {

template <uint16_t Version>
struct custody_event_record;

template <>
struct custody_event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t height{};
  uint32_t tx_index{};
  custody_event_type_t type{};
  product_id_t product_id{};
  identity_t actor{};
  identity_t counterparty{};
  std::string content_hash;
  timestamp_milliseconds_t recorded_at{};
};

using custody_event_record_t = custody_event_record<1>;

}  // namespace trackchain::schema
