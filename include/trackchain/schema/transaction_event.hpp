#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction event.
// Custody workflow: notification returned with a transaction result so the
// substrate can publish it. Attributes flagged with index are searchable by
// event consumers; content hashes are not.
namespace trackchain::schema {

template <uint16_t Version>
struct transaction_event_attribute;

template <>
struct transaction_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using transaction_event_attribute_t = transaction_event_attribute<1>;

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

}  // namespace trackchain::schema
