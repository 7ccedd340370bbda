#pragma once

#include <trackchain/schema/primitives.hpp>
#include <trackchain/schema/transaction_event.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: transaction result.
// Custody workflow: outcome of one delivered transaction. A non-zero code
// with its codespace names the rejected rule; custody operations that
// succeed report the product they touched.
namespace trackchain::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<product_id_t> product_id;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace trackchain::schema
