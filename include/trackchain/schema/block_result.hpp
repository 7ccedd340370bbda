#pragma once

#include <trackchain/schema/primitives.hpp>
#include <trackchain/schema/transaction_result.hpp>
#include <cstdint>
#include <vector>

// Schema type: block result.
// Custody workflow: finalize output. The state root and event count are
// candidates until commit; nothing is published before then.
namespace trackchain::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  std::vector<transaction_result_t> tx_results;
  hash32_t state_root;
  uint64_t staged_events{};
};

using block_result_t = block_result<1>;

}  // namespace trackchain::schema
