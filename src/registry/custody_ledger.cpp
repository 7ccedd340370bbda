#include <trackchain/common/critical.hpp>
#include <trackchain/registry/custody_ledger.hpp>
#include <trackchain/schema/key/engine_keys.hpp>

#include <algorithm>

using namespace trackchain::schema;

namespace trackchain::registry {

custody_ledger::custody_ledger(trackchain::execution::state_overlay& state)
    : state_{state} {}

uint64_t custody_ledger::size(const product_id_t& product_id) const {
  auto key = key::make_custody_length_key(state_.encoder(), product_id);
  return state_.get<uint64_t>(key).value_or(0);
}

uint64_t custody_ledger::append(const product_id_t& product_id,
                                const custody_entry_t& entry) {
  auto index = size(product_id);
  state_.put(key::make_custody_key(state_.encoder(), product_id, index), entry);
  state_.put(key::make_custody_length_key(state_.encoder(), product_id),
             index + 1);
  return index;
}

std::optional<custody_entry_t> custody_ledger::last(
    const product_id_t& product_id) const {
  auto length = size(product_id);
  if (length == 0) {
    return std::nullopt;
  }
  return state_.get<custody_entry_t>(
      key::make_custody_key(state_.encoder(), product_id, length - 1));
}

std::vector<custody_entry_t> custody_ledger::history(
    const product_id_t& product_id) const {
  return history(product_id, 0, size(product_id));
}

std::vector<custody_entry_t> custody_ledger::history(
    const product_id_t& product_id,
    const uint64_t offset,
    const uint64_t limit) const {
  auto entries = std::vector<custody_entry_t>{};
  auto length = size(product_id);
  if (offset >= length || limit == 0) {
    return entries;
  }
  auto end = offset + std::min(limit, length - offset);
  entries.reserve(end - offset);
  for (auto index = offset; index < end; ++index) {
    auto entry = state_.get<custody_entry_t>(
        key::make_custody_key(state_.encoder(), product_id, index));
    if (!entry) {
      trackchain::common::critical("custody entry {} of product {} is missing",
                                   index, to_string(product_id));
    }
    entries.push_back(std::move(entry.value()));
  }
  return entries;
}

}  // namespace trackchain::registry
