#include <trackchain/execution/state_overlay.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

using namespace trackchain::schema;

namespace {

bool has_prefix(const bytes_t& key, const bytes_view_t& prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key));
}

void merge_prefix(const trackchain::execution::write_set_t& source,
                  const bytes_view_t& prefix,
                  trackchain::execution::write_set_t& merged) {
  for (auto it = source.lower_bound(make_bytes(prefix));
       it != std::end(source) && has_prefix(it->first, prefix); ++it) {
    merged.insert_or_assign(it->first, it->second);
  }
}

}  // namespace

namespace trackchain::execution {

state_overlay::state_overlay(encoder_t& encoder,
                             const storage_t& storage,
                             const write_set_t* parent)
    : encoder_{encoder}, storage_{storage}, parent_{parent} {}

std::optional<bytes_t> state_overlay::get_bytes(
    const bytes_view_t& key) const {
  auto owned_key = make_bytes(key);
  if (auto it = writes_.find(owned_key); it != std::end(writes_)) {
    return it->second;
  }
  if (parent_ != nullptr) {
    if (auto it = parent_->find(owned_key); it != std::end(*parent_)) {
      return it->second;
    }
  }
  return storage_.get_bytes(key);
}

void state_overlay::put_bytes(bytes_t key, bytes_t value) {
  writes_.insert_or_assign(std::move(key), std::move(value));
}

std::vector<trackchain::storage::key_value_entry_t>
state_overlay::list_by_prefix(const bytes_view_t& prefix) const {
  auto merged = write_set_t{};
  for (auto& [key, value] : storage_.list_by_prefix(prefix)) {
    merged.insert_or_assign(std::move(key), std::move(value));
  }
  if (parent_ != nullptr) {
    merge_prefix(*parent_, prefix, merged);
  }
  merge_prefix(writes_, prefix, merged);

  auto entries = std::vector<trackchain::storage::key_value_entry_t>{};
  entries.reserve(merged.size());
  for (auto& [key, value] : merged) {
    entries.emplace_back(key, value);
  }
  return entries;
}

write_set_t state_overlay::take_writes() {
  auto taken = std::move(writes_);
  writes_.clear();
  return taken;
}

}  // namespace trackchain::execution
