#pragma once

#include <trackchain/schema/primitives.hpp>
#include <cstdint>
#include <string>

// One row per delivered transaction, successful or not. Keeps the raw bytes
// so an auditor can re-verify the signature against the recorded outcome.
namespace trackchain::schema {

template <uint16_t Version>
struct history_entry;

template <>
struct history_entry<1> final {
  uint16_t version{1};
  uint64_t height{};
  uint32_t index{};
  timestamp_milliseconds_t block_time{};
  uint32_t code{};
  std::string codespace;
  bytes_t tx;
};

using history_entry_t = history_entry<1>;

}  // namespace trackchain::schema
