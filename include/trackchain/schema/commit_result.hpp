#pragma once

#include <trackchain/schema/primitives.hpp>
#include <cstdint>

namespace trackchain::schema {

template <uint16_t Version>
struct commit_result;

template <>
struct commit_result<1> final {
  uint16_t version{1};
  int64_t committed_height{};
  hash32_t state_root;
  uint64_t published_events{};
};

using commit_result_t = commit_result<1>;

}  // namespace trackchain::schema
