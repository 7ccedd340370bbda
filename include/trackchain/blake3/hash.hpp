#pragma once
#include <blake3.h>
#include <trackchain/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace trackchain::blake3 {

/// Incremental BLAKE3 hasher producing 32-byte digests.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const trackchain::schema::bytes_view_t& bytes);

  trackchain::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

trackchain::schema::hash32_t hash(const std::string_view& str);
trackchain::schema::hash32_t hash(const trackchain::schema::bytes_view_t& bytes);

}  // namespace trackchain::blake3
