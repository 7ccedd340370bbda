#pragma once

#include <trackchain/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace trackchain::testing {

inline trackchain::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = trackchain::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline trackchain::schema::identity_t make_named_identity(const uint8_t seed) {
  auto named = trackchain::schema::named_identity_t{};
  named[0] = seed;
  return trackchain::schema::identity_t{named};
}

inline trackchain::schema::ed25519_identity make_ed25519_identity(
    const uint8_t seed) {
  auto identity = trackchain::schema::ed25519_identity{};
  for (std::size_t i = 0; i < identity.public_key.size(); ++i) {
    identity.public_key[i] =
        static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return identity;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace trackchain::testing
