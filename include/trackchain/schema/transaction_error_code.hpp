#pragma once

#include <cstdint>
#include <string_view>

namespace trackchain::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_signature_type = 5,
  signature_verification_failed = 6,
  authorization_denied = 10,
  not_owner = 11,
  product_exists = 20,
  invalid_recipient = 21,
  already_received = 22,
  invalid_product_name = 23,
  role_not_grantable = 24,
  custody_in_transit = 25,
  not_in_transit = 26,
  product_missing = 30,
};

/// Coarse failure class reported to callers alongside the numeric code.
enum class error_kind : uint8_t {
  none = 0,
  envelope = 1,
  authorization = 2,
  validation = 3,
  not_found = 4
};

inline constexpr error_kind classify(const uint32_t code) {
  if (code == 0) {
    return error_kind::none;
  }
  if (code < 10) {
    return error_kind::envelope;
  }
  if (code < 20) {
    return error_kind::authorization;
  }
  if (code < 30) {
    return error_kind::validation;
  }
  return error_kind::not_found;
}

inline constexpr error_kind classify(const transaction_error_code code) {
  return classify(static_cast<uint32_t>(code));
}

inline constexpr std::string_view to_string(const error_kind kind) {
  switch (kind) {
    case error_kind::none:
      return "ok";
    case error_kind::envelope:
      return "envelope";
    case error_kind::authorization:
      return "authorization";
    case error_kind::validation:
      return "validation";
    case error_kind::not_found:
      return "not_found";
  }
  return "unknown";
}

}  // namespace trackchain::schema
