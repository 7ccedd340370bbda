#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace trackchain::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using product_id_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);
bytes_t from_base64(std::string_view encoded);

/// Parse a decimal (or 0x-prefixed hex) product id.
std::optional<product_id_t> try_make_product_id(std::string_view text);
std::string to_string(const product_id_t& product_id);

struct ed25519_identity final {
  std::array<uint8_t, 32> public_key;

  bool operator==(const ed25519_identity&) const = default;
};

struct secp256k1_identity final {
  std::array<uint8_t, 33> public_key;

  bool operator==(const secp256k1_identity&) const = default;
};

using named_identity_t = hash32_t;  // On chain account reference
using identity_t =
    std::variant<ed25519_identity, secp256k1_identity, named_identity_t>;

/// The null identity: a named reference of all zero bytes.
identity_t make_null_identity();
bool is_null_identity(const identity_t& identity);

/// Human readable `kind:hex` rendering used in logs and event attributes.
std::string to_string(const identity_t& identity);

/// Parses the `to_string` form. A bare 64 character hex string is read as a
/// named identity.
std::optional<identity_t> try_parse_identity(std::string_view text);

using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;
using signature_t = std::variant<ed25519_signature_t, secp256k1_signature_t>;

}  // namespace trackchain::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
