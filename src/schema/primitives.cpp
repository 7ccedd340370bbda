#include <trackchain/common/critical.hpp>
#include <trackchain/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <string_view>

namespace trackchain::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
constexpr auto kBase64Table = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

std::string_view strip_hex_prefix(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_value(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<uint8_t> base64_value(const char c) {
  auto position = kBase64Table.find(c);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    trackchain::common::critical("make_hash32 expected 32 bytes, got {}",
                                 bytes.size());
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash.has_value()) {
    trackchain::common::critical("make_hash32 expected 64 hex digits");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(hash));
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHexDigits[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHexDigits[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = strip_hex_prefix(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }
  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_value(hex[i]);
    auto low = hex_value(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

bytes_t from_hex(std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded.has_value()) {
    trackchain::common::critical("invalid hex input");
  }
  return *decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);
  for (std::size_t index = 0; index < bytes.size(); index += 3) {
    auto remaining = bytes.size() - index;
    auto value = static_cast<uint32_t>(bytes[index]) << 16u;
    if (remaining > 1) {
      value |= static_cast<uint32_t>(bytes[index + 1]) << 8u;
    }
    if (remaining > 2) {
      value |= static_cast<uint32_t>(bytes[index + 2]);
    }
    out.push_back(kBase64Table[(value >> 18u) & 0x3Fu]);
    out.push_back(kBase64Table[(value >> 12u) & 0x3Fu]);
    out.push_back(remaining > 1 ? kBase64Table[(value >> 6u) & 0x3Fu] : '=');
    out.push_back(remaining > 2 ? kBase64Table[value & 0x3Fu] : '=');
  }
  return out;
}

std::optional<bytes_t> try_from_base64(std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  std::copy_if(std::begin(encoded), std::end(encoded),
               std::back_inserter(compact), [](const char ch) {
                 return std::isspace(static_cast<unsigned char>(ch)) == 0;
               });
  if ((compact.size() % 4) != 0) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((compact.size() / 4) * 3);
  for (std::size_t i = 0; i < compact.size(); i += 4) {
    auto is_last_chunk = (i + 4) == compact.size();
    auto padding = std::size_t{0};
    auto value = uint32_t{0};
    for (std::size_t j = 0; j < 4; ++j) {
      auto ch = compact[i + j];
      if (ch == '=') {
        // Padding is only legal in the last two positions of the last chunk.
        if (!is_last_chunk || j < 2) {
          return std::nullopt;
        }
        ++padding;
        value <<= 6u;
        continue;
      }
      if (padding != 0) {
        return std::nullopt;
      }
      auto decoded = base64_value(ch);
      if (!decoded) {
        return std::nullopt;
      }
      value = (value << 6u) | *decoded;
    }
    out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
    if (padding < 2) {
      out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
    }
    if (padding < 1) {
      out.push_back(static_cast<uint8_t>(value & 0xFFu));
    }
  }
  return out;
}

bytes_t from_base64(std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded.has_value()) {
    trackchain::common::critical("invalid base64 input");
  }
  return *decoded;
}

std::optional<product_id_t> try_make_product_id(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  auto is_hex = text.size() > 2 && text[0] == '0' &&
                (text[1] == 'x' || text[1] == 'X');
  auto digits = is_hex ? text.substr(2) : text;
  if (digits.empty() || digits.size() > (is_hex ? 64u : 78u)) {
    return std::nullopt;
  }
  auto value = product_id_t{0};
  auto limit = std::numeric_limits<product_id_t>::max();
  for (const auto ch : digits) {
    auto digit = std::optional<uint8_t>{};
    if (is_hex) {
      digit = hex_value(ch);
    } else if (ch >= '0' && ch <= '9') {
      digit = static_cast<uint8_t>(ch - '0');
    }
    if (!digit) {
      return std::nullopt;
    }
    auto base = is_hex ? 16u : 10u;
    if (value > (limit - *digit) / base) {
      return std::nullopt;
    }
    value = (value * base) + *digit;
  }
  return value;
}

std::string to_string(const product_id_t& product_id) {
  return product_id.str();
}

identity_t make_null_identity() {
  return identity_t{named_identity_t{}};
}

bool is_null_identity(const identity_t& identity) {
  return std::holds_alternative<named_identity_t>(identity) &&
         std::get<named_identity_t>(identity) == named_identity_t{};
}

std::string to_string(const identity_t& identity) {
  return std::visit(
      overloaded{[](const ed25519_identity& value) {
                   return "ed25519:" + to_hex(value.public_key);
                 },
                 [](const secp256k1_identity& value) {
                   return "secp256k1:" + to_hex(value.public_key);
                 },
                 [](const named_identity_t& value) {
                   return "named:" + to_hex(value);
                 }},
      identity);
}

std::optional<identity_t> try_parse_identity(std::string_view text) {
  auto parse_key = [](std::string_view hex, auto& out) {
    auto bytes = try_from_hex(hex);
    if (!bytes || bytes->size() != out.size()) {
      return false;
    }
    std::copy(std::begin(*bytes), std::end(*bytes), std::begin(out));
    return true;
  };

  if (text.starts_with("ed25519:")) {
    auto identity = ed25519_identity{};
    text.remove_prefix(std::string_view{"ed25519:"}.size());
    return parse_key(text, identity.public_key)
               ? std::optional<identity_t>{identity}
               : std::nullopt;
  }
  if (text.starts_with("secp256k1:")) {
    auto identity = secp256k1_identity{};
    text.remove_prefix(std::string_view{"secp256k1:"}.size());
    return parse_key(text, identity.public_key)
               ? std::optional<identity_t>{identity}
               : std::nullopt;
  }
  if (text.starts_with("named:")) {
    text.remove_prefix(std::string_view{"named:"}.size());
  }
  auto named = named_identity_t{};
  return parse_key(text, named) ? std::optional<identity_t>{named}
                                : std::nullopt;
}

}  // namespace trackchain::schema
