#pragma once
#include <trackchain/schema/create_product.hpp>
#include <trackchain/schema/grant_role.hpp>
#include <trackchain/schema/primitives.hpp>
#include <trackchain/schema/revoke_role.hpp>
#include <trackchain/schema/transfer_ownership.hpp>
#include <trackchain/schema/verify_receive.hpp>
#include <variant>

namespace trackchain::schema {

using transaction_payload_t = std::variant<grant_role_t,
                                           revoke_role_t,
                                           create_product_t,
                                           transfer_ownership_t,
                                           verify_receive_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  identity_t signer{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

}  // namespace trackchain::schema
