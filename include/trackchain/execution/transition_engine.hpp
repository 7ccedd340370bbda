#pragma once

#include <trackchain/execution/custody_state.hpp>
#include <trackchain/schema/create_product.hpp>
#include <trackchain/schema/grant_role.hpp>
#include <trackchain/schema/primitives.hpp>
#include <trackchain/schema/revoke_role.hpp>
#include <trackchain/schema/transaction.hpp>
#include <trackchain/schema/transaction_result.hpp>
#include <trackchain/schema/transfer_ownership.hpp>
#include <trackchain/schema/verify_receive.hpp>
#include <cstdint>

namespace trackchain::execution {

/// Authenticated caller and block position of the call being executed.
struct call_context final {
  trackchain::schema::identity_t caller;
  trackchain::schema::timestamp_milliseconds_t timestamp{};
  uint64_t height{};
  uint32_t tx_index{};
};

/// Custody state machine.
///
/// Every operation checks permissions first and only then mutates `state`.
/// A non-zero result code means the caller must discard `state`; on success
/// the result carries one event per custody notification staged.
class transition_engine final {
 public:
  trackchain::schema::transaction_result_t execute(
      custody_state& state,
      const call_context& context,
      const trackchain::schema::transaction_payload_t& payload) const;

  trackchain::schema::transaction_result_t grant_role(
      custody_state& state,
      const call_context& context,
      const trackchain::schema::grant_role_t& operation) const;

  trackchain::schema::transaction_result_t revoke_role(
      custody_state& state,
      const call_context& context,
      const trackchain::schema::revoke_role_t& operation) const;

  trackchain::schema::transaction_result_t create_product(
      custody_state& state,
      const call_context& context,
      const trackchain::schema::create_product_t& operation) const;

  trackchain::schema::transaction_result_t transfer_ownership(
      custody_state& state,
      const call_context& context,
      const trackchain::schema::transfer_ownership_t& operation) const;

  trackchain::schema::transaction_result_t verify_receive(
      custody_state& state,
      const call_context& context,
      const trackchain::schema::verify_receive_t& operation) const;
};

}  // namespace trackchain::execution
