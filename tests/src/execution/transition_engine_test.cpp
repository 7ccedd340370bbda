#include <trackchain/execution/custody_state.hpp>
#include <trackchain/execution/transition_engine.hpp>
#include <trackchain/schema/transaction_error_code.hpp>
#include <trackchain/storage/rocksdb/storage.hpp>
#include <trackchain/testing/common.hpp>
#include <trackchain/testing/execution_harness.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

using trackchain::execution::call_context;
using trackchain::schema::custody_action_t;
using trackchain::schema::role_id_t;
using trackchain::schema::transaction_error_code;
using trackchain::testing::make_named_identity;
using trackchain::testing::make_product_id;

constexpr auto code(const transaction_error_code value) {
  return static_cast<uint32_t>(value);
}

class transition_engine_test : public ::testing::Test {
 protected:
  transition_engine_test()
      : db_path_{trackchain::testing::make_db_path("trackchain_transitions")},
        storage_{trackchain::storage::make_storage<
            trackchain::storage::rocksdb_storage_tag>(db_path_)},
        state_{encoder_, storage_} {
    state_.identities().assign(admin_, role_id_t::admin, true,
                               trackchain::schema::make_null_identity(), 0);
  }

  ~transition_engine_test() override {
    trackchain::testing::remove_path(db_path_);
  }

  call_context as(const trackchain::schema::identity_t& caller) {
    return call_context{.caller = caller,
                        .timestamp = ++clock_,
                        .height = 1,
                        .tx_index = 0};
  }

  std::string db_path_;
  trackchain::testing::scale_encoder_t encoder_;
  trackchain::storage::storage<trackchain::storage::rocksdb_storage_tag>
      storage_;
  trackchain::execution::custody_state state_;
  trackchain::execution::transition_engine transitions_;
  trackchain::schema::identity_t admin_{make_named_identity(0xA0)};
  trackchain::schema::identity_t maker_{make_named_identity(0x01)};
  trackchain::schema::identity_t carrier_{make_named_identity(0x02)};
  uint64_t clock_{100};
};

}  // namespace

TEST_F(transition_engine_test, grant_role_checks_caller_before_role) {
  auto denied = transitions_.grant_role(
      state_, as(maker_),
      trackchain::schema::grant_role_t{.subject = maker_,
                                       .role = role_id_t::admin});
  EXPECT_EQ(denied.code, code(transaction_error_code::authorization_denied));
  EXPECT_EQ(denied.codespace, "trackchain.execute");

  auto granted = transitions_.grant_role(
      state_, as(admin_),
      trackchain::schema::grant_role_t{.subject = maker_,
                                       .role = role_id_t::manufacturer});
  ASSERT_EQ(granted.code, 0u);
  ASSERT_EQ(granted.events.size(), 1u);
  EXPECT_EQ(granted.events[0].type, "role.granted");
  EXPECT_TRUE(state_.identities().has_role(maker_, role_id_t::manufacturer));
  EXPECT_TRUE(state_.staged_events().empty());
}

TEST_F(transition_engine_test, revoke_role_is_admin_only) {
  transitions_.grant_role(
      state_, as(admin_),
      trackchain::schema::grant_role_t{.subject = maker_,
                                       .role = role_id_t::manufacturer});
  auto denied = transitions_.revoke_role(
      state_, as(carrier_),
      trackchain::schema::revoke_role_t{.subject = maker_,
                                        .role = role_id_t::manufacturer});
  EXPECT_EQ(denied.code, code(transaction_error_code::authorization_denied));
  EXPECT_TRUE(state_.identities().has_role(maker_, role_id_t::manufacturer));

  auto not_grantable = transitions_.revoke_role(
      state_, as(admin_),
      trackchain::schema::revoke_role_t{.subject = admin_,
                                        .role = role_id_t::admin});
  EXPECT_EQ(not_grantable.code,
            code(transaction_error_code::role_not_grantable));
  EXPECT_TRUE(state_.identities().has_role(admin_, role_id_t::admin));

  auto revoked = transitions_.revoke_role(
      state_, as(admin_),
      trackchain::schema::revoke_role_t{.subject = maker_,
                                        .role = role_id_t::manufacturer});
  EXPECT_EQ(revoked.code, 0u);
  EXPECT_EQ(revoked.events[0].type, "role.revoked");
  EXPECT_FALSE(state_.identities().has_role(maker_, role_id_t::manufacturer));
}

TEST_F(transition_engine_test, create_product_writes_all_stores) {
  transitions_.grant_role(
      state_, as(admin_),
      trackchain::schema::grant_role_t{.subject = maker_,
                                       .role = role_id_t::manufacturer});
  auto context = as(maker_);
  auto created = transitions_.create_product(
      state_, context,
      trackchain::schema::create_product_t{.product_id = make_product_id(1),
                                           .name = "Widget",
                                           .content_hash = "QmW"});
  ASSERT_EQ(created.code, 0u) << created.log;

  auto product = state_.products().get(make_product_id(1));
  ASSERT_TRUE(product.has_value());
  EXPECT_EQ(product->manufacturer, maker_);
  EXPECT_EQ(product->created_at, context.timestamp);
  EXPECT_EQ(state_.ownership().owner_of(make_product_id(1)), maker_);
  ASSERT_EQ(state_.ledger().size(make_product_id(1)), 1u);
  EXPECT_EQ(state_.ledger().last(make_product_id(1))->action,
            custody_action_t::created);
  ASSERT_EQ(state_.staged_events().size(), 1u);
  EXPECT_EQ(state_.staged_events()[0].event_id, 1u);
  EXPECT_EQ(state_.staged_events()[0].recorded_at, context.timestamp);
}

TEST_F(transition_engine_test, create_product_rejects_before_mutating) {
  auto denied = transitions_.create_product(
      state_, as(carrier_),
      trackchain::schema::create_product_t{.product_id = make_product_id(1),
                                           .name = "Widget",
                                           .content_hash = "QmW"});
  EXPECT_EQ(denied.code, code(transaction_error_code::authorization_denied));
  EXPECT_FALSE(state_.products().exists(make_product_id(1)));
  EXPECT_EQ(state_.ledger().size(make_product_id(1)), 0u);
  EXPECT_TRUE(state_.staged_events().empty());
}

TEST_F(transition_engine_test, transfer_and_receive_move_custody) {
  transitions_.grant_role(
      state_, as(admin_),
      trackchain::schema::grant_role_t{.subject = maker_,
                                       .role = role_id_t::manufacturer});
  transitions_.create_product(
      state_, as(maker_),
      trackchain::schema::create_product_t{.product_id = make_product_id(1),
                                           .name = "Widget",
                                           .content_hash = "QmW"});

  auto early = transitions_.verify_receive(
      state_, as(carrier_),
      trackchain::schema::verify_receive_t{.product_id = make_product_id(1),
                                           .content_hash = "QmR"});
  EXPECT_EQ(early.code, code(transaction_error_code::not_owner));

  auto self_confirm = transitions_.verify_receive(
      state_, as(maker_),
      trackchain::schema::verify_receive_t{.product_id = make_product_id(1),
                                           .content_hash = "QmR"});
  EXPECT_EQ(self_confirm.code, code(transaction_error_code::not_in_transit));

  auto transferred = transitions_.transfer_ownership(
      state_, as(maker_),
      trackchain::schema::transfer_ownership_t{.product_id = make_product_id(1),
                                               .new_owner = carrier_,
                                               .content_hash = "QmT"});
  ASSERT_EQ(transferred.code, 0u);
  EXPECT_EQ(transferred.events[0].type, "custody.ownership_transferred");

  auto again = transitions_.transfer_ownership(
      state_, as(maker_),
      trackchain::schema::transfer_ownership_t{.product_id = make_product_id(1),
                                               .new_owner = carrier_,
                                               .content_hash = "QmT"});
  EXPECT_EQ(again.code, code(transaction_error_code::not_owner));

  auto unconfirmed = transitions_.transfer_ownership(
      state_, as(carrier_),
      trackchain::schema::transfer_ownership_t{.product_id = make_product_id(1),
                                               .new_owner = maker_,
                                               .content_hash = "QmT2"});
  EXPECT_EQ(unconfirmed.code,
            code(transaction_error_code::custody_in_transit));
  EXPECT_EQ(state_.ownership().owner_of(make_product_id(1)), carrier_);
  EXPECT_EQ(state_.ledger().size(make_product_id(1)), 2u);

  auto received = transitions_.execute(
      state_, as(carrier_),
      trackchain::schema::verify_receive_t{.product_id = make_product_id(1),
                                           .content_hash = "QmR"});
  ASSERT_EQ(received.code, 0u);
  EXPECT_EQ(received.events[0].type, "custody.custody_received");

  auto history = state_.ledger().history(make_product_id(1));
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[1].counterparty, carrier_);
  EXPECT_EQ(history[2].actor, carrier_);
  EXPECT_LT(history[0].timestamp, history[2].timestamp);
  ASSERT_EQ(state_.staged_events().size(), 3u);
  EXPECT_EQ(state_.staged_events()[2].event_id, 3u);
}
