#include <trackchain/execution/engine.hpp>
#include <trackchain/schema/transaction_error_code.hpp>
#include <gtest/gtest.h>

TEST(engine_types, defaults_are_stable) {
  auto tx = trackchain::schema::transaction_result_t{};
  EXPECT_EQ(tx.code, 0u);
  EXPECT_TRUE(tx.events.empty());

  auto block = trackchain::schema::block_result_t{};
  EXPECT_TRUE(block.tx_results.empty());

  auto commit = trackchain::schema::commit_result_t{};
  EXPECT_EQ(commit.committed_height, 0);
  EXPECT_EQ(commit.published_events, 0u);

  auto info = trackchain::schema::app_info_t{};
  EXPECT_EQ(info.data, "trackchain-custody");
  EXPECT_EQ(info.version, "0.1.0");

  auto product = trackchain::schema::product_state_t{};
  EXPECT_TRUE(product.name.empty());
  EXPECT_TRUE(product.content_hash.empty());
}

TEST(engine_types, error_codes_classify_by_kind) {
  using trackchain::schema::classify;
  using trackchain::schema::error_kind;
  using trackchain::schema::transaction_error_code;

  EXPECT_EQ(classify(0u), error_kind::none);
  EXPECT_EQ(classify(transaction_error_code::invalid_nonce),
            error_kind::envelope);
  EXPECT_EQ(classify(transaction_error_code::authorization_denied),
            error_kind::authorization);
  EXPECT_EQ(classify(transaction_error_code::not_owner),
            error_kind::authorization);
  EXPECT_EQ(classify(transaction_error_code::product_exists),
            error_kind::validation);
  EXPECT_EQ(classify(transaction_error_code::already_received),
            error_kind::validation);
  EXPECT_EQ(classify(transaction_error_code::product_missing),
            error_kind::not_found);
  EXPECT_EQ(trackchain::schema::to_string(error_kind::authorization),
            "authorization");
}

TEST(engine_types, transaction_defaults_to_version_one) {
  auto tx = trackchain::schema::transaction_t{};
  EXPECT_EQ(tx.version, 1u);
  EXPECT_EQ(tx.nonce, 0u);
  tx.payload = trackchain::schema::verify_receive_t{};
  EXPECT_TRUE(
      std::holds_alternative<trackchain::schema::verify_receive_t>(tx.payload));
}

TEST(engine_types, verifier_callback_type_compiles) {
  auto verifier = trackchain::execution::signature_verifier_t{
      [](const trackchain::schema::bytes_view_t&,
         const trackchain::schema::identity_t&,
         const trackchain::schema::signature_t&) { return true; }};
  EXPECT_TRUE(static_cast<bool>(verifier));
}
