#include <gtest/gtest.h>
#include <trackchain/blake3/hash.hpp>
#include <trackchain/schema/encoding/scale/encoder.hpp>
#include <trackchain/schema/primitives.hpp>
#include <trackchain/schema/role_id.hpp>
#include <trackchain/schema/transaction.hpp>
#include <trackchain/testing/common.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include <sys/wait.h>

#ifndef TRACKCHAIN_TRANSACTION_BUILDER_PATH
#define TRACKCHAIN_TRANSACTION_BUILDER_PATH ""
#endif

namespace {

using encoder_t = trackchain::schema::encoding::encoder<
    trackchain::schema::encoding::scale_encoder_tag>;

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_builder(const std::string& builder,
                        const std::string_view command,
                        const std::string_view args) {
  auto line = shell_quote(builder) + " " + std::string{command} + " " +
              std::string{args};
  auto [exit_code, output] = run_capture(line);
  EXPECT_EQ(exit_code, 0) << "command failed: " << line << '\n' << output;
  return trim_ascii_whitespace(output);
}

std::string builder_path() {
  return std::string{TRACKCHAIN_TRANSACTION_BUILDER_PATH};
}

}  // namespace

TEST(transaction_builder, query_keys_match_engine_routes) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto encoder = encoder_t{};
  auto subject = trackchain::testing::make_named_identity(0x01);
  auto subject_text = trackchain::schema::to_string(subject);

  EXPECT_EQ(run_builder(builder, "query-key",
                        "--path /state/product --product-id 42"),
            trackchain::schema::to_base64(
                encoder.encode(trackchain::schema::product_id_t{42})));
  EXPECT_EQ(run_builder(builder, "query-key",
                        "--path /state/owner --product-id 0x2a"),
            trackchain::schema::to_base64(
                encoder.encode(trackchain::schema::product_id_t{42})));
  EXPECT_EQ(
      run_builder(builder, "query-key",
                  "--path /state/role --subject " + subject_text +
                      " --role manufacturer"),
      trackchain::schema::to_base64(encoder.encode(
          std::tuple{subject, trackchain::schema::role_id_t::manufacturer})));
  EXPECT_EQ(run_builder(builder, "query-key",
                        "--path /custody/history --product-id 7 --offset 2 "
                        "--limit 5"),
            trackchain::schema::to_base64(encoder.encode(std::tuple{
                trackchain::schema::product_id_t{7}, uint64_t{2},
                uint64_t{5}})));
  EXPECT_EQ(run_builder(builder, "query-key",
                        "--path /events/range --from 3 --to 9"),
            trackchain::schema::to_base64(
                encoder.encode(std::tuple{uint64_t{3}, uint64_t{9}})));
  EXPECT_EQ(run_builder(builder, "query-key", "--path /engine/info"), "");
}

TEST(transaction_builder, builds_decodable_custody_transactions) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto encoder = encoder_t{};
  auto signer = trackchain::testing::make_named_identity(0x01);
  auto recipient = trackchain::testing::make_named_identity(0x02);

  auto create = run_builder(
      builder, "transaction",
      "--payload create_product --chain-name trackchain-test --nonce 3 "
      "--signer " +
          trackchain::schema::to_string(signer) +
          " --product-id 1 --name Widget --content-hash QmW");
  auto create_tx = encoder.decode<trackchain::schema::transaction_t>(
      trackchain::schema::from_base64(create));
  EXPECT_EQ(create_tx.version, 1u);
  EXPECT_EQ(create_tx.nonce, 3u);
  EXPECT_EQ(create_tx.signer, signer);
  EXPECT_EQ(create_tx.chain_id,
            trackchain::blake3::hash(std::string_view{"trackchain-test"}));
  ASSERT_TRUE(std::holds_alternative<trackchain::schema::create_product_t>(
      create_tx.payload));
  const auto& payload =
      std::get<trackchain::schema::create_product_t>(create_tx.payload);
  EXPECT_EQ(payload.product_id, trackchain::schema::product_id_t{1});
  EXPECT_EQ(payload.name, "Widget");
  EXPECT_EQ(payload.content_hash, "QmW");

  auto transfer = run_builder(
      builder, "tx",
      "--payload transfer_ownership --signer " +
          trackchain::schema::to_string(signer) + " --product-id 1 --new-owner " +
          trackchain::schema::to_string(recipient) + " --content-hash QmT");
  auto transfer_tx = encoder.decode<trackchain::schema::transaction_t>(
      trackchain::schema::from_base64(transfer));
  ASSERT_TRUE(std::holds_alternative<trackchain::schema::transfer_ownership_t>(
      transfer_tx.payload));
  EXPECT_EQ(
      std::get<trackchain::schema::transfer_ownership_t>(transfer_tx.payload)
          .new_owner,
      recipient);
}

TEST(transaction_builder, secp256k1_signers_carry_secp256k1_signatures) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto signer = trackchain::schema::secp256k1_identity{};
  signer.public_key[0] = 0x02;
  auto encoded = run_builder(
      builder, "transaction",
      "--payload verify_receive --signer " +
          trackchain::schema::to_string(trackchain::schema::identity_t{signer}) +
          " --product-id 5");
  auto tx = encoder_t{}.decode<trackchain::schema::transaction_t>(
      trackchain::schema::from_base64(encoded));
  EXPECT_TRUE(std::holds_alternative<trackchain::schema::secp256k1_signature_t>(
      tx.signature));
}

TEST(transaction_builder, chain_id_is_blake3_of_chain_name) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto expected = trackchain::blake3::hash(std::string_view{"my-chain"});
  EXPECT_EQ(run_builder(builder, "chain-id", "--chain-name my-chain"),
            trackchain::schema::to_hex(expected));
}
