#pragma once

#include <trackchain/blake3/hash.hpp>
#include <trackchain/execution/engine.hpp>
#include <trackchain/schema/genesis_state.hpp>
#include <trackchain/schema/primitives.hpp>
#include <trackchain/storage/rocksdb/storage.hpp>
#include <trackchain/testing/common.hpp>
#include <trackchain/testing/execution_harness.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace trackchain::testing {

/// Engine over a fresh RocksDB directory with a genesis naming `admin()` as
/// administrator. Blocks are numbered and nonces tracked per signer so a test
/// can submit payloads one call at a time.
class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix,
                             const bool strict_crypto = false,
                             const bool initialize_chain = true)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{trackchain::storage::make_storage<
            trackchain::storage::rocksdb_storage_tag>(db_path_)},
        engine_{encoder_, storage_, strict_crypto} {
    if (initialize_chain) {
      EXPECT_TRUE(engine_.init_chain(genesis()));
    }
  }

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  ~execution_fixture() { remove_path(db_path_); }

  const std::string& db_path() const { return db_path_; }

  scale_encoder_t& encoder() { return encoder_; }

  trackchain::storage::storage<trackchain::storage::rocksdb_storage_tag>&
  storage() {
    return storage_;
  }

  trackchain::execution::engine& engine() { return engine_; }

  static trackchain::schema::identity_t admin() {
    return make_named_identity(0xA0);
  }

  static trackchain::schema::hash32_t chain_id() {
    return trackchain::blake3::hash(kTestChainName);
  }

  static trackchain::schema::genesis_state_t genesis() {
    return trackchain::schema::genesis_state_t{
        .chain_id = chain_id(), .admins = {admin()}, .genesis_time = 1000};
  }

  /// Build a transaction for `signer` carrying the signer's next nonce.
  trackchain::schema::bytes_t make_tx(
      const trackchain::schema::identity_t& signer,
      const trackchain::schema::transaction_payload_t& payload) {
    return encode_transaction(
        make_transaction(chain_id(), next_nonce(signer), signer, payload));
  }

  /// Execute a block of one transaction and commit it.
  trackchain::schema::transaction_result_t submit(
      const trackchain::schema::identity_t& signer,
      const trackchain::schema::transaction_payload_t& payload) {
    auto results = submit_block({{signer, payload}});
    return results.front();
  }

  /// Execute one block holding every (signer, payload) pair in order, commit,
  /// and return the per-transaction results.
  std::vector<trackchain::schema::transaction_result_t> submit_block(
      const std::vector<std::pair<trackchain::schema::identity_t,
                                  trackchain::schema::transaction_payload_t>>&
          calls) {
    auto txs = std::vector<trackchain::schema::bytes_t>{};
    auto signers = std::vector<trackchain::schema::identity_t>{};
    for (const auto& [signer, payload] : calls) {
      txs.push_back(make_tx(signer, payload));
      signers.push_back(signer);
    }
    auto block = engine_.finalize_block(++height_, block_time_, txs);
    EXPECT_EQ(block.tx_results.size(), txs.size());
    for (std::size_t i = 0; i < signers.size(); ++i) {
      if (block.tx_results[i].code != 0) {
        --nonces_[trackchain::schema::to_string(signers[i])];
      }
    }
    (void)engine_.commit();
    block_time_ += 1000;
    return block.tx_results;
  }

  uint64_t height() const { return height_; }
  trackchain::schema::timestamp_milliseconds_t block_time() const {
    return block_time_;
  }
  void set_block_time(trackchain::schema::timestamp_milliseconds_t value) {
    block_time_ = value;
  }

 private:
  uint64_t next_nonce(const trackchain::schema::identity_t& signer) {
    return ++nonces_[trackchain::schema::to_string(signer)];
  }

  std::string db_path_;
  scale_encoder_t encoder_;
  trackchain::storage::storage<trackchain::storage::rocksdb_storage_tag>
      storage_;
  trackchain::execution::engine engine_;
  std::map<std::string, uint64_t> nonces_;
  uint64_t height_{};
  trackchain::schema::timestamp_milliseconds_t block_time_{10'000};
};

}  // namespace trackchain::testing
