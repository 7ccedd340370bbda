#pragma once

#include <trackchain/execution/event_observer.hpp>
#include <trackchain/execution/signature_verifier.hpp>
#include <trackchain/execution/state_overlay.hpp>
#include <trackchain/execution/transition_engine.hpp>
#include <trackchain/schema/app_info.hpp>
#include <trackchain/schema/block_result.hpp>
#include <trackchain/schema/commit_result.hpp>
#include <trackchain/schema/custody_entry.hpp>
#include <trackchain/schema/custody_event_record.hpp>
#include <trackchain/schema/genesis_state.hpp>
#include <trackchain/schema/history_entry.hpp>
#include <trackchain/schema/primitives.hpp>
#include <trackchain/schema/product_state.hpp>
#include <trackchain/schema/query_result.hpp>
#include <trackchain/schema/role_id.hpp>
#include <trackchain/schema/transaction.hpp>
#include <trackchain/schema/transaction_result.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace trackchain::execution {

/// Deterministic custody state machine driven by an external ordering
/// substrate.
///
/// The engine authenticates transactions, runs each one through the
/// transition engine inside its own write set, persists state, history and
/// custody events on commit, and exposes the committed state through queries
/// and typed readers.
class engine final {
 public:
  /// Construct the engine over encoder/storage backends.
  ///
  /// `require_strict_crypto` enables real signature verification; when false,
  /// signatures are not checked and named identities may sign.
  explicit engine(encoder_t& encoder,
                  storage_t& storage,
                  bool require_strict_crypto = true);

  /// Record chain id and administrators. Only the first call has an effect;
  /// later calls return false.
  bool init_chain(const trackchain::schema::genesis_state_t& genesis);

  /// Admission check (decode + envelope validation) without mutating state.
  trackchain::schema::transaction_result_t check_transaction(
      const trackchain::schema::bytes_view_t& raw_tx);

  /// Execute a candidate block and compute its resulting state root.
  ///
  /// Transactions are processed in order; per-tx results are returned even
  /// on failures. `block_time` earlier than the last committed block time is
  /// raised to it.
  trackchain::schema::block_result_t finalize_block(
      uint64_t height,
      trackchain::schema::timestamp_milliseconds_t block_time,
      const std::vector<trackchain::schema::bytes_t>& txs);

  /// Persist the finalized block in one atomic write, then notify observers.
  trackchain::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state root).
  trackchain::schema::app_info_t info() const;

  /// Execute a read-path query against committed state by route.
  trackchain::schema::query_result_t query(
      std::string_view path,
      const trackchain::schema::bytes_view_t& data);

  /// Return history entries in the inclusive height range.
  std::vector<trackchain::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Return committed custody events in the inclusive id range.
  std::vector<trackchain::schema::custody_event_record_t> events(
      uint64_t from_event_id,
      uint64_t to_event_id) const;

  /// Product record, or a default record for unknown ids.
  trackchain::schema::product_state_t product(
      const trackchain::schema::product_id_t& product_id) const;

  std::optional<trackchain::schema::identity_t> owner_of(
      const trackchain::schema::product_id_t& product_id) const;

  bool has_role(const trackchain::schema::identity_t& subject,
                trackchain::schema::role_id_t role) const;

  std::vector<trackchain::schema::custody_entry_t> custody_history(
      const trackchain::schema::product_id_t& product_id) const;

  std::vector<trackchain::schema::custody_entry_t> custody_history(
      const trackchain::schema::product_id_t& product_id,
      uint64_t offset,
      uint64_t limit) const;

  std::optional<trackchain::schema::hash32_t> chain_id() const;

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  /// Register a post-commit custody event observer.
  void subscribe(event_observer_t observer);

 private:
  /// Validate envelope, nonce and signature against `state`.
  trackchain::schema::transaction_result_t validate_transaction(
      const trackchain::schema::transaction_t& tx,
      const state_overlay& state,
      std::string_view codespace) const;

  trackchain::schema::query_result_t query_locked(
      std::string_view path,
      const trackchain::schema::bytes_view_t& data);

  void notify_observers(
      const std::vector<trackchain::schema::custody_event_record_t>& events,
      const std::vector<event_observer_t>& observers) const;

  /// Load committed checkpoint and genesis from storage at startup.
  void load_persisted_state();

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  transition_engine transitions_;
  int64_t last_committed_height_{};
  trackchain::schema::hash32_t last_committed_state_root_;
  trackchain::schema::timestamp_milliseconds_t last_block_time_{};
  bool has_pending_block_{false};
  int64_t pending_height_{};
  trackchain::schema::hash32_t pending_state_root_;
  trackchain::schema::timestamp_milliseconds_t pending_block_time_{};
  write_set_t pending_writes_;
  std::vector<trackchain::schema::custody_event_record_t> pending_events_;
  std::optional<trackchain::schema::hash32_t> chain_id_;
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
  std::vector<event_observer_t> observers_;
};

}  // namespace trackchain::execution
