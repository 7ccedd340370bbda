#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <trackchain/blake3/hash.hpp>
#include <trackchain/crypto/verify.hpp>
#include <trackchain/execution/custody_state.hpp>
#include <trackchain/execution/engine.hpp>
#include <trackchain/schema/key/engine_keys.hpp>
#include <trackchain/schema/transaction_error_code.hpp>
#include <string>
#include <tuple>
#include <utility>

using namespace trackchain::schema;

namespace {

using trackchain::execution::encoder_t;

constexpr auto kCheckCodespace = std::string_view{"trackchain.checktx"};
constexpr auto kFinalizeCodespace = std::string_view{"trackchain.finalize"};
constexpr auto kQueryCodespace = std::string_view{"trackchain.query"};

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_t& tx,
                         uint64_t height,
                         uint64_t index) {
  auto material = bytes_t{};
  material.reserve(seed.size() + tx.size() + 32);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return trackchain::blake3::hash(
      bytes_view_t{material.data(), material.size()});
}

transaction_result_t make_tx_error(const transaction_error_code code,
                                   std::string_view codespace,
                                   std::string log,
                                   std::string info) {
  return transaction_result_t{.code = static_cast<uint32_t>(code),
                              .log = std::move(log),
                              .info = std::move(info),
                              .codespace = std::string{codespace}};
}

bool signature_matches_signer(const identity_t& signer,
                              const signature_t& signature) {
  return std::visit(
      overloaded{[&](const ed25519_identity&) {
                   return std::holds_alternative<ed25519_signature_t>(
                       signature);
                 },
                 [&](const secp256k1_identity&) {
                   return std::holds_alternative<secp256k1_signature_t>(
                       signature);
                 },
                 [](const named_identity_t&) { return true; }},
      signer);
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const bytes_view_t& key,
                                int64_t height) {
  return query_result_t{.code = static_cast<uint32_t>(code),
                        .log = std::move(log),
                        .key = make_bytes(key),
                        .height = height,
                        .codespace = std::string{kQueryCodespace}};
}

}  // namespace

namespace trackchain::execution {

engine::engine(encoder_t& encoder,
               storage_t& storage,
               bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      require_strict_crypto_{require_strict_crypto},
      signature_verifier_{trackchain::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  last_committed_state_root_ = make_zero_hash();
  pending_state_root_ = last_committed_state_root_;
  load_persisted_state();
  if (!require_strict_crypto_) {
    spdlog::warn("Strict crypto disabled; signatures will not be verified");
  } else if (!trackchain::crypto::available()) {
    spdlog::warn("OpenSSL lacks ed25519 or secp256k1 support");
  }
  spdlog::info("Execution engine ready at height {}", last_committed_height_);
}

bool engine::init_chain(const genesis_state_t& genesis) {
  auto lock = std::scoped_lock{mutex_};
  if (chain_id_.has_value()) {
    spdlog::warn("Chain already initialized; ignoring genesis");
    return false;
  }
  if (genesis.admins.empty()) {
    spdlog::warn("Genesis names no administrators; roles can never be granted");
  }

  auto state = custody_state{encoder_, storage_};
  auto null_identity = make_null_identity();
  for (const auto& admin : genesis.admins) {
    state.identities().assign(admin, role_id_t::admin, true, null_identity,
                              genesis.genesis_time);
    spdlog::info("Genesis administrator {}", to_string(admin));
  }
  state.overlay().put(key::make_chain_key(encoder_), genesis);

  auto writes = state.overlay().take_writes();
  auto entries = std::vector<trackchain::storage::key_value_entry_t>{
      std::make_move_iterator(std::begin(writes)),
      std::make_move_iterator(std::end(writes))};
  auto encoded_genesis = encoder_.encode(genesis);
  auto state_root = trackchain::blake3::hash(
      bytes_view_t{encoded_genesis.data(), encoded_genesis.size()});
  storage_.commit_batch(entries,
                        trackchain::storage::committed_state{
                            .height = last_committed_height_,
                            .state_root = state_root,
                            .block_time = genesis.genesis_time});

  last_committed_state_root_ = state_root;
  pending_state_root_ = state_root;
  last_block_time_ = genesis.genesis_time;
  chain_id_ = genesis.chain_id;
  spdlog::info("Initialized chain {}", to_hex(genesis.chain_id));
  return true;
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto maybe_tx = encoder_.try_decode<transaction_t>(raw_tx);
  if (!maybe_tx) {
    return make_tx_error(transaction_error_code::invalid_transaction,
                         kCheckCodespace, "invalid transaction",
                         "failed to decode transaction bytes");
  }
  auto state = state_overlay{encoder_, storage_, &pending_writes_};
  return validate_transaction(maybe_tx.value(), state, kCheckCodespace);
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const state_overlay& state,
    std::string_view codespace) const {
  if (tx.version != 1) {
    return make_tx_error(transaction_error_code::unsupported_transaction_version,
                         codespace, "unsupported transaction version",
                         "expected version 1");
  }
  if (!chain_id_.has_value() || tx.chain_id != chain_id_.value()) {
    return make_tx_error(transaction_error_code::invalid_chain_id, codespace,
                         "invalid chain id", to_hex(tx.chain_id));
  }

  auto stored_nonce =
      state.get<uint64_t>(key::make_nonce_key(encoder_, tx.signer)).value_or(0);
  if (tx.nonce != stored_nonce + 1) {
    return make_tx_error(transaction_error_code::invalid_nonce, codespace,
                         "invalid nonce",
                         "expected " + std::to_string(stored_nonce + 1));
  }

  if (!signature_matches_signer(tx.signer, tx.signature)) {
    return make_tx_error(transaction_error_code::invalid_signature_type,
                         codespace, "signature type does not match signer",
                         to_string(tx.signer));
  }
  if (!require_strict_crypto_) {
    return transaction_result_t{};
  }
  if (std::holds_alternative<named_identity_t>(tx.signer)) {
    return make_tx_error(transaction_error_code::invalid_signature_type,
                         codespace, "named identities cannot sign",
                         to_string(tx.signer));
  }
  auto message = make_signing_message(encoder_, tx);
  if (!signature_verifier_(bytes_view_t{message.data(), message.size()},
                           tx.signer, tx.signature)) {
    return make_tx_error(transaction_error_code::signature_verification_failed,
                         codespace, "signature verification failed",
                         to_string(tx.signer));
  }
  return transaction_result_t{};
}

block_result_t engine::finalize_block(uint64_t height,
                                      timestamp_milliseconds_t block_time,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  if (has_pending_block_) {
    spdlog::warn("Discarding uncommitted block at height {}", pending_height_);
  }
  pending_writes_.clear();
  pending_events_.clear();

  if (block_time < last_block_time_) {
    spdlog::warn("Block time {} precedes last committed time {}; clamping",
                 block_time, last_block_time_);
    block_time = last_block_time_;
  }

  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());
  auto rolling_root = last_committed_state_root_;

  for (size_t i = 0; i < txs.size(); ++i) {
    auto index = static_cast<uint32_t>(i);
    auto tx_result = transaction_result_t{};
    auto maybe_tx = encoder_.try_decode<transaction_t>(
        bytes_view_t{txs[i].data(), txs[i].size()});
    if (!maybe_tx) {
      tx_result = make_tx_error(transaction_error_code::invalid_transaction,
                                kFinalizeCodespace, "invalid transaction",
                                "failed to decode transaction bytes");
    } else {
      auto scope = custody_state{encoder_, storage_, &pending_writes_};
      tx_result =
          validate_transaction(maybe_tx.value(), scope.overlay(),
                               kFinalizeCodespace);
      if (tx_result.code == 0) {
        auto context = call_context{.caller = maybe_tx->signer,
                                    .timestamp = block_time,
                                    .height = height,
                                    .tx_index = index};
        tx_result = transitions_.execute(scope, context, maybe_tx->payload);
      }
      if (tx_result.code == 0) {
        scope.overlay().put(key::make_nonce_key(encoder_, maybe_tx->signer),
                            maybe_tx->nonce);
        for (auto& [key, value] : scope.overlay().take_writes()) {
          pending_writes_.insert_or_assign(key, std::move(value));
        }
        pending_events_.insert(std::end(pending_events_),
                               std::begin(scope.staged_events()),
                               std::end(scope.staged_events()));
        rolling_root = fold_state_root(rolling_root, txs[i], height, i);
      }
    }

    pending_writes_.insert_or_assign(
        key::make_history_key(encoder_, height, index),
        encoder_.encode(history_entry_t{.height = height,
                                        .index = index,
                                        .block_time = block_time,
                                        .code = tx_result.code,
                                        .codespace = tx_result.codespace,
                                        .tx = txs[i]}));
    if (tx_result.code != 0) {
      spdlog::debug("Transaction {} at height {} failed with code {}: {}",
                    index, height, tx_result.code, tx_result.log);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  has_pending_block_ = true;
  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  pending_block_time_ = block_time;
  result.state_root = rolling_root;
  result.staged_events = pending_events_.size();
  return result;
}

commit_result_t engine::commit() {
  auto events = std::vector<custody_event_record_t>{};
  auto observers = std::vector<event_observer_t>{};
  auto result = commit_result_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    if (has_pending_block_) {
      auto entries = std::vector<trackchain::storage::key_value_entry_t>{
          std::make_move_iterator(std::begin(pending_writes_)),
          std::make_move_iterator(std::end(pending_writes_))};
      storage_.commit_batch(entries, trackchain::storage::committed_state{
                                         .height = pending_height_,
                                         .state_root = pending_state_root_,
                                         .block_time = pending_block_time_});
      last_committed_height_ = pending_height_;
      last_committed_state_root_ = pending_state_root_;
      last_block_time_ = pending_block_time_;
      events = std::move(pending_events_);
      observers = observers_;
      pending_writes_.clear();
      pending_events_.clear();
      has_pending_block_ = false;
      spdlog::info("Committed height {} with {} custody event(s)",
                   last_committed_height_, events.size());
    }
    result.committed_height = last_committed_height_;
    result.state_root = last_committed_state_root_;
    result.published_events = events.size();
  }
  notify_observers(events, observers);
  return result;
}

void engine::notify_observers(
    const std::vector<custody_event_record_t>& events,
    const std::vector<event_observer_t>& observers) const {
  for (const auto& event : events) {
    for (const auto& observer : observers) {
      try {
        observer(event);
      } catch (const std::exception& ex) {
        spdlog::error("Custody event observer failed for event {}: {}",
                      event.event_id, ex.what());
      }
    }
  }
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  result.last_block_time = last_block_time_;
  return result;
}

query_result_t engine::query(std::string_view path, const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  return query_locked(path, data);
}

query_result_t engine::query_locked(std::string_view path,
                                    const bytes_view_t& data) {
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};
  auto state = custody_state{encoder_, storage_};

  if (path == "/engine/info") {
    auto app = app_info_t{};
    app.last_block_height = last_committed_height_;
    app.last_block_state_root = last_committed_state_root_;
    app.last_block_time = last_block_time_;
    result.value = encoder_.encode(app);
    return result;
  }
  if (path == "/engine/keyspaces") {
    auto keyspaces = std::vector<std::string>{};
    for (const auto& keyspace : key::kEngineKeyspaces) {
      keyspaces.emplace_back(keyspace);
    }
    result.value = encoder_.encode(keyspaces);
    return result;
  }
  if (path == "/state/product" || path == "/state/owner") {
    auto product_id = encoder_.try_decode<product_id_t>(data);
    if (!product_id) {
      return make_query_error(query_error_code::invalid_key,
                              "expected product id key", data, result.height);
    }
    if (path == "/state/product") {
      auto product = state.products().get(product_id.value());
      if (!product) {
        return make_query_error(query_error_code::not_found,
                                "product not found", data, result.height);
      }
      result.value = encoder_.encode(product.value());
    } else {
      auto owner = state.ownership().owner_of(product_id.value());
      if (!owner) {
        return make_query_error(query_error_code::not_found,
                                "product not found", data, result.height);
      }
      result.value = encoder_.encode(owner.value());
    }
    return result;
  }
  if (path == "/state/role") {
    auto role_key =
        encoder_.try_decode<std::tuple<identity_t, role_id_t>>(data);
    if (!role_key) {
      return make_query_error(query_error_code::invalid_key,
                              "expected (identity, role) key", data,
                              result.height);
    }
    auto assignment = state.identities().assignment(
        std::get<0>(role_key.value()), std::get<1>(role_key.value()));
    if (!assignment) {
      return make_query_error(query_error_code::not_found,
                              "role assignment not found", data,
                              result.height);
    }
    result.value = encoder_.encode(assignment.value());
    return result;
  }
  if (path == "/custody/history") {
    auto page =
        encoder_.try_decode<std::tuple<product_id_t, uint64_t, uint64_t>>(
            data);
    if (!page) {
      return make_query_error(query_error_code::invalid_key,
                              "expected (product id, offset, limit) key",
                              data, result.height);
    }
    const auto& [product_id, offset, limit] = page.value();
    if (!state.products().exists(product_id)) {
      return make_query_error(query_error_code::not_found,
                              "product not found", data, result.height);
    }
    result.value =
        encoder_.encode(state.ledger().history(product_id, offset, limit));
    return result;
  }
  if (path == "/history/range" || path == "/events/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range || std::get<0>(range.value()) > std::get<1>(range.value())) {
      return make_query_error(query_error_code::invalid_key,
                              "expected (from, to) range key", data,
                              result.height);
    }
    auto from = std::get<0>(range.value());
    auto to = std::get<1>(range.value());
    if (path == "/history/range") {
      auto rows = std::vector<history_entry_t>{};
      for (const auto& [key, value] : storage_.list_by_prefix(
               key::make_prefix_key(encoder_, key::kHistoryPrefix))) {
        auto position = key::parse_history_key(encoder_, key);
        if (position && position->first >= from && position->first <= to) {
          rows.push_back(encoder_.decode<history_entry_t>(value));
        }
      }
      result.value = encoder_.encode(rows);
    } else {
      auto rows = std::vector<custody_event_record_t>{};
      for (const auto& [key, value] : storage_.list_by_prefix(
               key::make_prefix_key(encoder_, key::kEventPrefix))) {
        auto event_id = key::parse_event_key(encoder_, key);
        if (event_id && event_id.value() >= from && event_id.value() <= to) {
          rows.push_back(encoder_.decode<custody_event_record_t>(value));
        }
      }
      result.value = encoder_.encode(rows);
    }
    return result;
  }

  return make_query_error(query_error_code::unsupported_path,
                          "unsupported path", data, result.height);
}

std::vector<history_entry_t> engine::history(uint64_t from_height,
                                             uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  auto rows = std::vector<history_entry_t>{};
  for (const auto& [key, value] : storage_.list_by_prefix(
           key::make_prefix_key(encoder_, key::kHistoryPrefix))) {
    auto position = key::parse_history_key(encoder_, key);
    if (!position || position->first < from_height) {
      continue;
    }
    if (position->first > to_height) {
      break;
    }
    rows.push_back(encoder_.decode<history_entry_t>(value));
  }
  return rows;
}

std::vector<custody_event_record_t> engine::events(
    uint64_t from_event_id,
    uint64_t to_event_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto rows = std::vector<custody_event_record_t>{};
  for (const auto& [key, value] : storage_.list_by_prefix(
           key::make_prefix_key(encoder_, key::kEventPrefix))) {
    auto event_id = key::parse_event_key(encoder_, key);
    if (!event_id || event_id.value() < from_event_id) {
      continue;
    }
    if (event_id.value() > to_event_id) {
      break;
    }
    rows.push_back(encoder_.decode<custody_event_record_t>(value));
  }
  return rows;
}

product_state_t engine::product(const product_id_t& product_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = custody_state{encoder_, storage_};
  return state.products().get(product_id).value_or(product_state_t{});
}

std::optional<identity_t> engine::owner_of(
    const product_id_t& product_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = custody_state{encoder_, storage_};
  return state.ownership().owner_of(product_id);
}

bool engine::has_role(const identity_t& subject, const role_id_t role) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = custody_state{encoder_, storage_};
  return state.identities().has_role(subject, role);
}

std::vector<custody_entry_t> engine::custody_history(
    const product_id_t& product_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = custody_state{encoder_, storage_};
  return state.ledger().history(product_id);
}

std::vector<custody_entry_t> engine::custody_history(
    const product_id_t& product_id,
    uint64_t offset,
    uint64_t limit) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = custody_state{encoder_, storage_};
  return state.ledger().history(product_id, offset, limit);
}

std::optional<hash32_t> engine::chain_id() const {
  auto lock = std::scoped_lock{mutex_};
  return chain_id_;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!require_strict_crypto_) {
    spdlog::warn("Ignoring signature verifier; strict crypto is disabled");
    return;
  }
  signature_verifier_ = std::move(verifier);
}

void engine::subscribe(event_observer_t observer) {
  auto lock = std::scoped_lock{mutex_};
  observers_.push_back(std::move(observer));
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    last_block_time_ = committed->block_time;
    pending_state_root_ = committed->state_root;
  }
  auto genesis = storage_.get<encoder_t, genesis_state_t>(
      encoder_, key::make_chain_key(encoder_));
  if (genesis) {
    chain_id_ = genesis->chain_id;
  }
}

}  // namespace trackchain::execution
