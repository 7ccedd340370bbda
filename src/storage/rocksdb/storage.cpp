#include <trackchain/common/critical.hpp>
#include <trackchain/storage/rocksdb/storage.hpp>

#include <filesystem>
#include <string>
#include <system_error>
#include <tuple>

namespace trackchain::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto directory = std::filesystem::path{std::string{path}};
  auto error = std::error_code{};
  if (directory.has_parent_path()) {
    std::filesystem::create_directories(directory.parent_path(), error);
    if (error) {
      spdlog::error("Cannot create parent directory for {}: {}", path,
                    error.message());
      trackchain::common::critical("Cannot create custody store directory");
    }
  }

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.keep_log_file_num = 4;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::Open(options, directory.string(),
                                            &database);
  if (!status.ok()) {
    spdlog::error("Custody store at {} did not open: {}", path,
                  status.ToString());
    trackchain::common::critical("Failed to open custody store");
  }
  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);

  auto checkpoint = store.load_committed_state();
  if (checkpoint) {
    spdlog::info("Opened custody store at {} (height {})", path,
                 checkpoint->height);
  } else {
    spdlog::info("Opened empty custody store at {}", path);
  }
  return store;
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = get_bytes(trackchain::schema::make_bytes_view(
      detail::kCommittedStateKey));
  if (!raw) {
    return std::nullopt;
  }

  auto encoder = detail::encoder_t{};
  auto decoded = encoder.try_decode<
      std::tuple<int64_t, trackchain::schema::hash32_t,
                 trackchain::schema::timestamp_milliseconds_t>>(
      trackchain::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value()) {
    trackchain::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value()),
                         .block_time = std::get<2>(decoded.value())};
}

std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const trackchain::schema::bytes_view_t& prefix) const {
  if (!database) {
    trackchain::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    trackchain::common::critical("RocksDB iteration failed");
  }
  return entries;
}

void storage<rocksdb_storage_tag>::commit_batch(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) const {
  if (!database) {
    trackchain::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(
        detail::to_slice(trackchain::schema::bytes_view_t{key}),
        detail::to_slice(trackchain::schema::bytes_view_t{value}));
    if (!put_status.ok()) {
      trackchain::common::critical("failed staging key in commit batch");
    }
  }

  auto encoder = detail::encoder_t{};
  auto encoded_state = encoder.encode(
      std::tuple{state.height, state.state_root, state.block_time});
  auto state_status = batch.Put(
      std::string{detail::kCommittedStateKey},
      detail::to_slice(trackchain::schema::bytes_view_t{encoded_state}));
  if (!state_status.ok()) {
    trackchain::common::critical("failed staging committed state");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit batch: {}", write_status.ToString());
    trackchain::common::critical("failed to commit block batch");
  }
}

}  // namespace trackchain::storage
