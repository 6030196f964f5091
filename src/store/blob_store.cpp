#include "store/blob_store.hpp"
#include "hash/chunker.hpp"
#include "common/error.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>

namespace blobnet {
namespace store {

std::string key_not_found_message(const std::string& hash_hex) {
  return "Key not found in database [" + hash_hex + "]";
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BlobStore::BlobStore(const hash::Hasher& hasher, uint32_t block_size,
                     const std::optional<std::filesystem::path>& index_dir)
  : hasher_(hasher)
  , block_size_(block_size) {
  if (block_size_ == 0 || block_size_ >= hash::BLOCK_SIZE_LIMIT) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Invalid block size: " << block_size_;
    throw InvalidRequestError("invalid block size: " + std::to_string(block_size_));
  }
  if (index_dir) {
    index_.emplace(*index_dir);
  }
  BOOST_LOG_TRIVIAL(info) << "Blob store: Initialized with block size " << block_size_
                          << " and hash " << hash::algorithm_to_string(hasher_.algorithm());
}

BlobStore::~BlobStore() {
  BOOST_LOG_TRIVIAL(debug) << "Blob store: Destroyed with " << entries_.size() << " entries";
}

std::size_t BlobStore::load_index() {
  if (!index_) {
    return 0;
  }

  std::vector<BlobRecord> records = index_->load_all(hasher_);

  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t restored = 0;
  for (auto& record : records) {
    if (entries_.count(record.hash) > 0) {
      continue;
    }
    auto entry = std::make_shared<StoreEntry>();
    entry->hash = record.hash;
    entry->meta = std::move(record.meta);
    entry->state = EntryState::READY;
    entry->registered_at = Clock::now();
    entry->data_path = std::move(record.data_path);
    entry->present.assign(entry->meta.block_count(), true);
    entry->written = entry->meta.block_count();
    entries_[entry->hash] = entry;
    index_blocks(*entry);
    ++restored;
  }

  ready_cv_.notify_all();
  BOOST_LOG_TRIVIAL(info) << "Blob store: Restored " << restored << " entries";
  return restored;
}

//==============================================
// REGISTRATION
//==============================================

hash::BlobHash BlobStore::register_file(const std::filesystem::path& path, const std::string& label,
                                        std::optional<Clock::duration> timeout) {
  std::error_code ec;
  std::filesystem::path canonical = std::filesystem::weakly_canonical(path, ec);
  if (ec || !std::filesystem::is_regular_file(canonical, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Not a regular file: " << path.string();
    throw IOError("Not a regular file: " + path.string());
  }

  const std::string key = canonical.string();
  std::uintmax_t size = std::filesystem::file_size(canonical, ec);
  std::filesystem::file_time_type mtime = std::filesystem::last_write_time(canonical, ec);
  if (ec) {
    throw IOError("Failed to stat " + key + ": " + ec.message());
  }

  std::promise<hash::BlobHash> promise;
  std::shared_future<hash::BlobHash> job;
  bool joined = false;

  {
    std::lock_guard<std::mutex> lock(mutex_);

    // Unchanged file already registered
    auto record = path_index_.find(key);
    if (record != path_index_.end() && record->second.size == size && record->second.mtime == mtime) {
      auto it = entries_.find(record->second.hash);
      if (it != entries_.end() && it->second->state == EntryState::READY) {
        BOOST_LOG_TRIVIAL(info) << "Blob store: " << key << " already registered as " << record->second.hash;
        return record->second.hash;
      }
    }

    auto running = hashing_jobs_.find(key);
    if (running != hashing_jobs_.end()) {
      job = running->second;
      joined = true;
    } else {
      job = promise.get_future().share();
      hashing_jobs_.emplace(key, job);
      ++hash_jobs_started_;
    }
  }

  if (joined) {
    BOOST_LOG_TRIVIAL(info) << "Blob store: Joining running hashing job for " << key;
    if (timeout && job.wait_for(*timeout) != std::future_status::ready) {
      throw TimeoutError("hashing of " + key + " did not finish in time");
    }
    return job.get();
  }

  try {
    hash::BlobMeta meta = hash::chunk_file(canonical, label, block_size_, hasher_);
    hash::BlobHash result = publish_registered(meta, canonical, key);
    promise.set_value(result);
    return result;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Hashing failed for " << key << ": " << e.what();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      hashing_jobs_.erase(key);
    }
    promise.set_exception(std::current_exception());
    throw;
  }
}

hash::BlobHash BlobStore::publish_registered(const hash::BlobMeta& meta, const std::filesystem::path& path,
                                             const std::string& key) {
  hash::BlobHash blob_hash = meta.blob_hash(hasher_);

  std::error_code ec;
  PathRecord record{std::filesystem::file_size(path, ec), std::filesystem::last_write_time(path, ec), blob_hash};

  std::lock_guard<std::mutex> lock(mutex_);

  auto it = entries_.find(blob_hash);
  if (it == entries_.end() || it->second->state != EntryState::READY) {
    auto entry = std::make_shared<StoreEntry>();
    entry->hash = blob_hash;
    entry->meta = meta;
    entry->state = EntryState::READY;
    entry->registered_at = Clock::now();
    entry->data_path = path;
    entry->present.assign(meta.block_count(), true);
    entry->written = meta.block_count();
    entries_[blob_hash] = entry;
    index_blocks(*entry);
    persist(*entry);
    BOOST_LOG_TRIVIAL(info) << "Blob store: Registered " << key << " as " << blob_hash
                            << " (" << meta.file_size << " bytes, " << meta.block_count() << " blocks)";
  } else {
    BOOST_LOG_TRIVIAL(info) << "Blob store: Content of " << key << " already known as " << blob_hash;
  }

  if (!ec) {
    path_index_[key] = record;
  }
  hashing_jobs_.erase(key);
  ready_cv_.notify_all();
  return blob_hash;
}

bool BlobStore::declare(const hash::BlobHash& hash, const hash::BlobMeta& meta,
                        const std::filesystem::path& data_path, Clock::time_point deadline) {
  meta.validate();

  std::lock_guard<std::mutex> lock(mutex_);

  if (find_live_entry(hash, Clock::now())) {
    BOOST_LOG_TRIVIAL(debug) << "Blob store: " << hash << " already declared";
    return false;
  }

  // Preallocate the destination so blocks can land in any order
  std::error_code ec;
  if (data_path.has_parent_path()) {
    std::filesystem::create_directories(data_path.parent_path(), ec);
  }
  {
    std::ofstream file(data_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "Blob store: Failed to create " << data_path.string();
      throw IOError("Failed to create file: " + data_path.string());
    }
  }
  std::filesystem::resize_file(data_path, meta.file_size, ec);
  if (ec) {
    throw IOError("Failed to allocate " + data_path.string() + ": " + ec.message());
  }

  auto entry = std::make_shared<StoreEntry>();
  entry->hash = hash;
  entry->meta = meta;
  entry->deadline = deadline;
  entry->registered_at = Clock::now();
  entry->data_path = data_path;
  entry->present.assign(meta.block_count(), false);

  // An empty blob has nothing to wait for
  if (meta.block_count() == 0) {
    entry->state = EntryState::READY;
    index_blocks(*entry);
    persist(*entry);
    ready_cv_.notify_all();
  }

  entries_[hash] = entry;
  BOOST_LOG_TRIVIAL(info) << "Blob store: Declared pending " << hash << " at " << data_path.string();
  return true;
}

bool BlobStore::store_block(const hash::BlobHash& hash, std::size_t index, const std::vector<uint8_t>& bytes) {
  std::shared_ptr<StoreEntry> entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entry = find_live_entry(hash, Clock::now());
    if (!entry) {
      throw NotFoundError(key_not_found_message(hash.to_hex()));
    }
    if (entry->state == EntryState::READY) {
      BOOST_LOG_TRIVIAL(debug) << "Blob store: Ignoring block " << index << " for complete " << hash;
      return false;
    }
  }

  bool completed = false;
  {
    std::lock_guard<std::mutex> write_lock(entry->write_mutex);
    const hash::BlobMeta& meta = entry->meta;

    if (index >= meta.block_count()) {
      throw InvalidRequestError("block index out of range: " + std::to_string(index));
    }
    if (bytes.size() != meta.block_length(index)) {
      throw HashMismatchError("block " + std::to_string(index) + " has " + std::to_string(bytes.size()) +
                              " bytes, expected " + std::to_string(meta.block_length(index)));
    }
    if (hasher_.digest(bytes) != meta.block_hashes[index]) {
      throw HashMismatchError("block " + std::to_string(index) + " of " + hash.to_hex() + " failed verification");
    }

    if (entry->present[index]) {
      return false;
    }

    std::fstream file(entry->data_path, std::ios::in | std::ios::out | std::ios::binary);
    if (!file) {
      throw IOError("Failed to open " + entry->data_path.string());
    }
    file.seekp(static_cast<std::streamoff>(meta.block_offset(index)));
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.flush();
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "Blob store: Write failed for block " << index << " of " << hash;
      throw IOError("Failed to write block to " + entry->data_path.string());
    }

    entry->present[index] = true;
    ++entry->written;
    completed = entry->written == meta.block_count();
  }

  if (completed) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Replaced while the last block was written, the other entry stands
    auto current = entries_.find(hash);
    if (current == entries_.end() || current->second != entry) {
      return false;
    }
    entry->state = EntryState::READY;
    entry->registered_at = Clock::now();
    index_blocks(*entry);
    persist(*entry);
    ready_cv_.notify_all();
    BOOST_LOG_TRIVIAL(info) << "Blob store: All blocks of " << hash << " stored";
  }
  return completed;
}

void BlobStore::discard(const hash::BlobHash& hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  remove_entry(hash);
  BOOST_LOG_TRIVIAL(debug) << "Blob store: Discarded " << hash;
}

bool BlobStore::discard_pending(const hash::BlobHash& hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(hash);
  if (it == entries_.end() || it->second->state != EntryState::PENDING) {
    BOOST_LOG_TRIVIAL(debug) << "Blob store: " << hash << " no longer pending, kept";
    return false;
  }
  remove_entry(hash);
  BOOST_LOG_TRIVIAL(debug) << "Blob store: Discarded pending " << hash;
  return true;
}

//==============================================
// QUERY OPERATIONS
//==============================================

hash::BlobMeta BlobStore::lookup(const hash::BlobHash& hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto entry = find_live_entry(hash, Clock::now());
  if (!entry) {
    BOOST_LOG_TRIVIAL(debug) << "Blob store: Lookup miss for " << hash;
    throw NotFoundError(key_not_found_message(hash.to_hex()));
  }
  return entry->meta;
}

std::optional<EntryState> BlobStore::state(const hash::BlobHash& hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto entry = find_live_entry(hash, Clock::now());
  if (!entry) {
    return std::nullopt;
  }
  return entry->state;
}

bool BlobStore::contains(const hash::BlobHash& hash) const {
  return state(hash).has_value();
}

std::filesystem::path BlobStore::data_path(const hash::BlobHash& hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(hash);
  if (it == entries_.end() || it->second->state != EntryState::READY) {
    throw NotFoundError(key_not_found_message(hash.to_hex()));
  }
  return it->second->data_path;
}

std::optional<BlockLocation> BlobStore::find_block(const hash::BlockHash& block_hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto ready = find_ready_block(block_hash);
  if (!ready) {
    return std::nullopt;
  }
  return ready->first;
}

std::vector<uint8_t> BlobStore::read_block(const hash::BlockHash& block_hash) const {
  std::filesystem::path path;
  uint64_t offset = 0;
  uint32_t length = 0;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = find_ready_block(block_hash);
    if (!ready) {
      throw NotFoundError(key_not_found_message(block_hash.to_hex()));
    }
    const StoreEntry& entry = *ready->second;
    path = entry.data_path;
    offset = entry.meta.block_offset(ready->first.index);
    length = entry.meta.block_length(ready->first.index);
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Failed to open " << path.string();
    throw IOError("Failed to open " + path.string());
  }

  std::vector<uint8_t> bytes(length);
  file.seekg(static_cast<std::streamoff>(offset));
  file.read(reinterpret_cast<char*>(bytes.data()), length);
  if (static_cast<uint32_t>(file.gcount()) != length) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Unexpected end of file " << path.string() << " at offset " << offset;
    throw IOError("Unexpected end of file: " + path.string());
  }
  return bytes;
}

bool BlobStore::wait_for(const hash::BlobHash& hash, Clock::duration timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);

  std::shared_ptr<StoreEntry> watched = find_live_entry(hash, Clock::now());
  if (watched && watched->state != EntryState::PENDING) {
    watched.reset();
  }

  bool ready = false;
  ready_cv_.wait_for(lock, timeout, [this, &hash, &watched, &ready]() {
    auto it = entries_.find(hash);
    if (it != entries_.end() && it->second->state == EntryState::READY) {
      ready = true;
      return true;
    }
    // The pending entry being waited on was discarded or expired
    return watched && (it == entries_.end() || it->second != watched || watched->deadline <= Clock::now());
  });
  return ready;
}

//==============================================
// EXPIRY
//==============================================

std::size_t BlobStore::expire(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<hash::BlobHash> expired;
  for (const auto& [hash, entry] : entries_) {
    if (entry->state == EntryState::PENDING && entry->deadline <= now) {
      expired.push_back(hash);
    }
  }

  for (const auto& hash : expired) {
    BOOST_LOG_TRIVIAL(info) << "Blob store: Pending entry " << hash << " expired";
    remove_entry(hash);
  }
  return expired.size();
}

std::size_t BlobStore::evict_older_than(Clock::duration lifetime, Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<hash::BlobHash> evicted;
  for (const auto& [hash, entry] : entries_) {
    if (entry->state == EntryState::READY && now - entry->registered_at > lifetime) {
      evicted.push_back(hash);
    }
  }

  for (const auto& hash : evicted) {
    BOOST_LOG_TRIVIAL(info) << "Blob store: Evicting " << hash;
    remove_entry(hash);
  }
  return evicted.size();
}

//==============================================
// GETTERS
//==============================================

std::size_t BlobStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::size_t BlobStore::hash_jobs_started() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return hash_jobs_started_;
}

//==============================================
// HELPERS
//==============================================

std::shared_ptr<BlobStore::StoreEntry> BlobStore::find_live_entry(const hash::BlobHash& hash,
                                                                   Clock::time_point now) const {
  auto it = entries_.find(hash);
  if (it == entries_.end()) {
    return nullptr;
  }
  // Expired pending entries are gone even before the sweeper runs
  if (it->second->state == EntryState::PENDING && it->second->deadline <= now) {
    return nullptr;
  }
  return it->second;
}

std::optional<std::pair<BlockLocation, std::shared_ptr<BlobStore::StoreEntry>>>
BlobStore::find_ready_block(const hash::BlockHash& block_hash) const {
  auto range = block_index_.equal_range(block_hash);
  for (auto location = range.first; location != range.second; ++location) {
    auto it = entries_.find(location->second.blob);
    if (it != entries_.end() && it->second->state == EntryState::READY) {
      return std::make_pair(location->second, it->second);
    }
  }
  return std::nullopt;
}

void BlobStore::index_blocks(const StoreEntry& entry) {
  for (std::size_t i = 0; i < entry.meta.block_hashes.size(); ++i) {
    block_index_.emplace(entry.meta.block_hashes[i], BlockLocation{entry.hash, i});
  }
}

void BlobStore::unindex_blocks(const StoreEntry& entry) {
  for (const auto& block_hash : entry.meta.block_hashes) {
    auto range = block_index_.equal_range(block_hash);
    for (auto location = range.first; location != range.second;) {
      if (location->second.blob == entry.hash) {
        location = block_index_.erase(location);
      } else {
        ++location;
      }
    }
  }
}

void BlobStore::remove_entry(const hash::BlobHash& hash) {
  auto it = entries_.find(hash);
  if (it == entries_.end()) {
    return;
  }

  unindex_blocks(*it->second);

  for (auto record = path_index_.begin(); record != path_index_.end();) {
    if (record->second.hash == hash) {
      record = path_index_.erase(record);
    } else {
      ++record;
    }
  }

  if (it->second->state == EntryState::READY) {
    persist_removal(hash);
  }
  entries_.erase(it);
  ready_cv_.notify_all();
}

void BlobStore::persist(const StoreEntry& entry) {
  if (index_ && !index_->save(BlobRecord{entry.hash, entry.meta, entry.data_path})) {
    BOOST_LOG_TRIVIAL(warning) << "Blob store: " << entry.hash << " is served but will not survive a restart";
  }
}

void BlobStore::persist_removal(const hash::BlobHash& hash) {
  if (index_ && !index_->remove(hash)) {
    BOOST_LOG_TRIVIAL(warning) << "Blob store: Stale descriptor of " << hash << " left behind";
  }
}

} // namespace store
} // namespace blobnet
