#ifndef BLOBNET_STORE_BLOB_STORE_HPP
#define BLOBNET_STORE_BLOB_STORE_HPP

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "hash/blob_meta.hpp"
#include "hash/hasher.hpp"
#include "store/blob_index.hpp"

namespace blobnet {
namespace store {

using Clock = std::chrono::steady_clock;

enum class EntryState {
  PENDING,
  READY
};

// Where a block hash can be read from locally
struct BlockLocation {
  hash::BlobHash blob;
  std::size_t index;
};

/**
 * Content-addressed registry of blobs known to this node.
 *
 * READY entries point at a local file holding every block. PENDING
 * entries are downloads in progress; they carry a deadline and vanish
 * when it passes. The entry map is guarded by one mutex held only for
 * lookups, block writes are serialized per entry.
 *
 * With an index directory, READY entries are persisted as descriptors
 * and restored by load_index().
 */
class BlobStore {
public:
  // Delete copy operations, entries are shared with in-flight writers
  BlobStore(const BlobStore&) = delete;
  BlobStore& operator=(const BlobStore&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  BlobStore(const hash::Hasher& hasher, uint32_t block_size,
            const std::optional<std::filesystem::path>& index_dir = std::nullopt);
  ~BlobStore();

  // Restores READY entries persisted under the index directory, returns the count
  std::size_t load_index();


  // ---- REGISTRATION ----
  // Hashes a local file and registers it READY. Repeated or concurrent
  // calls for the same file share one hashing job. A joining caller gives
  // up with TimeoutError after timeout.
  hash::BlobHash register_file(const std::filesystem::path& path, const std::string& label,
                               std::optional<Clock::duration> timeout = std::nullopt);
  // Creates a PENDING entry backed by data_path (preallocated). Returns
  // false when the hash is already READY or pending.
  bool declare(const hash::BlobHash& hash, const hash::BlobMeta& meta,
               const std::filesystem::path& data_path, Clock::time_point deadline);
  // Verifies and writes one block of a PENDING entry. Returns true when
  // this write completed the entry.
  bool store_block(const hash::BlobHash& hash, std::size_t index, const std::vector<uint8_t>& bytes);
  // Forgets an entry, its file is left in place
  void discard(const hash::BlobHash& hash);
  // Forgets the entry only while it is still PENDING
  bool discard_pending(const hash::BlobHash& hash);


  // ---- QUERY OPERATIONS ----
  // Throws NotFoundError for unknown or expired hashes
  hash::BlobMeta lookup(const hash::BlobHash& hash) const;
  std::optional<EntryState> state(const hash::BlobHash& hash) const;
  bool contains(const hash::BlobHash& hash) const;
  // Local file of a READY entry, throws NotFoundError otherwise
  std::filesystem::path data_path(const hash::BlobHash& hash) const;
  std::optional<BlockLocation> find_block(const hash::BlockHash& block_hash) const;
  // Reads a block of a READY entry by its hash, throws NotFoundError or IOError
  std::vector<uint8_t> read_block(const hash::BlockHash& block_hash) const;
  // Waits until the hash is READY or the timeout elapses. When a PENDING
  // entry exists on entry, also returns (false) once that entry is gone.
  bool wait_for(const hash::BlobHash& hash, Clock::duration timeout) const;


  // ---- EXPIRY ----
  // Removes PENDING entries whose deadline has passed
  std::size_t expire(Clock::time_point now = Clock::now());
  // Removes READY entries registered before now - lifetime
  std::size_t evict_older_than(Clock::duration lifetime, Clock::time_point now = Clock::now());


  // ---- GETTERS ----
  std::size_t size() const;
  std::size_t hash_jobs_started() const;
  const hash::Hasher& hasher() const { return hasher_; }
  uint32_t block_size() const { return block_size_; }

private:
  struct StoreEntry {
    hash::BlobHash hash;
    hash::BlobMeta meta;
    EntryState state = EntryState::PENDING;
    Clock::time_point deadline;
    Clock::time_point registered_at;
    std::filesystem::path data_path;

    // Guards block writes of a PENDING entry
    std::mutex write_mutex;
    std::vector<bool> present;
    std::size_t written = 0;
  };

  // Cached result of hashing a source file
  struct PathRecord {
    std::uintmax_t size;
    std::filesystem::file_time_type mtime;
    hash::BlobHash hash;
  };

  // ---- PARAMETERS ----
  hash::Hasher hasher_;
  uint32_t block_size_;

  mutable std::mutex mutex_;
  mutable std::condition_variable ready_cv_;
  std::unordered_map<hash::BlobHash, std::shared_ptr<StoreEntry>> entries_;
  // Identical blocks of different blobs each keep their own location
  std::unordered_multimap<hash::BlockHash, BlockLocation> block_index_;
  std::map<std::string, PathRecord> path_index_;
  std::map<std::string, std::shared_future<hash::BlobHash>> hashing_jobs_;
  std::size_t hash_jobs_started_ = 0;
  std::optional<BlobIndex> index_;


  // ---- HELPERS (mutex_ held) ----
  std::shared_ptr<StoreEntry> find_live_entry(const hash::BlobHash& hash, Clock::time_point now) const;
  // First location of block_hash inside a READY entry
  std::optional<std::pair<BlockLocation, std::shared_ptr<StoreEntry>>>
  find_ready_block(const hash::BlockHash& block_hash) const;
  void index_blocks(const StoreEntry& entry);
  void unindex_blocks(const StoreEntry& entry);
  void remove_entry(const hash::BlobHash& hash);
  void persist(const StoreEntry& entry);
  void persist_removal(const hash::BlobHash& hash);
  hash::BlobHash publish_registered(const hash::BlobMeta& meta, const std::filesystem::path& path,
                                    const std::string& key);
};

// Message used for every unknown-hash failure
std::string key_not_found_message(const std::string& hash_hex);

} // namespace store
} // namespace blobnet

#endif // BLOBNET_STORE_BLOB_STORE_HPP
