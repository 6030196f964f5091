#ifndef BLOBNET_TRANSFER_DOWNLOAD_COORDINATOR_HPP
#define BLOBNET_TRANSFER_DOWNLOAD_COORDINATOR_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <vector>
#include <boost/asio/ip/tcp.hpp>
#include "hash/blob_meta.hpp"
#include "network/channel.hpp"
#include "network/session_table.hpp"
#include "store/blob_store.hpp"

namespace blobnet {
namespace transfer {

using Clock = std::chrono::steady_clock;

struct CoordinatorOptions {
  // Budget for connecting and handshaking with one peer
  Clock::duration handshake_timeout = std::chrono::seconds(10);
  std::size_t max_block_attempts = 10;
  // Consecutive failures after which a peer goes to the back of the order
  std::size_t max_consecutive_failures = 3;
};

struct DownloadRequest {
  hash::BlobHash target;
  std::filesystem::path dest_dir;
  std::vector<boost::asio::ip::tcp::endpoint> peers;
  Clock::duration timeout = std::chrono::seconds(300);
  // Metadata supplied by the caller, checked against target
  std::optional<hash::BlobMeta> meta;
  // When set, metadata announcing another size is rejected
  std::optional<uint64_t> expected_size;
};

enum class BlockState {
  PENDING,
  REQUESTED,
  VERIFIED
};

struct BlockStatus {
  BlockState state = BlockState::PENDING;
  std::size_t attempts = 0;
  bool last_failure_mismatch = false;
  network::SessionId assigned = 0;
  std::set<network::SessionId> failed_by;
};

// One candidate peer of a job
struct PeerSlot {
  network::SessionId session = 0;
  std::shared_ptr<network::PeerSession> handle;
  bool in_flight = false;
  uint64_t request = 0;
  std::size_t block = 0;
  std::size_t consecutive_failures = 0;
  bool deprioritized = false;
  bool closed = false;
  Clock::time_point last_used{};
};

// State of one running download, owned by the download() call
struct DownloadJob {
  hash::BlobHash target;
  hash::BlobMeta meta;
  std::filesystem::path dest_path;
  Clock::time_point deadline;
  std::vector<BlockStatus> blocks;
  std::vector<PeerSlot> slots;
  std::size_t verified = 0;
  // The same blob became READY through another entry while fetching
  bool completed_elsewhere = false;
  uint64_t next_request = 1;
  std::shared_ptr<network::Channel> events;
};

/**
 * Fetches a blob by hash from a set of peers.
 *
 * Blocks are requested one per session at a time, spread over the
 * least recently used sessions, verified against the block hashes of
 * the blob's metadata and written into a PENDING store entry. The
 * assembled file is rehashed before it is reported.
 */
class DownloadCoordinator {
public:
  DownloadCoordinator(const DownloadCoordinator&) = delete;
  DownloadCoordinator& operator=(const DownloadCoordinator&) = delete;


  // ---- CONSTRUCTOR ----
  DownloadCoordinator(store::BlobStore& store, network::SessionTable& sessions,
                      const CoordinatorOptions& options);


  // ---- DOWNLOAD ----
  // Returns the absolute path of the downloaded file. Throws one of
  // NotFoundError, TimeoutError, HashMismatchError, PeerUnavailableError,
  // IOError or InvalidRequestError.
  std::vector<std::filesystem::path> download(const DownloadRequest& request);

  // Last path component of the blob's file name, or the hash in hex
  static std::string output_name(const hash::BlobMeta& meta, const hash::BlobHash& target);


  // ---- PEER SELECTION ----
  // Slot to ask for block next: healthy before deprioritized, then least
  // recently used. Peers that failed the block are passed over while an
  // open peer has not. Returns nullptr when no slot is free.
  static PeerSlot* select_peer(std::vector<PeerSlot>& slots, const BlockStatus& block,
                               const std::set<network::SessionId>& skipped);
  // Counts a failure against slot, returns true when it just became deprioritized
  static bool note_failure(PeerSlot& slot, std::size_t max_consecutive_failures);

private:
  // ---- PARAMETERS ----
  store::BlobStore& store_;
  network::SessionTable& sessions_;
  const CoordinatorOptions options_;


  // ---- PREPARATION ----
  std::vector<PeerSlot> open_slots(const DownloadRequest& request, Clock::time_point deadline);
  hash::BlobMeta resolve_meta(const DownloadRequest& request, DownloadJob& job);
  std::optional<hash::BlobMeta> fetch_meta(DownloadJob& job, PeerSlot& slot);
  bool accept_meta(const DownloadRequest& request, const hash::BlobMeta& meta, const std::string& source) const;
  std::filesystem::path copy_local(const hash::BlobHash& target, const std::filesystem::path& dest_dir);
  // Waits on another download of target. Returns the copied file, or
  // nullopt when that download gave up. Throws TimeoutError.
  std::optional<std::filesystem::path> await_running(const hash::BlobHash& target,
                                                     const std::filesystem::path& dest_dir,
                                                     Clock::time_point deadline);


  // ---- SCHEDULING ----
  void run(DownloadJob& job);
  void assign_blocks(DownloadJob& job);
  bool issue(DownloadJob& job, PeerSlot& slot, std::size_t index);
  void handle_event(DownloadJob& job, network::SessionEvent& event);
  void record_failure(DownloadJob& job, PeerSlot& slot, std::size_t index, bool mismatch);
  void cancel_outstanding(DownloadJob& job);


  // ---- COMPLETION ----
  void verify_assembly(const DownloadJob& job);
  std::filesystem::path adopt_completed(DownloadJob& job, const std::filesystem::path& dest_dir);
};

} // namespace transfer
} // namespace blobnet

#endif // BLOBNET_TRANSFER_DOWNLOAD_COORDINATOR_HPP
