#include "transfer/download_coordinator.hpp"
#include "common/error.hpp"
#include "hash/chunker.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <sstream>

namespace blobnet {
namespace transfer {

namespace {

// Upper bound on one wait for session events
constexpr Clock::duration POLL_INTERVAL = std::chrono::milliseconds(100);

network::PeerSession::ResponseHandler make_handler(std::shared_ptr<network::Channel> events,
                                                   network::SessionId session, uint64_t request) {
  return [events, session, request](network::RequestOutcome outcome, std::vector<uint8_t> payload) {
    events->produce(network::SessionEvent{session, request, outcome, std::move(payload)});
  };
}

bool closes_session(network::RequestOutcome outcome) {
  return outcome == network::RequestOutcome::TIMEOUT ||
         outcome == network::RequestOutcome::CLOSED ||
         outcome == network::RequestOutcome::PROTOCOL_ERROR;
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

DownloadCoordinator::DownloadCoordinator(store::BlobStore& store, network::SessionTable& sessions,
                                         const CoordinatorOptions& options)
  : store_(store)
  , sessions_(sessions)
  , options_(options) {
  if (options_.max_block_attempts == 0) {
    throw InvalidRequestError("max_block_attempts must be positive");
  }
}

//==============================================
// DOWNLOAD
//==============================================

std::vector<std::filesystem::path> DownloadCoordinator::download(const DownloadRequest& request) {
  if (request.timeout <= Clock::duration::zero()) {
    throw InvalidRequestError("download timeout must be positive");
  }
  if (request.dest_dir.empty()) {
    throw InvalidRequestError("destination directory is required");
  }

  const Clock::time_point deadline = Clock::now() + request.timeout;
  const std::string target_hex = request.target.to_hex();

  std::error_code ec;
  std::filesystem::path dest_dir = std::filesystem::absolute(request.dest_dir, ec);
  if (!ec) {
    std::filesystem::create_directories(dest_dir, ec);
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Download coordinator: Cannot use destination " << request.dest_dir.string();
    throw IOError("Failed to create destination " + request.dest_dir.string() + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "Download coordinator: Downloading " << target_hex << " into " << dest_dir.string()
                          << " from " << request.peers.size() << " candidate peers";

  // Known locally, no network traffic needed
  std::optional<store::EntryState> local = store_.state(request.target);
  if (local == store::EntryState::READY) {
    return {copy_local(request.target, dest_dir)};
  }
  if (local == store::EntryState::PENDING) {
    if (auto copied = await_running(request.target, dest_dir, deadline)) {
      return {*copied};
    }
  }

  DownloadJob job;
  job.target = request.target;
  job.deadline = deadline;
  job.events = std::make_shared<network::Channel>();
  job.slots = open_slots(request, deadline);

  try {
    job.meta = resolve_meta(request, job);
  } catch (const Error&) {
    cancel_outstanding(job);
    throw;
  }
  job.dest_path = dest_dir / output_name(job.meta, job.target);

  // Another download or a registration may hold the hash, declare again if it goes away
  while (!store_.declare(job.target, job.meta, job.dest_path, deadline)) {
    if (auto copied = await_running(job.target, dest_dir, deadline)) {
      return {*copied};
    }
  }

  job.blocks.assign(job.meta.block_count(), BlockStatus{});

  try {
    run(job);
    if (job.completed_elsewhere) {
      return {adopt_completed(job, dest_dir)};
    }
    verify_assembly(job);
  } catch (const Error& e) {
    BOOST_LOG_TRIVIAL(error) << "Download coordinator: Download of " << target_hex << " failed: "
                             << to_error_payload(e);
    cancel_outstanding(job);
    // Only this job's own PENDING entry, a READY entry that replaced it stays
    if (!store_.discard_pending(job.target)) {
      BOOST_LOG_TRIVIAL(info) << "Download coordinator: " << target_hex << " stays known from another source";
    }
    std::filesystem::remove(job.dest_path, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Download coordinator: Could not remove " << job.dest_path.string()
                                 << ": " << ec.message();
    }
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "Download coordinator: Downloaded " << target_hex << " to " << job.dest_path.string()
                          << " (" << job.meta.file_size << " bytes, " << job.blocks.size() << " blocks)";
  return {job.dest_path};
}

std::string DownloadCoordinator::output_name(const hash::BlobMeta& meta, const hash::BlobHash& target) {
  std::string name = std::filesystem::path(meta.file_name).filename().string();
  if (name.empty() || name == "." || name == "..") {
    return target.to_hex();
  }
  return name;
}

//==============================================
// PREPARATION
//==============================================

std::vector<PeerSlot> DownloadCoordinator::open_slots(const DownloadRequest& request, Clock::time_point deadline) {
  std::vector<PeerSlot> slots;
  std::set<network::SessionId> opened;

  Clock::duration remaining = deadline - Clock::now();
  if (request.peers.empty() || remaining <= Clock::duration::zero()) {
    return slots;
  }

  // Every handshake runs concurrently under one budget
  std::vector<std::optional<network::SessionId>> ids =
    sessions_.open_all(request.peers, std::min(options_.handshake_timeout, remaining));

  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (!ids[i]) {
      BOOST_LOG_TRIVIAL(warning) << "Download coordinator: Skipping unreachable peer " << request.peers[i];
      continue;
    }
    auto handle = sessions_.get(*ids[i]);
    if (!handle || !opened.insert(*ids[i]).second) {
      continue;
    }
    PeerSlot slot;
    slot.session = *ids[i];
    slot.handle = handle;
    slots.push_back(slot);
  }

  BOOST_LOG_TRIVIAL(debug) << "Download coordinator: " << slots.size() << " of " << request.peers.size()
                           << " peers reachable";
  return slots;
}

hash::BlobMeta DownloadCoordinator::resolve_meta(const DownloadRequest& request, DownloadJob& job) {
  if (request.meta && accept_meta(request, *request.meta, "caller")) {
    return *request.meta;
  }

  for (PeerSlot& slot : job.slots) {
    if (slot.closed) {
      continue;
    }
    if (Clock::now() >= job.deadline) {
      throw TimeoutError("metadata of " + job.target.to_hex() + " not resolved in time");
    }

    std::optional<hash::BlobMeta> meta = fetch_meta(job, slot);
    if (!meta) {
      continue;
    }

    std::ostringstream source;
    source << "peer " << slot.handle->endpoint();
    if (accept_meta(request, *meta, source.str())) {
      return *meta;
    }
  }

  BOOST_LOG_TRIVIAL(warning) << "Download coordinator: No metadata found for " << job.target;
  throw NotFoundError(store::key_not_found_message(job.target.to_hex()));
}

std::optional<hash::BlobMeta> DownloadCoordinator::fetch_meta(DownloadJob& job, PeerSlot& slot) {
  const uint64_t request = job.next_request++;
  if (!slot.handle->ask_meta(job.target, make_handler(job.events, slot.session, request))) {
    BOOST_LOG_TRIVIAL(debug) << "Download coordinator: Session " << slot.session << " busy, no metadata request";
    return std::nullopt;
  }
  slot.in_flight = true;
  slot.request = request;

  network::SessionEvent event;
  while (true) {
    Clock::time_point now = Clock::now();
    if (now >= job.deadline) {
      throw TimeoutError("metadata of " + job.target.to_hex() + " not resolved in time");
    }
    if (job.events->consume_for(event, job.deadline - now) && event.request == request) {
      break;
    }
  }
  slot.in_flight = false;
  slot.last_used = Clock::now();

  if (event.outcome != network::RequestOutcome::OK) {
    BOOST_LOG_TRIVIAL(debug) << "Download coordinator: Metadata request on session " << slot.session
                             << " ended with " << network::outcome_to_string(event.outcome);
    slot.closed = closes_session(event.outcome);
    return std::nullopt;
  }

  try {
    return hash::BlobMeta::decode(event.payload.data(), event.payload.size());
  } catch (const ProtocolError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Download coordinator: Malformed metadata from session " << slot.session
                               << ": " << e.what();
    return std::nullopt;
  }
}

bool DownloadCoordinator::accept_meta(const DownloadRequest& request, const hash::BlobMeta& meta,
                                      const std::string& source) const {
  try {
    meta.validate();
  } catch (const ProtocolError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Download coordinator: Invalid metadata from " << source << ": " << e.what();
    return false;
  }

  if (meta.blob_hash(store_.hasher()) != request.target) {
    BOOST_LOG_TRIVIAL(warning) << "Download coordinator: Metadata from " << source << " does not hash to "
                               << request.target;
    return false;
  }

  if (request.expected_size && *request.expected_size != meta.file_size) {
    BOOST_LOG_TRIVIAL(warning) << "Download coordinator: Metadata from " << source << " announces "
                               << meta.file_size << " bytes, expected " << *request.expected_size;
    return false;
  }
  return true;
}

std::filesystem::path DownloadCoordinator::copy_local(const hash::BlobHash& target,
                                                      const std::filesystem::path& dest_dir) {
  hash::BlobMeta meta = store_.lookup(target);
  std::filesystem::path source = store_.data_path(target);
  std::filesystem::path dest = dest_dir / output_name(meta, target);

  std::error_code ec;
  if (std::filesystem::exists(dest, ec) && std::filesystem::equivalent(source, dest, ec)) {
    BOOST_LOG_TRIVIAL(info) << "Download coordinator: " << target << " already at " << dest.string();
    return dest;
  }

  std::filesystem::copy_file(source, dest, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Download coordinator: Failed to copy " << source.string() << " to " << dest.string();
    throw IOError("Failed to copy " + source.string() + " to " + dest.string() + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "Download coordinator: Copied local " << target << " to " << dest.string();
  return dest;
}

std::optional<std::filesystem::path> DownloadCoordinator::await_running(const hash::BlobHash& target,
                                                                        const std::filesystem::path& dest_dir,
                                                                        Clock::time_point deadline) {
  BOOST_LOG_TRIVIAL(info) << "Download coordinator: " << target << " is already being fetched, waiting";
  store_.wait_for(target, std::max(deadline - Clock::now(), Clock::duration::zero()));

  std::optional<store::EntryState> state = store_.state(target);
  if (state == store::EntryState::READY) {
    return copy_local(target, dest_dir);
  }
  if (state == store::EntryState::PENDING || Clock::now() >= deadline) {
    throw TimeoutError("download of " + target.to_hex() + " timed out waiting for a running download");
  }

  BOOST_LOG_TRIVIAL(info) << "Download coordinator: Running download of " << target << " gave up, fetching it here";
  return std::nullopt;
}

//==============================================
// SCHEDULING
//==============================================

void DownloadCoordinator::run(DownloadJob& job) {
  while (job.verified < job.blocks.size() && !job.completed_elsewhere) {
    Clock::time_point now = Clock::now();
    if (now >= job.deadline) {
      throw TimeoutError("download of " + job.target.to_hex() + " timed out with " +
                         std::to_string(job.verified) + " of " + std::to_string(job.blocks.size()) +
                         " blocks verified");
    }

    // In-flight sessions report their own close through the event
    for (PeerSlot& slot : job.slots) {
      if (!slot.closed && !slot.in_flight && slot.handle->is_closed()) {
        BOOST_LOG_TRIVIAL(info) << "Download coordinator: Session " << slot.session << " closed";
        slot.closed = true;
      }
    }

    assign_blocks(job);

    bool any_open = std::any_of(job.slots.begin(), job.slots.end(),
                                [](const PeerSlot& slot) { return !slot.closed; });
    if (!any_open) {
      throw PeerUnavailableError("no peer left to fetch " + std::to_string(job.blocks.size() - job.verified) +
                                 " blocks of " + job.target.to_hex());
    }

    network::SessionEvent event;
    if (job.events->consume_for(event, std::min(job.deadline - now, POLL_INTERVAL))) {
      handle_event(job, event);
      while (!job.completed_elsewhere && job.events->consume(event)) {
        handle_event(job, event);
      }
    }
  }
}

void DownloadCoordinator::assign_blocks(DownloadJob& job) {
  // Sessions that refused a request this round (busy elsewhere)
  std::set<network::SessionId> skipped;

  for (std::size_t index = 0; index < job.blocks.size(); ++index) {
    if (job.blocks[index].state != BlockState::PENDING) {
      continue;
    }

    while (PeerSlot* slot = select_peer(job.slots, job.blocks[index], skipped)) {
      if (issue(job, *slot, index)) {
        break;
      }
      skipped.insert(slot->session);
    }
  }
}

PeerSlot* DownloadCoordinator::select_peer(std::vector<PeerSlot>& slots, const BlockStatus& block,
                                           const std::set<network::SessionId>& skipped) {
  // Peers that already failed this block are used only when every open peer has
  bool untried_peer_open = std::any_of(slots.begin(), slots.end(), [&block](const PeerSlot& slot) {
    return !slot.closed && block.failed_by.count(slot.session) == 0;
  });

  PeerSlot* best = nullptr;
  for (PeerSlot& slot : slots) {
    if (slot.closed || slot.in_flight || skipped.count(slot.session) > 0) {
      continue;
    }
    if (untried_peer_open && block.failed_by.count(slot.session) > 0) {
      continue;
    }

    // Healthy peers first, then least recently used
    if (!best ||
        (best->deprioritized && !slot.deprioritized) ||
        (best->deprioritized == slot.deprioritized && slot.last_used < best->last_used)) {
      best = &slot;
    }
  }
  return best;
}

bool DownloadCoordinator::issue(DownloadJob& job, PeerSlot& slot, std::size_t index) {
  const uint64_t request = job.next_request++;
  if (!slot.handle->ask_block(job.meta.block_hashes[index], make_handler(job.events, slot.session, request))) {
    return false;
  }

  slot.in_flight = true;
  slot.request = request;
  slot.block = index;
  slot.last_used = Clock::now();

  BlockStatus& block = job.blocks[index];
  block.state = BlockState::REQUESTED;
  block.assigned = slot.session;

  BOOST_LOG_TRIVIAL(trace) << "Download coordinator: Block " << index << " requested from session " << slot.session;
  return true;
}

void DownloadCoordinator::handle_event(DownloadJob& job, network::SessionEvent& event) {
  auto it = std::find_if(job.slots.begin(), job.slots.end(), [&event](const PeerSlot& slot) {
    return slot.session == event.session && slot.in_flight && slot.request == event.request;
  });
  if (it == job.slots.end()) {
    BOOST_LOG_TRIVIAL(debug) << "Download coordinator: Ignoring stale event from session " << event.session;
    return;
  }

  PeerSlot& slot = *it;
  slot.in_flight = false;
  const std::size_t index = slot.block;

  if (event.outcome != network::RequestOutcome::OK) {
    BOOST_LOG_TRIVIAL(debug) << "Download coordinator: Block " << index << " from session " << slot.session
                             << " ended with " << network::outcome_to_string(event.outcome);
    if (closes_session(event.outcome)) {
      slot.closed = true;
    }
    record_failure(job, slot, index, false);
    return;
  }

  const hash::BlockHash& expected = job.meta.block_hashes[index];
  if (event.payload.size() != job.meta.block_length(index) || store_.hasher().digest(event.payload) != expected) {
    BOOST_LOG_TRIVIAL(warning) << "Download coordinator: Block " << index << " from session " << slot.session
                               << " failed verification";
    record_failure(job, slot, index, true);
    return;
  }

  bool completed = false;
  try {
    completed = store_.store_block(job.target, index, event.payload);
  } catch (const NotFoundError&) {
    // The pending entry shares the job deadline
    throw TimeoutError("pending entry of " + job.target.to_hex() + " expired");
  }

  // A registration of the same content replaced the pending entry
  if (!completed && store_.state(job.target) == store::EntryState::READY) {
    BOOST_LOG_TRIVIAL(info) << "Download coordinator: " << job.target << " became available locally at block "
                            << index << ", stopping";
    job.completed_elsewhere = true;
    return;
  }

  job.blocks[index].state = BlockState::VERIFIED;
  ++job.verified;
  slot.consecutive_failures = 0;
  slot.deprioritized = false;

  BOOST_LOG_TRIVIAL(debug) << "Download coordinator: Block " << index << " verified (" << job.verified
                           << "/" << job.blocks.size() << ")";
}

void DownloadCoordinator::record_failure(DownloadJob& job, PeerSlot& slot, std::size_t index, bool mismatch) {
  BlockStatus& block = job.blocks[index];
  block.state = BlockState::PENDING;
  ++block.attempts;
  block.last_failure_mismatch = mismatch;
  block.failed_by.insert(slot.session);

  if (note_failure(slot, options_.max_consecutive_failures)) {
    BOOST_LOG_TRIVIAL(warning) << "Download coordinator: Deprioritizing session " << slot.session << " after "
                               << slot.consecutive_failures << " consecutive failures";
  }

  if (block.attempts >= options_.max_block_attempts) {
    std::string message = "block " + std::to_string(index) + " of " + job.target.to_hex() + " failed " +
                          std::to_string(block.attempts) + " times";
    if (mismatch) {
      throw HashMismatchError(message);
    }
    throw PeerUnavailableError(message);
  }
}

bool DownloadCoordinator::note_failure(PeerSlot& slot, std::size_t max_consecutive_failures) {
  ++slot.consecutive_failures;
  if (slot.deprioritized || slot.consecutive_failures < max_consecutive_failures) {
    return false;
  }
  slot.deprioritized = true;
  return true;
}

void DownloadCoordinator::cancel_outstanding(DownloadJob& job) {
  for (PeerSlot& slot : job.slots) {
    if (slot.in_flight) {
      slot.handle->cancel_request();
      slot.in_flight = false;
    }
  }
}

//==============================================
// COMPLETION
//==============================================

void DownloadCoordinator::verify_assembly(const DownloadJob& job) {
  hash::BlobMeta assembled = hash::chunk_file(job.dest_path, job.meta.file_name, job.meta.block_size,
                                              store_.hasher());
  hash::BlobHash actual = assembled.blob_hash(store_.hasher());
  if (actual != job.target) {
    BOOST_LOG_TRIVIAL(error) << "Download coordinator: Assembled file hashes to " << actual
                             << ", expected " << job.target;
    throw HashMismatchError("assembled file of " + job.target.to_hex() + " hashes to " + actual.to_hex());
  }
}

std::filesystem::path DownloadCoordinator::adopt_completed(DownloadJob& job, const std::filesystem::path& dest_dir) {
  cancel_outstanding(job);
  std::filesystem::path copied = copy_local(job.target, dest_dir);

  std::error_code ec;
  if (copied != job.dest_path && std::filesystem::remove(job.dest_path, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Download coordinator: Removed partial " << job.dest_path.string();
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Download coordinator: Could not remove " << job.dest_path.string()
                               << ": " << ec.message();
  }
  return copied;
}

} // namespace transfer
} // namespace blobnet
