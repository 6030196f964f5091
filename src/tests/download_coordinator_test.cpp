#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <sstream>
#include <thread>
#include "common/error.hpp"
#include "hash/chunker.hpp"
#include "network/tcp_server.hpp"
#include "transfer/download_coordinator.hpp"
#include "fake_peer.hpp"
#include "test_utils.hpp"

using namespace blobnet;
using namespace blobnet::transfer;
using namespace std::chrono_literals;

class DownloadCoordinatorTest : public ::testing::Test {
protected:
  static constexpr uint32_t BLOCK = 1024;
  const std::string ADDRESS = "127.0.0.1";

  // A complete node serving whatever its store holds
  struct ServingNode {
    std::unique_ptr<store::BlobStore> store;
    std::unique_ptr<network::SessionTable> sessions;
    std::unique_ptr<network::TcpServer> server;

    ~ServingNode() {
      if (server) {
        server->shutdown();
      }
      if (sessions) {
        sessions->shutdown();
      }
    }
  };

  std::filesystem::path test_dir;
  hash::Hasher hasher;
  std::unique_ptr<store::BlobStore> store;
  std::unique_ptr<network::SessionTable> sessions;
  std::unique_ptr<DownloadCoordinator> coordinator;
  std::vector<std::unique_ptr<ServingNode>> nodes;

  void SetUp() override {
    init_logging();
    test_dir = make_test_dir("download_test");
    store = std::make_unique<store::BlobStore>(hasher, BLOCK);

    network::SessionOptions options;
    options.handshake_timeout = 2s;
    options.request_timeout = 1s;
    options.keepalive_interval = 0s;
    sessions = std::make_unique<network::SessionTable>(*store, hash::Hash128::random(), options, 2);

    CoordinatorOptions coordinator_options;
    coordinator_options.handshake_timeout = 2s;
    coordinator_options.max_block_attempts = 5;
    coordinator_options.max_consecutive_failures = 2;
    coordinator = std::make_unique<DownloadCoordinator>(*store, *sessions, coordinator_options);
  }

  void TearDown() override {
    sessions->shutdown();
    nodes.clear();
    std::filesystem::remove_all(test_dir);
  }

  // Starts a node that registered data under label
  ServingNode& start_node(const std::vector<uint8_t>& data, const std::string& label) {
    auto node = std::make_unique<ServingNode>();
    node->store = std::make_unique<store::BlobStore>(hasher, BLOCK);
    node->sessions = std::make_unique<network::SessionTable>(*node->store, hash::Hash128::random(),
                                                             network::SessionOptions{}, 1);
    node->server = std::make_unique<network::TcpServer>(ADDRESS, 0, *node->sessions);
    EXPECT_TRUE(node->server->start_listener());

    auto source_dir = test_dir / ("source_" + std::to_string(nodes.size()));
    std::filesystem::create_directories(source_dir);
    write_test_file(source_dir / label, data);
    node->store->register_file(source_dir / label, label);

    nodes.push_back(std::move(node));
    return *nodes.back();
  }

  boost::asio::ip::tcp::endpoint endpoint_of(const ServingNode& node) const {
    return boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address(ADDRESS), node.server->port());
  }

  hash::BlobMeta meta_for(const std::vector<uint8_t>& data, const std::string& label) {
    std::istringstream input(std::string(data.begin(), data.end()));
    return hash::chunk_and_hash(input, label, BLOCK, hasher);
  }

  DownloadRequest make_request(const hash::BlobHash& target,
                               std::vector<boost::asio::ip::tcp::endpoint> peers,
                               Clock::duration timeout = 20s) {
    DownloadRequest request;
    request.target = target;
    request.dest_dir = test_dir / "dest";
    request.peers = std::move(peers);
    request.timeout = timeout;
    return request;
  }
};

TEST_F(DownloadCoordinatorTest, DownloadsFromSinglePeer) {
  auto data = make_test_data(4500);
  auto& node = start_node(data, "report.bin");
  auto target = meta_for(data, "report.bin").blob_hash(hasher);

  auto files = coordinator->download(make_request(target, {endpoint_of(node)}));

  ASSERT_EQ(files.size(), 1u);
  EXPECT_TRUE(files[0].is_absolute());
  EXPECT_EQ(files[0].filename().string(), "report.bin");
  EXPECT_EQ(read_test_file(files[0]), data);
  EXPECT_EQ(store->state(target), store::EntryState::READY);
}

TEST_F(DownloadCoordinatorTest, DownloadedBlobIsServedOnward) {
  auto data = make_test_data(3000);
  auto& node = start_node(data, "relay.bin");
  auto meta = meta_for(data, "relay.bin");
  auto target = meta.blob_hash(hasher);

  coordinator->download(make_request(target, {endpoint_of(node)}));

  // Blocks of the finished download are readable for other peers
  EXPECT_EQ(store->read_block(meta.block_hashes[1]).size(), BLOCK);
}

TEST_F(DownloadCoordinatorTest, SpreadsBlocksOverPeers) {
  auto data = make_test_data(10 * BLOCK);
  auto meta = meta_for(data, "spread.bin");
  FakePeer first(FakePeer::Mode::SERVE);
  FakePeer second(FakePeer::Mode::SERVE);
  first.add_blob(data, meta, hasher);
  second.add_blob(data, meta, hasher);

  auto files = coordinator->download(make_request(meta.blob_hash(hasher), {first.endpoint(), second.endpoint()}));

  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(read_test_file(files[0]), data);
  EXPECT_GT(first.asks_received(), 0u);
  EXPECT_GT(second.asks_received(), 0u);
  EXPECT_EQ(first.asks_received() + second.asks_received(), meta.block_count());
}

TEST_F(DownloadCoordinatorTest, CorruptPeerIsRoutedAround) {
  auto data = make_test_data(6 * BLOCK + 17);
  auto meta = meta_for(data, "corrupt.bin");
  FakePeer corrupt(FakePeer::Mode::CORRUPT);
  FakePeer honest(FakePeer::Mode::SERVE);
  corrupt.add_blob(data, meta, hasher);
  honest.add_blob(data, meta, hasher);

  auto files = coordinator->download(make_request(meta.blob_hash(hasher), {corrupt.endpoint(), honest.endpoint()}));

  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(read_test_file(files[0]), data);
}

TEST_F(DownloadCoordinatorTest, OnlyCorruptPeerFailsWithHashMismatch) {
  auto data = make_test_data(3 * BLOCK);
  auto meta = meta_for(data, "corrupt.bin");
  auto target = meta.blob_hash(hasher);
  FakePeer corrupt(FakePeer::Mode::CORRUPT);
  corrupt.add_blob(data, meta, hasher);

  EXPECT_THROW(coordinator->download(make_request(target, {corrupt.endpoint()})), HashMismatchError);

  // Nothing half-written is left behind
  EXPECT_FALSE(store->contains(target));
  EXPECT_FALSE(std::filesystem::exists(test_dir / "dest" / "corrupt.bin"));
}

TEST_F(DownloadCoordinatorTest, SilentPeerFallsBackToOther) {
  auto data = make_test_data(4 * BLOCK);
  auto meta = meta_for(data, "silent.bin");
  FakePeer silent(FakePeer::Mode::SILENT);
  FakePeer honest(FakePeer::Mode::SERVE);
  silent.add_blob(data, meta, hasher);
  honest.add_blob(data, meta, hasher);

  auto files = coordinator->download(make_request(meta.blob_hash(hasher), {silent.endpoint(), honest.endpoint()}));

  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(read_test_file(files[0]), data);
}

TEST_F(DownloadCoordinatorTest, OnlySilentPeerIsUnavailable) {
  auto data = make_test_data(2 * BLOCK);
  auto meta = meta_for(data, "silent.bin");
  FakePeer silent(FakePeer::Mode::SILENT);
  silent.add_blob(data, meta, hasher);

  // The request timeout closes the only session long before the job deadline
  EXPECT_THROW(coordinator->download(make_request(meta.blob_hash(hasher), {silent.endpoint()})),
               PeerUnavailableError);
}

TEST_F(DownloadCoordinatorTest, JobDeadlineGivesTimeout) {
  auto data = make_test_data(2 * BLOCK);
  auto meta = meta_for(data, "slow.bin");
  auto target = meta.blob_hash(hasher);
  FakePeer silent(FakePeer::Mode::SILENT);
  silent.add_blob(data, meta, hasher);

  EXPECT_THROW(coordinator->download(make_request(target, {silent.endpoint()}, 300ms)), TimeoutError);
  EXPECT_FALSE(store->contains(target));
}

TEST_F(DownloadCoordinatorTest, UnknownBlobIsNotFound) {
  FakePeer empty(FakePeer::Mode::UNAVAILABLE);
  auto target = hash::Hash128::random();

  try {
    coordinator->download(make_request(target, {empty.endpoint()}));
    FAIL() << "download should fail";
  } catch (const NotFoundError& e) {
    EXPECT_EQ(std::string(e.what()), "Key not found in database [" + target.to_hex() + "]");
  }
}

TEST_F(DownloadCoordinatorTest, NoPeersIsNotFound) {
  EXPECT_THROW(coordinator->download(make_request(hash::Hash128::random(), {})), NotFoundError);
}

TEST_F(DownloadCoordinatorTest, UnreachablePeersAreSkipped) {
  auto data = make_test_data(BLOCK + 1);
  auto& node = start_node(data, "reach.bin");
  boost::asio::ip::tcp::endpoint nowhere(boost::asio::ip::make_address(ADDRESS), 1);

  auto files = coordinator->download(make_request(meta_for(data, "reach.bin").blob_hash(hasher),
                                                  {nowhere, endpoint_of(node)}));
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(read_test_file(files[0]), data);
}

TEST_F(DownloadCoordinatorTest, ExpectedSizeMismatchRejectsMeta) {
  auto data = make_test_data(2000);
  auto& node = start_node(data, "sized.bin");

  auto request = make_request(meta_for(data, "sized.bin").blob_hash(hasher), {endpoint_of(node)});
  request.expected_size = 1999;
  EXPECT_THROW(coordinator->download(request), NotFoundError);

  request.expected_size = 2000;
  EXPECT_EQ(read_test_file(coordinator->download(request).at(0)), data);
}

TEST_F(DownloadCoordinatorTest, CallerSuppliedMetaIsUsed) {
  auto data = make_test_data(3 * BLOCK);
  auto meta = meta_for(data, "given.bin");
  FakePeer peer(FakePeer::Mode::SERVE);
  auto other = meta_for(make_test_data(10, 7), "other.bin");
  peer.add_blob(data, meta, hasher);

  auto request = make_request(meta.blob_hash(hasher), {peer.endpoint()});
  request.meta = meta;
  EXPECT_EQ(read_test_file(coordinator->download(request).at(0)), data);

  // Metadata that does not hash to the target is ignored
  auto mismatched = make_request(meta_for(make_test_data(50, 9), "x.bin").blob_hash(hasher), {});
  mismatched.meta = other;
  EXPECT_THROW(coordinator->download(mismatched), NotFoundError);
}

TEST_F(DownloadCoordinatorTest, LocalBlobIsCopied) {
  auto data = make_test_data(2500);
  write_test_file(test_dir / "local.bin", data);
  auto target = store->register_file(test_dir / "local.bin", "local.bin");

  auto files = coordinator->download(make_request(target, {}));
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0], test_dir / "dest" / "local.bin");
  EXPECT_EQ(read_test_file(files[0]), data);
}

TEST_F(DownloadCoordinatorTest, EmptyBlob) {
  auto& node = start_node({}, "empty.bin");
  auto target = meta_for({}, "empty.bin").blob_hash(hasher);

  auto files = coordinator->download(make_request(target, {endpoint_of(node)}));
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(std::filesystem::file_size(files[0]), 0u);
}

TEST_F(DownloadCoordinatorTest, RejectsInvalidRequests) {
  auto request = make_request(hash::Hash128::random(), {}, 0s);
  EXPECT_THROW(coordinator->download(request), InvalidRequestError);

  request = make_request(hash::Hash128::random(), {});
  request.dest_dir.clear();
  EXPECT_THROW(coordinator->download(request), InvalidRequestError);
}

TEST_F(DownloadCoordinatorTest, HandshakesRunConcurrently) {
  auto data = make_test_data(2 * BLOCK);
  auto meta = meta_for(data, "many.bin");
  FakePeer mute_a(FakePeer::Mode::NO_HELLO);
  FakePeer mute_b(FakePeer::Mode::NO_HELLO);
  FakePeer mute_c(FakePeer::Mode::NO_HELLO);
  FakePeer honest(FakePeer::Mode::SERVE);
  honest.add_blob(data, meta, hasher);

  auto start = Clock::now();
  auto files = coordinator->download(make_request(meta.blob_hash(hasher),
    {mute_a.endpoint(), mute_b.endpoint(), mute_c.endpoint(), honest.endpoint()}));

  // One handshake budget in total, not one per silent peer
  EXPECT_LT(Clock::now() - start, 4s);
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(read_test_file(files[0]), data);
}

TEST_F(DownloadCoordinatorTest, TimedOutJobReleasesSessionForNextJob) {
  auto data = make_test_data(2 * BLOCK);
  auto meta = meta_for(data, "drain.bin");
  auto target = meta.blob_hash(hasher);
  FakePeer slow(FakePeer::Mode::SLOW);
  slow.set_reply_delay(600ms);
  slow.add_blob(data, meta, hasher);

  auto first = make_request(target, {slow.endpoint()}, 300ms);
  first.meta = meta;
  EXPECT_THROW(coordinator->download(first), TimeoutError);
  EXPECT_FALSE(store->contains(target));

  // The late reply drains, then the same session carries the next job
  auto second = make_request(target, {slow.endpoint()});
  second.meta = meta;
  auto files = coordinator->download(second);
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(read_test_file(files[0]), data);
  EXPECT_EQ(slow.connections(), 1u);
  EXPECT_EQ(sessions->size(), 1u);
}

TEST_F(DownloadCoordinatorTest, RegistrationDuringDownloadEndsIt) {
  auto data = make_test_data(8 * BLOCK);
  auto meta = meta_for(data, "raced.bin");
  auto target = meta.blob_hash(hasher);
  FakePeer slow(FakePeer::Mode::SLOW);
  slow.set_reply_delay(300ms);
  slow.add_blob(data, meta, hasher);

  auto request = make_request(target, {slow.endpoint()});
  request.meta = meta;
  auto running = std::async(std::launch::async, [this, request]() { return coordinator->download(request); });

  // The same content shows up locally while blocks are still arriving
  std::this_thread::sleep_for(450ms);
  std::filesystem::create_directories(test_dir / "local");
  write_test_file(test_dir / "local" / "raced.bin", data);
  ASSERT_EQ(store->register_file(test_dir / "local" / "raced.bin", "raced.bin"), target);

  auto files = running.get();
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0], test_dir / "dest" / "raced.bin");
  EXPECT_EQ(read_test_file(files[0]), data);
  EXPECT_LT(slow.asks_received(), meta.block_count());

  // The registration is kept and keeps serving
  EXPECT_EQ(store->state(target), store::EntryState::READY);
  EXPECT_EQ(store->data_path(target), std::filesystem::weakly_canonical(test_dir / "local" / "raced.bin"));
  EXPECT_EQ(store->read_block(meta.block_hashes[7]).size(), BLOCK);
}

TEST_F(DownloadCoordinatorTest, WaiterTakesOverWhenRunningDownloadFails) {
  auto data = make_test_data(3 * BLOCK);
  auto meta = meta_for(data, "handover.bin");
  auto target = meta.blob_hash(hasher);
  FakePeer honest(FakePeer::Mode::SERVE);
  honest.add_blob(data, meta, hasher);

  // A download that will never finish holds the hash
  ASSERT_TRUE(store->declare(target, meta, test_dir / "stuck" / "handover.bin", Clock::now() + 1min));
  std::thread owner([this, &target]() {
    std::this_thread::sleep_for(200ms);
    EXPECT_TRUE(store->discard_pending(target));
  });

  auto start = Clock::now();
  auto files = coordinator->download(make_request(target, {honest.endpoint()}));
  owner.join();

  EXPECT_LT(Clock::now() - start, 10s);
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(read_test_file(files[0]), data);
  EXPECT_GT(honest.asks_received(), 0u);
}

TEST_F(DownloadCoordinatorTest, WaiterTimesOutOnStuckDownload) {
  auto meta = meta_for(make_test_data(BLOCK), "stuck.bin");
  auto target = meta.blob_hash(hasher);
  ASSERT_TRUE(store->declare(target, meta, test_dir / "stuck" / "stuck.bin", Clock::now() + 1min));

  EXPECT_THROW(coordinator->download(make_request(target, {}, 200ms)), TimeoutError);
  EXPECT_EQ(store->state(target), store::EntryState::PENDING);
}

TEST_F(DownloadCoordinatorTest, OutputName) {
  hash::BlobMeta meta;
  auto target = hash::Hash128::random();

  meta.file_name = "dir/sub/name.txt";
  EXPECT_EQ(DownloadCoordinator::output_name(meta, target), "name.txt");
  meta.file_name = "";
  EXPECT_EQ(DownloadCoordinator::output_name(meta, target), target.to_hex());
  meta.file_name = "..";
  EXPECT_EQ(DownloadCoordinator::output_name(meta, target), target.to_hex());
}

class PeerSelectionTest : public ::testing::Test {
protected:
  const Clock::time_point t0 = Clock::now();
  std::vector<PeerSlot> slots;
  BlockStatus block;
  std::set<network::SessionId> skipped;

  void SetUp() override {
    for (network::SessionId id = 1; id <= 3; ++id) {
      PeerSlot slot;
      slot.session = id;
      slot.last_used = t0 + std::chrono::seconds(id);
      slots.push_back(slot);
    }
  }

  network::SessionId selected() {
    PeerSlot* slot = DownloadCoordinator::select_peer(slots, block, skipped);
    return slot ? slot->session : 0;
  }
};

TEST_F(PeerSelectionTest, LeastRecentlyUsedWins) {
  EXPECT_EQ(selected(), 1u);
  slots[0].last_used = t0 + std::chrono::seconds(10);
  EXPECT_EQ(selected(), 2u);
}

TEST_F(PeerSelectionTest, BusyClosedAndSkippedSlotsAreNotPicked) {
  slots[0].in_flight = true;
  slots[1].closed = true;
  EXPECT_EQ(selected(), 3u);
  skipped.insert(3);
  EXPECT_EQ(selected(), 0u);
}

TEST_F(PeerSelectionTest, DeprioritizedPeerGoesLast) {
  slots[0].deprioritized = true;
  EXPECT_EQ(selected(), 2u);

  slots[1].in_flight = true;
  slots[2].in_flight = true;
  EXPECT_EQ(selected(), 1u);
}

TEST_F(PeerSelectionTest, PeersThatFailedTheBlockArePassedOver) {
  block.failed_by = {1, 2};
  EXPECT_EQ(selected(), 3u);

  // Busy untried peer still blocks the retry on a peer that failed
  slots[2].in_flight = true;
  EXPECT_EQ(selected(), 0u);

  // Every open peer has failed it, least recently used retries
  slots[2].closed = true;
  EXPECT_EQ(selected(), 1u);
}

TEST_F(PeerSelectionTest, ConsecutiveFailuresDeprioritize) {
  PeerSlot& slot = slots[0];
  EXPECT_FALSE(DownloadCoordinator::note_failure(slot, 2));
  EXPECT_FALSE(slot.deprioritized);
  EXPECT_TRUE(DownloadCoordinator::note_failure(slot, 2));
  EXPECT_TRUE(slot.deprioritized);
  // Reported once
  EXPECT_FALSE(DownloadCoordinator::note_failure(slot, 2));
  EXPECT_EQ(slot.consecutive_failures, 3u);

  // Oldest but unhealthy, so the next peer is asked first
  EXPECT_EQ(selected(), 2u);
}
