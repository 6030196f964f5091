#include <gtest/gtest.h>
#include <sstream>
#include "cli/cli.hpp"
#include "test_utils.hpp"

using namespace blobnet;
using namespace std::chrono_literals;

class CLITest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  hash::Hasher hasher;
  hash::NodeId node_id = hash::Hash128::random();
  std::unique_ptr<store::BlobStore> store;
  std::unique_ptr<network::SessionTable> sessions;
  std::unique_ptr<transfer::DownloadCoordinator> coordinator;
  std::unique_ptr<api::CommandHandler> handler;

  void SetUp() override {
    test_dir = make_test_dir("cli_test");
    store = std::make_unique<store::BlobStore>(hasher, 1024);
    sessions = std::make_unique<network::SessionTable>(*store, node_id, network::SessionOptions{}, 1);
    coordinator = std::make_unique<transfer::DownloadCoordinator>(*store, *sessions, transfer::CoordinatorOptions{});
    api::NodeInfo info{node_id, "0.1.0", "127.0.0.1", 3282};
    handler = std::make_unique<api::CommandHandler>(*store, *coordinator, info, 10s);
  }

  void TearDown() override {
    sessions->shutdown();
    std::filesystem::remove_all(test_dir);
  }

  // Runs the shell over the given input and returns everything it printed
  std::string run(const std::string& input) {
    std::istringstream in(input);
    std::ostringstream out;
    cli::CLI shell(*handler, in, out);
    shell.run();
    return out.str();
  }
};

TEST_F(CLITest, ShortFormId) {
  auto output = run("id\nquit\n");
  EXPECT_NE(output.find(node_id.to_hex()), std::string::npos);
  EXPECT_NE(output.find("blobnet> "), std::string::npos);
}

TEST_F(CLITest, JsonLine) {
  auto output = run("{\"command\": \"addresses\"}\n");
  EXPECT_NE(output.find("\"port\":3282"), std::string::npos);
}

TEST_F(CLITest, MalformedJsonLineReportsError) {
  auto output = run("{\"command\": \n");
  EXPECT_NE(output.find("InvalidRequestError"), std::string::npos);
}

TEST_F(CLITest, UploadAndCheck) {
  write_test_file(test_dir / "data.bin", make_test_data(3000));
  std::ostringstream input;
  input << "upload " << (test_dir / "data.bin").string() << " my label\n";
  run(input.str());

  auto blob = store->lookup(store->register_file(test_dir / "data.bin", "ignored"));
  EXPECT_EQ(blob.file_name, "my label");

  auto hex = store->register_file(test_dir / "data.bin", "ignored").to_hex();
  auto output = run("check " + hex + " 1\n");
  EXPECT_NE(output.find("{\"hash\":\"" + hex + "\"}"), std::string::npos);
}

TEST_F(CLITest, TranslateShortForms) {
  std::istringstream in;
  std::ostringstream out;
  cli::CLI shell(*handler, in, out);

  auto upload = shell.translate("upload /tmp/a.bin");
  ASSERT_TRUE(upload.has_value());
  EXPECT_EQ((*upload)["command"], "upload");
  EXPECT_EQ((*upload)["files"]["/tmp/a.bin"], "");

  auto check = shell.translate("check 00112233445566778899aabbccddeeff 2.5");
  ASSERT_TRUE(check.has_value());
  EXPECT_EQ((*check)["hash"], "00112233445566778899aabbccddeeff");
  EXPECT_EQ((*check)["timeout"], 2.5);

  auto download = shell.translate("download 00112233445566778899aabbccddeeff /tmp/out 127.0.0.1:3001 10.0.0.2:3002");
  ASSERT_TRUE(download.has_value());
  EXPECT_EQ((*download)["dest"], "/tmp/out");
  ASSERT_EQ((*download)["peers"].size(), 2u);
  EXPECT_EQ((*download)["peers"][0]["TCP"][0], "127.0.0.1");
  EXPECT_EQ((*download)["peers"][1]["TCP"][1], 3002);
}

TEST_F(CLITest, TranslateRejectsBadShortForms) {
  std::istringstream in;
  std::ostringstream out;
  cli::CLI shell(*handler, in, out);

  EXPECT_FALSE(shell.translate("upload").has_value());
  EXPECT_FALSE(shell.translate("check").has_value());
  EXPECT_FALSE(shell.translate("check abc soon").has_value());
  EXPECT_FALSE(shell.translate("download abc").has_value());
  EXPECT_FALSE(shell.translate("download abc /tmp 127.0.0.1").has_value());
  EXPECT_FALSE(shell.translate("download abc /tmp 127.0.0.1:99999").has_value());
  EXPECT_FALSE(shell.translate("teleport").has_value());
  EXPECT_NE(out.str().find("Usage: upload"), std::string::npos);
}

TEST_F(CLITest, QuitStopsReading) {
  auto output = run("quit\nid\n");
  EXPECT_EQ(output.find(node_id.to_hex()), std::string::npos);
}
