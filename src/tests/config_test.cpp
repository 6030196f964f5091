#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>
#include "common/error.hpp"
#include "config/config.hpp"

using namespace blobnet;
using namespace blobnet::config;

class ConfigTest : public ::testing::Test {
protected:
  std::ostringstream err;

  ProgramOptions parse(std::vector<std::string> args) {
    storage_ = std::move(args);
    storage_.insert(storage_.begin(), "blobnet");
    std::vector<char*> argv;
    for (auto& arg : storage_) {
      argv.push_back(arg.data());
    }
    return parse_command_line(static_cast<int>(argv.size()), argv.data(), err);
  }

private:
  std::vector<std::string> storage_;
};

TEST_F(ConfigTest, Defaults) {
  auto options = parse({});
  ASSERT_TRUE(options.valid) << err.str();

  const NodeConfig& config = options.config;
  EXPECT_EQ(config.host, "0.0.0.0");
  EXPECT_EQ(config.port, 3282);
  EXPECT_EQ(config.block_size, 1024u * 1024u);
  EXPECT_EQ(config.hash_algorithm, hash::HashAlgorithm::SHA224);
  EXPECT_EQ(config.download_timeout, std::chrono::seconds(300));
  EXPECT_EQ(config.sweep_interval, std::chrono::seconds(86400));
  EXPECT_EQ(config.log_level, "info");
  EXPECT_TRUE(config.log_file.empty());
}

TEST_F(ConfigTest, ParsesAllFlags) {
  auto options = parse({"-h", "127.0.0.1", "--port", "4000", "--db", "/tmp/db", "--block-size", "65536",
                        "--hash", "blake2s256", "--download-timeout", "60", "--sweep-interval", "30",
                        "--sweep-lifetime", "90", "--logfile", "node.log", "--loglevel", "debug",
                        "--io-threads", "4"});
  ASSERT_TRUE(options.valid) << err.str();

  const NodeConfig& config = options.config;
  EXPECT_EQ(config.host, "127.0.0.1");
  EXPECT_EQ(config.port, 4000);
  EXPECT_EQ(config.db_dir, "/tmp/db");
  EXPECT_EQ(config.block_size, 65536u);
  EXPECT_EQ(config.hash_algorithm, hash::HashAlgorithm::BLAKE2S256);
  EXPECT_EQ(config.download_timeout, std::chrono::seconds(60));
  EXPECT_EQ(config.sweep_interval, std::chrono::seconds(30));
  EXPECT_EQ(config.sweep_lifetime, std::chrono::seconds(90));
  EXPECT_EQ(config.log_file, "node.log");
  EXPECT_EQ(config.log_level, "debug");
  EXPECT_EQ(config.io_threads, 4u);
}

TEST_F(ConfigTest, UnknownFlagPrintsUsage) {
  auto options = parse({"--colour", "blue"});
  EXPECT_FALSE(options.valid);
  EXPECT_NE(err.str().find("Unknown argument: --colour"), std::string::npos);
  EXPECT_NE(err.str().find("Usage:"), std::string::npos);
}

TEST_F(ConfigTest, MissingValue) {
  EXPECT_FALSE(parse({"--port"}).valid);
}

TEST_F(ConfigTest, RejectsBadNumbers) {
  EXPECT_FALSE(parse({"--port", "70000"}).valid);
  EXPECT_FALSE(parse({"--port", "12ab"}).valid);
  EXPECT_FALSE(parse({"--port", "-1"}).valid);
  EXPECT_FALSE(parse({"--download-timeout", "0"}).valid);
  EXPECT_FALSE(parse({"--io-threads", "0"}).valid);
}

TEST_F(ConfigTest, RejectsBlockSizeAtLimit) {
  EXPECT_FALSE(parse({"--block-size", "4194304"}).valid);
  EXPECT_TRUE(parse({"--block-size", "4194303"}).valid);
  EXPECT_FALSE(parse({"--block-size", "0"}).valid);
}

TEST_F(ConfigTest, RejectsUnknownNames) {
  EXPECT_FALSE(parse({"--hash", "md5"}).valid);
  EXPECT_FALSE(parse({"--loglevel", "chatty"}).valid);
}

TEST_F(ConfigTest, ValidateThrowsInvalidRequest) {
  NodeConfig config;
  EXPECT_NO_THROW(config.validate());

  config.host.clear();
  EXPECT_THROW(config.validate(), InvalidRequestError);

  config = NodeConfig{};
  config.max_block_attempts = 0;
  EXPECT_THROW(config.validate(), InvalidRequestError);
}
