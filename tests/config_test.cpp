#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include "ferry/config/config.hpp"
#include "ferry/utils/logging.hpp"

namespace ferry::config {
namespace {

using ::testing::Contains;
using ::testing::HasSubstr;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("ferry_config_") + info->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string write_ini(const std::string& content) {
        const auto path = (dir_ / "ferry.ini").string();
        std::ofstream out(path);
        out << content;
        return path;
    }

    static std::optional<ProtocolConfig> parse(std::vector<std::string> args) {
        args.insert(args.begin(), "ferry");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_cli(static_cast<int>(argv.size()), argv.data());
    }

    std::filesystem::path dir_;
};

TEST_F(ConfigTest, Defaults) {
    ProtocolConfig config;

    EXPECT_EQ(config.reliability.window_size, 4u);
    EXPECT_EQ(config.reliability.chunk_size, 256u * 1024u);
    EXPECT_EQ(config.reliability.ack_timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(config.reliability.max_retries, 3u);
    EXPECT_EQ(config.handshake.handshake_timeout, std::chrono::milliseconds(30000));
    EXPECT_TRUE(config.capabilities.at(handshake::CAP_ENCRYPTION));
}

TEST_F(ConfigTest, LoadIni) {
    auto path = write_ini(R"(
# comment
[device]
device_id = "laptop-7"
capabilities = encryption, wifi_aware

[transfer]
window_size = 8
chunk_size = 65536
ack_timeout_ms = 2500
max_retries = 5

[handshake]
protocol_version = 2
min_protocol_version = 1
timeout_ms = 10000
max_payload_age_ms = 0
require_transport = no

[storage]
resume_directory = /var/lib/ferry

[logging]
level = debug
file = /var/log/ferry.log
)");

    auto config = load_config(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->device_id, "laptop-7");
    EXPECT_EQ(config->capabilities.size(), 2u);
    EXPECT_TRUE(config->capabilities.at(handshake::CAP_WIFI_AWARE));
    EXPECT_EQ(config->reliability.window_size, 8u);
    EXPECT_EQ(config->reliability.chunk_size, 65536u);
    EXPECT_EQ(config->reliability.ack_timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(config->reliability.max_retries, 5u);
    EXPECT_EQ(config->handshake.protocol_version, 2u);
    EXPECT_EQ(config->handshake.min_protocol_version, 1u);
    EXPECT_EQ(config->handshake.handshake_timeout, std::chrono::milliseconds(10000));
    EXPECT_EQ(config->handshake.max_payload_age, std::chrono::milliseconds(0));
    EXPECT_FALSE(config->handshake.require_transport);
    EXPECT_EQ(config->resume_directory, "/var/lib/ferry");
    EXPECT_EQ(config->log_level, "debug");
    EXPECT_EQ(config->log_file, "/var/log/ferry.log");
}

TEST_F(ConfigTest, MissingFileIsNullopt) {
    EXPECT_FALSE(load_config((dir_ / "absent.ini").string()).has_value());
}

TEST_F(ConfigTest, MalformedValueThrows) {
    EXPECT_THROW(load_config(write_ini("[transfer]\nwindow_size = four\n")), std::invalid_argument);
    EXPECT_THROW(load_config(write_ini("[transfer]\nchunk_size = -1\n")), std::invalid_argument);
    EXPECT_THROW(load_config(write_ini("[handshake]\nrequire_transport = maybe\n")),
                 std::invalid_argument);
}

TEST_F(ConfigTest, SaveLoadRoundTrip) {
    ProtocolConfig config;
    config.device_id = "desk";
    config.capabilities = {{handshake::CAP_ENCRYPTION, true}, {handshake::CAP_BLUETOOTH, true}};
    config.reliability.window_size = 16;
    config.reliability.max_retries = 1;
    config.handshake.require_transport = false;
    config.resume_directory = (dir_ / "resume").string();
    config.log_level = "warn";

    const auto path = (dir_ / "saved.ini").string();
    ASSERT_TRUE(save_config(config, path));

    auto loaded = load_config(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->device_id, "desk");
    EXPECT_EQ(loaded->capabilities, config.capabilities);
    EXPECT_EQ(loaded->reliability.window_size, 16u);
    EXPECT_EQ(loaded->reliability.max_retries, 1u);
    EXPECT_FALSE(loaded->handshake.require_transport);
    EXPECT_EQ(loaded->resume_directory, config.resume_directory);
    EXPECT_EQ(loaded->log_level, "warn");
}

TEST_F(ConfigTest, ParseCli) {
    auto config = parse({"--device-id", "phone", "--capabilities", "encryption,lan,bluetooth",
                         "-w", "6", "-c", "131072", "--ack-timeout-ms", "750",
                         "--max-retries", "7", "--resume-dir", "/tmp/r", "-l", "trace"});

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->device_id, "phone");
    EXPECT_EQ(config->capabilities.size(), 3u);
    EXPECT_EQ(config->reliability.window_size, 6u);
    EXPECT_EQ(config->reliability.chunk_size, 131072u);
    EXPECT_EQ(config->reliability.ack_timeout, std::chrono::milliseconds(750));
    EXPECT_EQ(config->reliability.max_retries, 7u);
    EXPECT_EQ(config->resume_directory, "/tmp/r");
    EXPECT_EQ(config->log_level, "trace");
}

TEST_F(ConfigTest, ParseCliRejectsBadArguments) {
    EXPECT_FALSE(parse({"--window", "64"}).has_value());
    EXPECT_FALSE(parse({"--unknown-flag"}).has_value());
}

TEST_F(ConfigTest, MergePrefersNonDefaultOverlay) {
    ProtocolConfig base;
    base.device_id = "from-file";
    base.reliability.window_size = 8;
    base.resume_directory = "/data";

    ProtocolConfig overlay;
    overlay.reliability.chunk_size = 65536;
    overlay.log_level = "debug";

    auto merged = merge_config(base, overlay);
    EXPECT_EQ(merged.device_id, "from-file");
    EXPECT_EQ(merged.reliability.window_size, 8u);
    EXPECT_EQ(merged.reliability.chunk_size, 65536u);
    EXPECT_EQ(merged.resume_directory, "/data");
    EXPECT_EQ(merged.log_level, "debug");

    overlay.device_id = "from-cli";
    EXPECT_EQ(merge_config(base, overlay).device_id, "from-cli");
}

TEST_F(ConfigTest, ValidateAcceptsSaneConfig) {
    ProtocolConfig config;
    config.device_id = "ok";

    auto result = validate_config(config);
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(ConfigTest, ValidateReportsErrors) {
    ProtocolConfig config;
    config.capabilities = {{handshake::CAP_LAN, true}};
    config.reliability.window_size = 0;
    config.handshake.min_protocol_version = 5;

    auto result = validate_config(config);
    EXPECT_FALSE(result.valid);
    EXPECT_THAT(result.errors, Contains(HasSubstr("Device id")));
    EXPECT_THAT(result.errors, Contains(HasSubstr("Encryption")));
    EXPECT_THAT(result.errors, Contains(HasSubstr("Window size")));
    EXPECT_THAT(result.errors, Contains(HasSubstr("protocol version")));
}

TEST_F(ConfigTest, ValidateRejectsChunkLargerThanFrame) {
    ProtocolConfig config;
    config.device_id = "ok";

    config.reliability.chunk_size = reliability::MAX_CHUNK_SIZE;
    auto at_limit = validate_config(config);
    EXPECT_TRUE(at_limit.valid);
    EXPECT_THAT(at_limit.warnings, Contains(HasSubstr("advised")));

    config.reliability.chunk_size = reliability::MAX_CHUNK_SIZE + 1;
    auto over = validate_config(config);
    EXPECT_FALSE(over.valid);
    EXPECT_THAT(over.errors, Contains(HasSubstr("frame limit")));
}

TEST_F(ConfigTest, ValidateWarnings) {
    ProtocolConfig config;
    config.device_id = "ok";
    config.capabilities = {{handshake::CAP_ENCRYPTION, true}};
    config.reliability.chunk_size = 1024;
    config.reliability.max_retries = 0;

    auto result = validate_config(config);
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.warnings.size(), 3u);
}

TEST_F(ConfigTest, CapabilityListParsing) {
    auto caps = parse_capabilities(" Encryption , lan,,wifi_aware ");
    EXPECT_EQ(caps.size(), 3u);
    EXPECT_TRUE(caps.at("encryption"));
    EXPECT_EQ(capabilities_to_string(caps), "encryption,lan,wifi_aware");
}

TEST_F(ConfigTest, LogLevelNames) {
    EXPECT_EQ(utils::string_to_log_level("WARN"), utils::LogLevel::WARN);
    EXPECT_EQ(utils::string_to_log_level("nonsense"), utils::LogLevel::INFO);
    EXPECT_STREQ(utils::log_level_to_string(utils::LogLevel::DEBUG), "debug");
    EXPECT_STREQ(utils::log_level_to_string(utils::LogLevel::WARN), "warn");
    EXPECT_EQ(utils::string_to_log_level("warning"), utils::LogLevel::WARN);
    EXPECT_EQ(utils::string_to_log_level("Fatal"), utils::LogLevel::CRITICAL);
}

TEST_F(ConfigTest, LogFileReceivesRecords) {
    const auto path = (dir_ / "ferry.log").string();
    utils::LogOptions options;
    options.level = utils::LogLevel::DEBUG;
    options.to_stdout = false;
    options.file = path;
    utils::init_logging(options);

    EXPECT_EQ(utils::get_log_level(), utils::LogLevel::DEBUG);
    spdlog::debug("chunk {} acknowledged", 3);
    spdlog::trace("filtered out");
    spdlog::default_logger()->flush();

    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_THAT(contents, HasSubstr("chunk 3 acknowledged"));
    EXPECT_THAT(contents, HasSubstr("[ferry]"));
    EXPECT_THAT(contents, ::testing::Not(HasSubstr("filtered out")));

    utils::init_logging(utils::LogLevel::INFO);
}

}  // namespace
}  // namespace ferry::config
