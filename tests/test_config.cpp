#include "pitwall/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <vector>

using namespace pitwall;

namespace {

/// argv holder; parse_command_line takes char *argv[].
class Args {
  public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "pitwall");
        for (auto &s : storage_) {
            ptrs_.push_back(s.data());
        }
        ptrs_.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage_.size()); }
    char **argv() { return ptrs_.data(); }

  private:
    std::vector<std::string> storage_;
    std::vector<char *> ptrs_;
};

} // namespace

TEST(Config, Defaults) {
    Config c;
    EXPECT_EQ(c.bind_address, "0.0.0.0");
    EXPECT_EQ(c.port, 20777);
    EXPECT_EQ(c.receive_timeout.count(), 1000);
    EXPECT_EQ(c.max_datagram_bytes, 2048u);
    EXPECT_FALSE(c.car_index.has_value());
    EXPECT_EQ(c.expected_format, 2025);
    EXPECT_EQ(c.retention_frames, 8u);
    EXPECT_EQ(c.websocket_port, 0);
}

TEST(Config, ParsesEverySection) {
    auto doc = nlohmann::json::parse(R"({
        "listen": {"address": "127.0.0.1", "port": 20888, "receive_timeout_ms": 250,
                   "max_datagram_bytes": 4096, "exit_on_idle": true},
        "decoder": {"car_index": 19, "expected_format": 2024},
        "aggregator": {"retention_frames": 3},
        "input": {"replay_path": "session.pwcap"},
        "output": {"jsonl_path": "frames.jsonl", "capture_path": "raw.pwcap",
                   "websocket_port": 9002},
        "progress_interval": 0
    })");

    auto c = parse_config(doc);
    EXPECT_EQ(c.bind_address, "127.0.0.1");
    EXPECT_EQ(c.port, 20888);
    EXPECT_EQ(c.receive_timeout.count(), 250);
    EXPECT_EQ(c.max_datagram_bytes, 4096u);
    EXPECT_TRUE(c.exit_on_idle);
    ASSERT_TRUE(c.car_index.has_value());
    EXPECT_EQ(*c.car_index, 19);
    EXPECT_EQ(c.expected_format, 2024);
    EXPECT_EQ(c.retention_frames, 3u);
    EXPECT_EQ(c.replay_path, "session.pwcap");
    EXPECT_EQ(c.output_path, "frames.jsonl");
    EXPECT_EQ(c.capture_path, "raw.pwcap");
    EXPECT_EQ(c.websocket_port, 9002);
    EXPECT_EQ(c.progress_interval, 0u);
}

TEST(Config, EmptyDocumentKeepsDefaults) {
    auto c = parse_config(nlohmann::json::object());
    EXPECT_EQ(c.port, 20777);
    EXPECT_FALSE(c.car_index.has_value());
}

TEST(Config, NullCarIndexMeansFollowHeader) {
    auto c = parse_config(nlohmann::json::parse(R"({"decoder": {"car_index": null}})"));
    EXPECT_FALSE(c.car_index.has_value());
}

TEST(Config, CarIndexOutOfRangeRejected) {
    auto doc = nlohmann::json::parse(R"({"decoder": {"car_index": 22}})");
    EXPECT_THROW(parse_config(doc), std::runtime_error);
}

TEST(Config, WrongTypesRejected) {
    EXPECT_THROW(parse_config(nlohmann::json::parse(R"({"listen": {"port": "20777"}})")),
                 std::runtime_error);
    EXPECT_THROW(parse_config(nlohmann::json::parse(R"({"listen": []})")), std::runtime_error);
    EXPECT_THROW(parse_config(nlohmann::json::parse(R"({"listen": {"exit_on_idle": 1}})")),
                 std::runtime_error);
    EXPECT_THROW(parse_config(nlohmann::json::parse("[1, 2]")), std::runtime_error);
}

TEST(Config, RangeErrorsNameTheField) {
    try {
        parse_config(nlohmann::json::parse(R"({"listen": {"port": 70000}})"));
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error &e) {
        EXPECT_NE(std::string(e.what()).find("listen.port"), std::string::npos);
    }
}

TEST(Config, ReplayAndCapturePathsMustDiffer) {
    auto doc = nlohmann::json::parse(
        R"({"input": {"replay_path": "a.pwcap"}, "output": {"capture_path": "a.pwcap"}})");
    EXPECT_THROW(parse_config(doc), std::runtime_error);
}

TEST(Config, LoadConfigErrors) {
    EXPECT_THROW(load_config("/nonexistent-dir/pitwall.json"), std::runtime_error);

    const auto path = (std::filesystem::temp_directory_path() / "pitwall_bad_config.json").string();
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(load_config(path), std::runtime_error);
    std::filesystem::remove(path);
}

TEST(CommandLine, FlagsOverrideDefaults) {
    Args args{"--port", "30000", "--car-index", "5", "--retention", "12", "--any-format",
              "--exit-on-idle", "--output", "out.jsonl"};
    auto cli = parse_command_line(args.argc(), args.argv());
    EXPECT_FALSE(cli.show_help);
    EXPECT_EQ(cli.config.port, 30000);
    ASSERT_TRUE(cli.config.car_index.has_value());
    EXPECT_EQ(*cli.config.car_index, 5);
    EXPECT_EQ(cli.config.retention_frames, 12u);
    EXPECT_EQ(cli.config.expected_format, 0);
    EXPECT_TRUE(cli.config.exit_on_idle);
    EXPECT_EQ(cli.config.output_path, "out.jsonl");
}

TEST(CommandLine, FlagsOverrideConfigFile) {
    const auto path = (std::filesystem::temp_directory_path() / "pitwall_cli_config.json").string();
    {
        std::ofstream out(path);
        out << R"({"listen": {"port": 21000, "address": "127.0.0.1"}})";
    }
    Args args{"--port", "22000", "--config", path};
    auto cli = parse_command_line(args.argc(), args.argv());
    EXPECT_EQ(cli.config.port, 22000);
    EXPECT_EQ(cli.config.bind_address, "127.0.0.1");
    std::filesystem::remove(path);
}

TEST(CommandLine, Help) {
    Args args{"--help"};
    EXPECT_TRUE(parse_command_line(args.argc(), args.argv()).show_help);
    EXPECT_NE(std::string(usage()).find("--car-index"), std::string::npos);
}

TEST(CommandLine, BadValuesRejected) {
    Args bad_car{"--car-index", "22"};
    EXPECT_THROW(parse_command_line(bad_car.argc(), bad_car.argv()), std::runtime_error);

    Args not_number{"--port", "20777x"};
    EXPECT_THROW(parse_command_line(not_number.argc(), not_number.argv()), std::runtime_error);

    Args missing{"--port"};
    EXPECT_THROW(parse_command_line(missing.argc(), missing.argv()), std::runtime_error);

    Args unknown{"--frobnicate"};
    EXPECT_THROW(parse_command_line(unknown.argc(), unknown.argv()), std::runtime_error);
}
