#include "press/cli.hpp"
#include "press/config.hpp"
#include "test_support.hpp"
#include <nlohmann/json.hpp>

using namespace press;
using press::test::TempDirTest;

class ConfigTest : public TempDirTest {};

TEST_F(ConfigTest, MissingFileWritesDefaults) {
    auto p = root_ / "press_config.json";
    Config c = load_config(p);
    EXPECT_TRUE(fs::exists(p));
    EXPECT_EQ(c.chunk_size, 50u);
    EXPECT_EQ(c.log_level, "off");
    EXPECT_EQ(c.retries, 3u);
    EXPECT_EQ(c.model, "deepseek-chat");
    EXPECT_EQ(c.format(), ResponseFormat::Tag);
}

TEST_F(ConfigTest, SaveLoadKeepsValues) {
    auto p = root_ / "press_config.json";
    Config c;
    c.chunk_size = 0;
    c.api_key = "sk-test";
    c.temperature = 0.5f;
    c.response_format = "json";
    c.use_preprocessor = false;
    save_config(c, p);

    Config back = load_config(p);
    EXPECT_EQ(back.chunk_size, 0u);
    EXPECT_EQ(back.api_key, "sk-test");
    EXPECT_FLOAT_EQ(back.temperature, 0.5f);
    EXPECT_EQ(back.format(), ResponseFormat::Json);
    EXPECT_FALSE(back.use_preprocessor);
}

TEST_F(ConfigTest, PartialFileKeepsDefaultsForMissingKeys) {
    write("press_config.json", R"({"chunk_size": 10})");
    Config c = load_config(root_ / "press_config.json");
    EXPECT_EQ(c.chunk_size, 10u);
    EXPECT_EQ(c.base_url, "https://api.deepseek.com");
}

TEST_F(ConfigTest, BadJsonIsConfigError) {
    write("press_config.json", "{chunk_size: ");
    EXPECT_THROW(load_config(root_ / "press_config.json"), ConfigError);
    write("press_config.json", R"({"chunk_size": "many"})");
    EXPECT_THROW(load_config(root_ / "press_config.json"), ConfigError);
}

TEST_F(ConfigTest, ValidateRejectsUnusableValues) {
    Config c;
    c.output_directory = root_.string();
    EXPECT_NO_THROW(c.validate());
    EXPECT_EQ(c.press_output_dir(), root_ / "press.output");

    c.temperature = 2.5f;
    EXPECT_THROW(c.validate(), ConfigError);
    c.temperature = 1.0f;
    c.output_directory = path("missing");
    EXPECT_THROW(c.validate(), ConfigError);
    c.output_directory = root_.string();
    c.response_format = "yaml";
    EXPECT_THROW(c.validate(), ConfigError);
}

static Args parse(std::vector<std::string> words) {
    std::vector<char*> argv;
    static std::string prog = "press";
    argv.push_back(prog.data());
    for (auto& w : words) argv.push_back(w.data());
    return parse_cli(static_cast<int>(argv.size()), argv.data());
}

TEST(Cli, RunWithPathsIgnoreAndPrompt) {
    Args a = parse({"-p", "src", "lib&docs", "-i", "src/gen", "-P", "fix the bug", "-a"});
    EXPECT_EQ(a.command, Command::Run);
    EXPECT_EQ(a.paths, (std::vector<std::string>{"src", "lib", "docs"}));
    EXPECT_EQ(a.ignore, (std::vector<std::string>{"src/gen"}));
    EXPECT_EQ(a.prompt, "fix the bug");
    EXPECT_TRUE(a.auto_mode);
}

TEST(Cli, Subcommands) {
    EXPECT_EQ(parse({"rollback"}).command, Command::Rollback);

    Args cp = parse({"checkpoint", "-p", "src"});
    EXPECT_EQ(cp.command, Command::Checkpoint);
    EXPECT_FALSE(cp.revert);
    EXPECT_TRUE(parse({"checkpoint", "--revert"}).revert);

    Args cfg = parse({"config", "--set-chunk-size", "25", "--set-retries", "5", "--set-response-format", "json"});
    EXPECT_EQ(cfg.command, Command::Config);
    EXPECT_EQ(cfg.set_chunk_size.value(), 25u);
    EXPECT_EQ(cfg.set_retries.value(), 5u);
    EXPECT_EQ(cfg.set_response_format.value(), "json");

    Args model = parse({"model-config", "--set-temperature", "0.7", "--set-api-key", "k"});
    EXPECT_FLOAT_EQ(model.set_temperature.value(), 0.7f);
    EXPECT_EQ(model.set_api_key.value(), "k");
}

TEST(Cli, RejectsBadInput) {
    EXPECT_THROW(parse({"--bogus"}), UsageError);
    EXPECT_THROW(parse({"-P"}), UsageError);
    EXPECT_THROW(parse({"-p"}), UsageError);
    EXPECT_THROW(parse({"config", "--set-chunk-size", "-4"}), UsageError);
    EXPECT_THROW(parse({"config", "--set-chunk-size", "ten"}), UsageError);
    EXPECT_THROW(parse({"checkpoint"}), UsageError);
    EXPECT_THROW(parse({"checkpoint", "-p", "a", "--revert"}), UsageError);
    EXPECT_THROW(parse({"rollback", "-a"}), UsageError);
}
