#pragma once
#include <filesystem>
#include <string>
#include "press/patch/PatchDecoder.hpp"

namespace press {

struct Config {
    std::size_t chunk_size = 50;
    std::string api_key;
    std::string log_level = "off";
    std::string output_directory = "./";
    std::string system_prompt = "You are a helpful assistant";
    float temperature = 0.0f;
    unsigned retries = 3;
    unsigned retry_delay_ms = 1000;
    unsigned max_tokens = 8192;
    std::string model = "deepseek-chat";
    std::string base_url = "https://api.deepseek.com";
    std::string response_format = "xml";
    bool use_preprocessor = true;

    ResponseFormat format() const { return parse_response_format(response_format); }

    // <output_directory>/press.output
    std::filesystem::path press_output_dir() const;

    // Throws ConfigError on values no run could use.
    void validate() const;
};

// press_config.json next to the running executable.
std::filesystem::path default_config_path();

// Loads the config, writing a default one first when the file is missing.
// Missing keys keep their defaults. Throws ConfigError on unreadable JSON.
Config load_config(const std::filesystem::path& path);

void save_config(const Config& config, const std::filesystem::path& path);

// Applies log_level ("off", "error", "warn", "info", "debug") to spdlog.
void apply_log_level(const std::string& level);

} // namespace press
