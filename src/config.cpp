#include "press/config.hpp"
#include "press/errors.hpp"
#include "press/file_io.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace press {

namespace fs = std::filesystem;
using json = nlohmann::json;

fs::path Config::press_output_dir() const {
    return fs::path(output_directory) / "press.output";
}

void Config::validate() const {
    if (temperature < 0.0f || temperature > 2.0f) {
        throw ConfigError("temperature must be between 0.0 and 2.0");
    }
    std::error_code ec;
    if (!fs::is_directory(output_directory, ec)) {
        throw ConfigError("output directory does not exist: " + output_directory);
    }
    parse_response_format(response_format);
    if (base_url.empty()) throw ConfigError("base_url is empty");
}

fs::path default_config_path() {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec || !exe.has_parent_path()) return fs::current_path() / "press_config.json";
    return exe.parent_path() / "press_config.json";
}

void save_config(const Config& c, const fs::path& path) {
    json j = {
        {"chunk_size", c.chunk_size},
        {"api_key", c.api_key},
        {"log_level", c.log_level},
        {"output_directory", c.output_directory},
        {"system_prompt", c.system_prompt},
        {"temperature", c.temperature},
        {"retries", c.retries},
        {"retry_delay_ms", c.retry_delay_ms},
        {"max_tokens", c.max_tokens},
        {"model", c.model},
        {"base_url", c.base_url},
        {"response_format", c.response_format},
        {"use_preprocessor", c.use_preprocessor}
    };
    write_file_bytes(path.string(), j.dump(2));
}

Config load_config(const fs::path& path) {
    Config c;
    if (!fs::exists(path)) {
        spdlog::info("No config at {}, writing defaults", path.string());
        save_config(c, path);
        return c;
    }

    try {
        std::ifstream f(path);
        auto j = json::parse(f);
        c.chunk_size = j.value("chunk_size", c.chunk_size);
        c.api_key = j.value("api_key", c.api_key);
        c.log_level = j.value("log_level", c.log_level);
        c.output_directory = j.value("output_directory", c.output_directory);
        c.system_prompt = j.value("system_prompt", c.system_prompt);
        c.temperature = j.value("temperature", c.temperature);
        c.retries = j.value("retries", c.retries);
        c.retry_delay_ms = j.value("retry_delay_ms", c.retry_delay_ms);
        c.max_tokens = j.value("max_tokens", c.max_tokens);
        c.model = j.value("model", c.model);
        c.base_url = j.value("base_url", c.base_url);
        c.response_format = j.value("response_format", c.response_format);
        c.use_preprocessor = j.value("use_preprocessor", c.use_preprocessor);
    } catch (const json::exception& e) {
        throw ConfigError("cannot read " + path.string() + ": " + e.what());
    }
    return c;
}

void apply_log_level(const std::string& level) {
    if (level == "debug") spdlog::set_level(spdlog::level::debug);
    else if (level == "info") spdlog::set_level(spdlog::level::info);
    else if (level == "warn") spdlog::set_level(spdlog::level::warn);
    else if (level == "error") spdlog::set_level(spdlog::level::err);
    else spdlog::set_level(spdlog::level::off);
}

} // namespace press
