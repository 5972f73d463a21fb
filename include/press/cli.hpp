#pragma once
#include <optional>
#include <string>
#include <vector>
#include "press/errors.hpp"

namespace press {

class UsageError : public PressError {
public:
    explicit UsageError(const std::string& msg) : PressError(msg) {}
};

enum class Command { Run, Rollback, Checkpoint, Config, ModelConfig, Help };

struct Args {
    Command command = Command::Run;

    // run / checkpoint
    std::vector<std::string> paths;
    std::vector<std::string> ignore;
    std::string prompt;
    bool auto_mode = false;
    bool revert = false;

    // config
    std::optional<std::size_t> set_chunk_size;
    std::optional<std::string> set_log_level;
    std::optional<std::string> set_output_directory;
    std::optional<unsigned> set_retries;
    std::optional<std::string> set_response_format;

    // model-config
    std::optional<std::string> set_api_key;
    std::optional<std::string> set_system_prompt;
    std::optional<float> set_temperature;
};

extern const char* USAGE;

// Throws UsageError on unknown flags or missing values. Multi-valued flags
// (-p, -i) take every following non-flag argument; '&' also separates values.
Args parse_cli(int argc, char** argv);

} // namespace press
