#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>

#include "press/PressRunner.hpp"
#include "press/api/DeepSeekClient.hpp"
#include "press/cli.hpp"
#include "press/config.hpp"

using namespace press;

static int handle_config(const Args& args, Config& config, const fs::path& config_path) {
    if (args.set_chunk_size) {
        config.chunk_size = *args.set_chunk_size;
        std::cout << "Chunk size set to " << config.chunk_size << "\n";
    }
    if (args.set_log_level) {
        config.log_level = *args.set_log_level;
        std::cout << "Log level set to " << config.log_level << "\n";
    }
    if (args.set_output_directory) {
        config.output_directory = *args.set_output_directory;
        std::cout << "Output directory set to " << config.output_directory << "\n";
    }
    if (args.set_retries) {
        config.retries = *args.set_retries;
        std::cout << "Retries set to " << config.retries << "\n";
    }
    if (args.set_response_format) {
        config.response_format = to_string(parse_response_format(*args.set_response_format));
        std::cout << "Response format set to " << config.response_format << "\n";
    }
    save_config(config, config_path);
    return 0;
}

static int handle_model_config(const Args& args, Config& config, const fs::path& config_path) {
    if (args.set_api_key) {
        config.api_key = *args.set_api_key;
        std::cout << "API key set\n";
    }
    if (args.set_system_prompt) {
        config.system_prompt = *args.set_system_prompt;
        std::cout << "System prompt set to: " << config.system_prompt << "\n";
    }
    if (args.set_temperature) {
        if (*args.set_temperature < 0.0f || *args.set_temperature > 2.0f) {
            throw ConfigError("temperature must be between 0.0 and 2.0");
        }
        config.temperature = *args.set_temperature;
        std::cout << "Temperature set to: " << config.temperature << "\n";
    }
    save_config(config, config_path);
    return 0;
}

static std::shared_ptr<CompletionService> make_client(const Config& config) {
    ClientSettings settings;
    settings.api_key = config.api_key;
    settings.base_url = config.base_url;
    settings.model = config.model;
    settings.temperature = config.temperature;
    settings.max_tokens = config.max_tokens;
    return std::make_shared<DeepSeekClient>(settings);
}

static int handle_run(const Args& args, const Config& config) {
    if (args.paths.empty()) throw UsageError("no paths given (-p)");
    if (args.prompt.empty()) throw UsageError("no prompt given (-P)");
    if (config.api_key.empty()) {
        throw ConfigError("API key is not set; run `press model-config --set-api-key <key>`");
    }

    std::cout << "Pressing files...\n";
    PressRunner runner(config, make_client(config));
    RunRequest request{args.paths, args.ignore, args.prompt, args.auto_mode};
    RunOutcome outcome = runner.run(request);

    std::cout << "Sent " << outcome.files_sent << " of " << outcome.files_scanned << " files\n";
    std::cout << "Modified " << outcome.report.modified << ", created " << outcome.report.created
              << " files. Output: " << outcome.output_dir << "\n";
    for (const auto& failure : outcome.report.failures) {
        std::cerr << "  skipped " << failure.path << ": " << failure.message << "\n";
    }
    if (!outcome.free_text.empty()) std::cout << "\n" << outcome.free_text << "\n";
    return outcome.report.failures.empty() ? 0 : 2;
}

int main(int argc, char** argv) {
    try {
        Args args = parse_cli(argc, argv);
        if (args.command == Command::Help) {
            std::cout << USAGE;
            return 0;
        }

        fs::path config_path = default_config_path();
        Config config = load_config(config_path);
        apply_log_level(config.log_level);
        spdlog::debug("Config loaded from {}", config_path.string());

        switch (args.command) {
            case Command::Config:
                return handle_config(args, config, config_path);
            case Command::ModelConfig:
                return handle_model_config(args, config, config_path);
            case Command::Rollback: {
                auto summary = PressRunner(config, nullptr).rollback();
                std::cout << "Rollback complete: " << summary.restored << " restored, "
                          << summary.deleted << " deleted\n";
                return 0;
            }
            case Command::Checkpoint: {
                PressRunner runner(config, nullptr);
                if (args.revert) {
                    auto summary = runner.revert();
                    std::cout << "Reverted " << summary.restored << " files to checkpoint\n";
                } else {
                    std::cout << "Checkpoint created with " << runner.checkpoint(args.paths) << " files\n";
                }
                return 0;
            }
            default:
                return handle_run(args, config);
        }
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << USAGE;
        return 1;
    } catch (const PressError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
}
