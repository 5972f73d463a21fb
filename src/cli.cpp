#include "press/cli.hpp"
#include <sstream>
#include <type_traits>

namespace press {

const char* USAGE =
"press -p <path>... [-i <ignore>...] -P \"prompt\" [-a]\n"
"press rollback\n"
"press checkpoint -p <path>...\n"
"press checkpoint --revert\n"
"press config [--set-chunk-size N] [--set-log-level L] [--set-output-directory D] [--set-retries N]\n"
"             [--set-response-format xml|json]\n"
"press model-config [--set-api-key K] [--set-system-prompt S] [--set-temperature T]\n";

static void split_values(const std::string& raw, std::vector<std::string>& out) {
    std::stringstream ss(raw);
    std::string item;
    while (std::getline(ss, item, '&')) {
        if (!item.empty()) out.push_back(item);
    }
}

template<typename T, typename Conv>
static T convert(const std::string& flag, const std::string& v, Conv conv) {
    if (std::is_unsigned<T>::value && v.find('-') != std::string::npos) {
        throw UsageError("Invalid value for " + flag + ": " + v);
    }
    try {
        std::size_t used = 0;
        T value = conv(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        return value;
    } catch (const std::logic_error&) {
        throw UsageError("Invalid value for " + flag + ": " + v);
    }
}

Args parse_cli(int argc, char** argv) {
    Args a;
    int i = 1;
    if (i < argc) {
        std::string first = argv[i];
        if (first == "rollback") { a.command = Command::Rollback; i++; }
        else if (first == "checkpoint") { a.command = Command::Checkpoint; i++; }
        else if (first == "config") { a.command = Command::Config; i++; }
        else if (first == "model-config") { a.command = Command::ModelConfig; i++; }
        else if (first == "help" || first == "-h" || first == "--help") { a.command = Command::Help; return a; }
    }

    while (i < argc) {
        std::string f = argv[i++];
        auto next = [&]() -> std::string {
            if (i >= argc) throw UsageError("Missing value after " + f);
            return argv[i++];
        };
        auto many = [&](std::vector<std::string>& dst) {
            std::size_t before = dst.size();
            while (i < argc && argv[i][0] != '-') split_values(argv[i++], dst);
            if (dst.size() == before) throw UsageError("Missing value after " + f);
        };

        if ((f == "-p" || f == "--paths") && (a.command == Command::Run || a.command == Command::Checkpoint)) many(a.paths);
        else if ((f == "-i" || f == "--ignore") && a.command == Command::Run) many(a.ignore);
        else if ((f == "-P" || f == "--prompt") && a.command == Command::Run) a.prompt = next();
        else if ((f == "-a" || f == "--auto") && a.command == Command::Run) a.auto_mode = true;
        else if (f == "--revert" && a.command == Command::Checkpoint) a.revert = true;
        else if (f == "--set-chunk-size" && a.command == Command::Config)
            a.set_chunk_size = convert<unsigned long>(f, next(), [](const std::string& s, std::size_t* n) { return std::stoul(s, n); });
        else if (f == "--set-log-level" && a.command == Command::Config) a.set_log_level = next();
        else if (f == "--set-output-directory" && a.command == Command::Config) a.set_output_directory = next();
        else if (f == "--set-retries" && a.command == Command::Config)
            a.set_retries = convert<unsigned long>(f, next(), [](const std::string& s, std::size_t* n) { return std::stoul(s, n); });
        else if (f == "--set-response-format" && a.command == Command::Config) a.set_response_format = next();
        else if (f == "--set-api-key" && a.command == Command::ModelConfig) a.set_api_key = next();
        else if (f == "--set-system-prompt" && a.command == Command::ModelConfig) a.set_system_prompt = next();
        else if (f == "--set-temperature" && a.command == Command::ModelConfig)
            a.set_temperature = convert<float>(f, next(), [](const std::string& s, std::size_t* n) { return std::stof(s, n); });
        else throw UsageError("Unknown flag: " + f);
    }

    if (a.command == Command::Checkpoint && a.revert == !a.paths.empty()) {
        throw UsageError("checkpoint takes either -p <path>... or --revert");
    }
    return a;
}

} // namespace press
