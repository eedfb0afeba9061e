#include "config.hpp"
#include "runner.hpp"
#include "tool.hpp"
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>

static void print_usage() {
    std::cout << "Usage: linkagent [options]\n"
              << "\n"
              << "Reads instructions from stdin, one per line, and writes JSON events to stdout.\n"
              << "A line is either plain text or {\"message\": \"...\", \"tools\": [{\"name\": \"read\", \"params\": {...}}]}.\n"
              << "\n"
              << "Options:\n"
              << "  -p, --prompt TEXT          Process a single instruction and exit\n"
              << "  --model ID                 Model in providerID/modelID form\n"
              << "  --working-directory DIR    Directory tools resolve relative paths against\n"
              << "  --compact-json             One event per line instead of pretty JSON\n"
              << "  --json-standard NAME       Event format: opencode (default) or claude\n"
              << "  --dry-run                  Echo instructions without running tools\n"
              << "  --verbose                  Log tool dispatch to stderr\n"
              << "  -h, --help                 Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  LINKAGENT_MODEL              Default model\n"
              << "  LINKAGENT_WORKING_DIRECTORY  Default working directory\n"
              << "  LINKAGENT_VERBOSE            Enable verbose logging (1/true)\n";
}

int main(int argc, char* argv[]) try {
    std::string prompt;
    bool has_prompt = false;
    std::string model_name;
    std::string working_directory;
    bool compact_json = false;
    bool dry_run = false;
    bool verbose = false;
    linkagent::JsonStandard json_standard = linkagent::JsonStandard::OpenCode;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-p") == 0 || std::strcmp(argv[i], "--prompt") == 0) && i + 1 < argc) {
            prompt = argv[++i];
            has_prompt = true;
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--working-directory") == 0 && i + 1 < argc) {
            working_directory = argv[++i];
        } else if (std::strcmp(argv[i], "--compact-json") == 0) {
            compact_json = true;
        } else if (std::strcmp(argv[i], "--json-standard") == 0 && i + 1 < argc) {
            auto standard = linkagent::parse_json_standard(argv[++i]);
            if (!standard) {
                std::cerr << "Unknown JSON standard: " << argv[i] << "\n";
                print_usage();
                return 1;
            }
            json_standard = *standard;
        } else if (std::strcmp(argv[i], "--dry-run") == 0) {
            dry_run = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = linkagent::Config::load();

    // Override config with CLI args
    if (!model_name.empty()) config.model = model_name;
    if (!working_directory.empty()) config.working_directory = working_directory;
    if (compact_json) config.compact_json = true;
    if (verbose) config.verbose = true;

    std::filesystem::path wd = config.working_directory.empty()
        ? std::filesystem::current_path()
        : std::filesystem::absolute(config.working_directory);
    std::error_code ec;
    if (!std::filesystem::is_directory(wd, ec)) {
        std::cerr << "Error: working directory does not exist: " << wd.string() << "\n";
        return 1;
    }

    linkagent::ToolRegistry registry(linkagent::create_builtin_tools(config.bash.default_timeout_ms));

    linkagent::RunnerOptions options;
    options.working_directory = wd;
    options.provider_id = config.provider_id();
    options.model_id = config.model_id();
    options.compact_json = config.compact_json;
    options.dry_run = dry_run;
    options.verbose = config.verbose;
    options.json_standard = json_standard;

    if (config.verbose) {
        std::cerr << "[main] model " << config.model << ", working directory "
                  << wd.string() << "\n";
    }

    linkagent::Runner runner(std::move(options), registry, std::cout);

    // Single prompt mode
    if (has_prompt) {
        runner.run_line(prompt);
        return 0;
    }

    runner.run_stream(std::cin);
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
