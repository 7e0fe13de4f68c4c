/**
 * httpconf - Configuration Check
 *
 * Loads and resolves the HTTP configuration of an application directory
 * and prints the resolved snapshot as JSON. Exits non-zero when the
 * configuration would abort application startup.
 *
 *   httpconf-check [--root DIR] [--mode dev|test|prod] [--config FILE]
 *                  [--set key=value]... [--verbose] [--json-log] [--show-secret]
 */

#include <httpconf/config/loader.hpp>
#include <httpconf/http/http_configuration.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

using namespace httpconf;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitUsage = 2;

void print_usage(std::ostream& out) {
    out << "Usage: httpconf-check [options]\n"
        << "\n"
        << "Options:\n"
        << "  --root DIR         Application root (default: current directory)\n"
        << "  --mode MODE        dev, test or prod (default: dev)\n"
        << "  --config FILE      Configuration file to use instead of conf/application.json\n"
        << "  --set KEY=VALUE    Override a configuration key (repeatable)\n"
        << "  --verbose          Log at debug level\n"
        << "  --json-log         Write log lines as JSON\n"
        << "  --show-secret      Print the secret instead of masking it\n"
        << "  --help             Show this message\n";
}

int usage_error(const std::string& message) {
    std::cerr << "httpconf-check: " << message << "\n\n";
    print_usage(std::cerr);
    return kExitUsage;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::filesystem::path root = std::filesystem::current_path();
    Mode mode = Mode::Dev;
    LoadOptions options;
    bool verbose = false;
    bool json_log = false;
    bool show_secret = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        auto next_value = [&]() -> const char* {
            return i + 1 < argc ? argv[++i] : nullptr;
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(std::cout);
            return kExitOk;
        } else if (arg == "--root") {
            const char* value = next_value();
            if (!value) return usage_error("--root requires a directory");
            root = value;
        } else if (arg == "--mode") {
            const char* value = next_value();
            if (!value) return usage_error("--mode requires a value");
            auto parsed = parse_mode(value);
            if (!parsed) return usage_error("unknown mode '" + std::string(value) + "'");
            mode = *parsed;
        } else if (arg == "--config") {
            const char* value = next_value();
            if (!value) return usage_error("--config requires a file");
            options.config_file = std::filesystem::path(value);
        } else if (arg == "--set") {
            const char* value = next_value();
            if (!value) return usage_error("--set requires key=value");
            auto pair = parse_override(value);
            if (!pair) return usage_error("malformed override '" + std::string(value) + "'");
            options.overrides.push_back(std::move(*pair));
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--json-log") {
            json_log = true;
        } else if (arg == "--show-secret") {
            show_secret = true;
        } else {
            return usage_error("unknown argument '" + std::string(arg) + "'");
        }
    }

    if (!std::filesystem::is_directory(root)) {
        return usage_error("not a directory: " + root.string());
    }

    Logger logger("httpconf");
    logger.set_level(verbose ? LogLevel::Debug : LogLevel::Info);
    if (json_log) {
        logger.add_sink(std::make_shared<JsonSink>());
    } else {
        logger.add_sink(std::make_shared<ConsoleSink>());
    }

    Environment environment(std::filesystem::absolute(root), mode);

    auto config = load_configuration(environment, options, logger);
    if (!config) {
        logger.error(config.error().to_string());
        return kExitConfigError;
    }

    HttpConfigurationProvider provider(std::move(*config), environment, logger);
    const auto& result = provider.get();
    if (!result) {
        auto entry = logger.entry(LogLevel::Error, result.error().to_string());
        entry.field("mode", mode_name(mode));
        if (const auto& weak = result.error().weak_secret_info()) {
            entry.field("algorithm", weak->algorithm)
                 .field("required_bits", weak->required_bits)
                 .field("actual_bits", weak->actual_bits);
        }
        logger.log(entry);
        return kExitConfigError;
    }

    std::cout << json::pretty(result->to_json(show_secret)) << std::endl;
    return kExitOk;
}
