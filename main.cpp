#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/LogoScoutApp.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace logoscout;

namespace {

void PrintUsage() {
    std::cerr <<
        "Usage: logoscout [--config <settings.json>] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  download <company> [--size small|medium|large] [--format png|jpg|original]\n"
        "  resolve <company>\n"
        "  search <query> [--category <name>] [--limit <n>]\n"
        "  bulk [--size small|medium|large] <company> [<company> ...]   (max 20)\n"
        "  categories\n";
}

struct CliArgs {
    std::optional<std::string> configPath;
    std::string command;
    std::vector<std::string> positional;
    std::string size = "large";
    std::string format = "original";
    std::optional<std::string> category;
    std::size_t limit = 25;
};

bool ParseArgs(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto needValue = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << flag << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--config") {
            auto v = needValue("--config");
            if (!v) return false;
            args.configPath = *v;
        } else if (arg == "--size") {
            auto v = needValue("--size");
            if (!v) return false;
            args.size = *v;
        } else if (arg == "--format") {
            auto v = needValue("--format");
            if (!v) return false;
            args.format = *v;
        } else if (arg == "--category") {
            auto v = needValue("--category");
            if (!v) return false;
            args.category = *v;
        } else if (arg == "--limit") {
            auto v = needValue("--limit");
            if (!v) return false;
            try {
                const long parsed = std::stol(*v);
                if (parsed <= 0) throw std::out_of_range("limit");
                args.limit = static_cast<std::size_t>(parsed);
            } catch (const std::exception&) {
                std::cerr << "Invalid --limit: " << *v << std::endl;
                return false;
            }
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.push_back(arg);
        }
    }
    return !args.command.empty();
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!ParseArgs(argc, argv, args)) {
        PrintUsage();
        return 1;
    }

    auto size = domain::LogoSizeFromString(args.size);
    if (!size) {
        std::cerr << "Invalid --size: " << args.size << std::endl;
        return 1;
    }
    if (args.format != "png" && args.format != "jpg" && args.format != "original") {
        std::cerr << "Invalid --format: " << args.format << std::endl;
        return 1;
    }

    const auto settingsPath = args.configPath ? std::filesystem::path(*args.configPath)
                                              : infrastructure::PathUtils::GetDefaultSettingsPath();

    try {
        app::LogoScoutApp application(infrastructure::ConfigLoader::Load(settingsPath));

        if (args.command == "download" && args.positional.size() == 1) {
            return application.RunDownload(args.positional[0], *size, args.format);
        }
        if (args.command == "resolve" && args.positional.size() == 1) {
            return application.RunResolve(args.positional[0]);
        }
        if (args.command == "search" && args.positional.size() == 1) {
            return application.RunSearch(args.positional[0], args.category, args.limit);
        }
        if (args.command == "bulk" && !args.positional.empty()) {
            return application.RunBulk(args.positional, *size);
        }
        if (args.command == "categories" && args.positional.empty()) {
            return application.RunCategories();
        }
    } catch (const std::exception& e) {
        std::cerr << "[logoscout] Fatal error: " << e.what() << std::endl;
        return 1;
    }

    PrintUsage();
    return 1;
}
