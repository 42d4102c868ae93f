// modhost - runs sandboxed Lua modules against an EnTT world

#include <modbridge/bridge/mod_host.hpp>
#include <modbridge/components/common.hpp>
#include <modbridge/core/config.hpp>
#include <modbridge/core/logger.hpp>
#include <modbridge/world/entt_world.hpp>

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#ifndef MODBRIDGE_VERSION
#define MODBRIDGE_VERSION "0.0.0-dev"
#endif

namespace {

using namespace modbridge;

void print_usage(const char* progname) {
    std::cout << "Usage: " << progname << " [options] <module.lua>...\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>     Host configuration (INI)\n";
    std::cout << "  --frames <n>        Frames to run (default: 1)\n";
    std::cout << "  --phase <name>      Phase to run each frame, repeatable (default: update)\n";
    std::cout << "  --entities <n>      Entities with position+velocity to seed (default: 4)\n";
    std::cout << "  --verbose           Enable debug logging\n";
    std::cout << "  --quiet             Disable most logging\n";
    std::cout << "  --help              Show this help message\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << progname << " --frames 10 --phase pre_update --phase update gravity.lua\n";
}

struct Args {
    std::string configPath;
    int frames = 1;
    int entities = 4;
    std::vector<std::string> phases;
    std::vector<std::string> modules;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            args.help = true;
        }
        else if (std::strcmp(arg, "--config") == 0 && i + 1 < argc) {
            args.configPath = argv[++i];
        }
        else if (std::strcmp(arg, "--frames") == 0 && i + 1 < argc) {
            args.frames = std::atoi(argv[++i]);
        }
        else if (std::strcmp(arg, "--phase") == 0 && i + 1 < argc) {
            args.phases.emplace_back(argv[++i]);
        }
        else if (std::strcmp(arg, "--entities") == 0 && i + 1 < argc) {
            args.entities = std::atoi(argv[++i]);
        }
        else if (std::strcmp(arg, "--verbose") == 0) {
            args.verbose = true;
        }
        else if (std::strcmp(arg, "--quiet") == 0) {
            args.quiet = true;
        }
        else if (arg[0] == '-') {
            std::cerr << "[WARNING] Unknown argument: " << arg << "\n";
        }
        else {
            args.modules.emplace_back(arg);
        }
    }

    if (args.phases.empty()) {
        args.phases.emplace_back(phases::kUpdate);
    }
    return args;
}

bool read_file(const std::string& path, Bytes& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

std::string module_name(const std::string& path) {
    auto slash = path.find_last_of("/\\");
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    auto dot = name.rfind('.');
    return dot == std::string::npos ? name : name.substr(0, dot);
}

void seed_world(world::EnttWorld& world, int count) {
    auto& registry = world.registry();
    for (int i = 0; i < count; ++i) {
        auto e = registry.create();
        registry.emplace<components::Position>(e, static_cast<float>(i), 10.0f, 0.0f);
        registry.emplace<components::Velocity>(e, 0.0f, 0.0f, 0.0f);
    }
}

void print_report(int frame, const bridge::PhaseReport& report) {
    using bridge::CallOutcome;

    std::cout << "[frame " << frame << "] " << report.phase << ": "
              << report.count(CallOutcome::Success) << " ok, "
              << report.count(CallOutcome::GuestFailure) << " failed, "
              << report.count(CallOutcome::Trap) << " trapped, "
              << report.count(CallOutcome::Skipped) << " skipped\n";

    auto print_system = [](const bridge::SystemReport& s) {
        std::cout << "    " << s.moduleName << "/" << s.system << " "
                  << bridge::call_outcome_name(s.outcome);
        if (s.outcome == CallOutcome::Success) {
            std::cout << " (" << s.apply.applied << " applied, " << s.apply.skipped << " skipped)";
        } else if (!s.status.ok()) {
            std::cout << " " << s.status.describe();
        }
        std::cout << "\n";
    };

    for (const auto& s : report.startup) print_system(s);
    for (const auto& s : report.systems) print_system(s);
}

} // namespace

int main(int argc, char* argv[]) {
    Args args = parse_args(argc, argv);

    if (args.help || args.modules.empty()) {
        std::cout << "modhost v" << MODBRIDGE_VERSION << "\n\n";
        print_usage(argv[0]);
        return args.help ? 0 : 1;
    }

    core::Config config;
    if (!args.configPath.empty() && !config.load_from_file(args.configPath)) {
        std::cerr << "[ERROR] Failed to read config " << args.configPath << "\n";
        return 1;
    }

    auto hostConfig = config.get();
    if (args.quiet) {
        hostConfig.logging.level = LogLevel::Error;
    } else if (args.verbose) {
        hostConfig.logging.level = LogLevel::Debug;
    }
    core::Logger::instance().init(hostConfig.logging);

    components::ComponentTypeRegistry types;
    if (auto status = components::register_common_components(types); !status) {
        std::cerr << "[ERROR] " << status.describe() << "\n";
        return 1;
    }

    world::EnttWorld world(types);
    seed_world(world, args.entities);

    bridge::ModHost host(world, types, hostConfig);

    int loaded = 0;
    for (const auto& path : args.modules) {
        Bytes bytes;
        if (!read_file(path, bytes)) {
            std::cerr << "[ERROR] Cannot read " << path << "\n";
            continue;
        }
        auto result = host.load(module_name(path), bytes);
        if (!result) {
            std::cerr << "[ERROR] " << path << ": " << result.status.describe() << "\n";
            continue;
        }
        ++loaded;
    }

    if (loaded == 0) {
        std::cerr << "[ERROR] No module loaded\n";
        core::Logger::instance().shutdown();
        return 1;
    }

    for (int frame = 0; frame < args.frames; ++frame) {
        for (const auto& phase : args.phases) {
            print_report(frame, host.run_phase(phase));
        }
    }

    core::Logger::instance().shutdown();
    return 0;
}
