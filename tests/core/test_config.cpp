/**
 * @file test_config.cpp
 * @brief Unit tests for the INI host configuration loader.
 */

#include <catch2/catch_test_macros.hpp>

#include <modbridge/core/config.hpp>

#include <string>
#include <vector>

using namespace modbridge;
using namespace modbridge::core;

TEST_CASE("Config defaults", "[core][config]") {
    Config cfg;
    REQUIRE(cfg.sandbox().max_memory_mb == 64);
    REQUIRE(cfg.sandbox().allow_source);
    REQUIRE_FALSE(cfg.sandbox().allow_binary_chunks);
    REQUIRE(cfg.scheduler().worker_threads == 0);
    REQUIRE(cfg.scheduler().instances_per_module == 1);
    REQUIRE_FALSE(cfg.components().auto_register_guest_types);
    REQUIRE(cfg.modules().phase_allowed(phases::kStartup));
    REQUIRE(cfg.modules().phase_allowed(phases::kFixedUpdate));
    REQUIRE_FALSE(cfg.modules().phase_allowed("render"));
    REQUIRE_FALSE(cfg.modules().despawn_on_unload);
    REQUIRE(cfg.logging().level == LogLevel::Info);
}

TEST_CASE("Config parses sections and keys", "[core][config]") {
    Config cfg;
    cfg.load_from_string(R"(
# host settings
[sandbox]
max_memory_mb = 32
max_instructions = 5000   ; per call
max_time_sec = 0.5
allow_binary_chunks = yes

[scheduler]
worker_threads = 4
instances_per_module = 2

[components]
auto_register_guest_types = true

[modules]
allowed_phases = startup, update ,render,
despawn_on_unload = on

[logging]
level = "warn"
file = host.log
)");

    REQUIRE(cfg.sandbox().max_memory_mb == 32);
    REQUIRE(cfg.sandbox().max_instructions == 5000);
    REQUIRE(cfg.sandbox().max_time_sec == 0.5);
    REQUIRE(cfg.sandbox().allow_binary_chunks);
    REQUIRE(cfg.scheduler().worker_threads == 4);
    REQUIRE(cfg.scheduler().instances_per_module == 2);
    REQUIRE(cfg.components().auto_register_guest_types);
    REQUIRE(cfg.modules().allowed_phases == std::vector<std::string>{"startup", "update", "render"});
    REQUIRE_FALSE(cfg.modules().phase_allowed(phases::kPostUpdate));
    REQUIRE(cfg.modules().despawn_on_unload);
    REQUIRE(cfg.logging().level == LogLevel::Warning);
    REQUIRE(cfg.logging().file == "host.log");
}

TEST_CASE("Config keeps defaults for malformed values", "[core][config]") {
    Config cfg;
    cfg.load_from_string(R"(
[sandbox]
max_memory_mb = lots
allow_source = maybe
[scheduler]
instances_per_module = 0
[unknown]
key = value
)");

    REQUIRE(cfg.sandbox().max_memory_mb == 64);
    REQUIRE(cfg.sandbox().allow_source);
    // Clamped to at least one instance
    REQUIRE(cfg.scheduler().instances_per_module == 1);
}

TEST_CASE("Config clamps the memory cap", "[core][config]") {
    Config cfg;
    cfg.load_from_string(R"(
[sandbox]
max_memory_mb = 17592186044416
)");

    REQUIRE(cfg.sandbox().max_memory_mb == SandboxSettings::kMaxMemoryMB);

    // Still a real limit once converted to bytes
    const std::size_t bytes = cfg.sandbox().max_memory_mb * 1024 * 1024;
    REQUIRE(bytes > 0);
    REQUIRE(bytes / (1024 * 1024) == SandboxSettings::kMaxMemoryMB);
}

TEST_CASE("Log level names", "[core][config]") {
    REQUIRE(Config::log_level_from_string("debug", LogLevel::Info) == LogLevel::Debug);
    REQUIRE(Config::log_level_from_string("ERROR", LogLevel::Info) == LogLevel::Error);
    REQUIRE(Config::log_level_from_string("2", LogLevel::Info) == LogLevel::Warning);
    REQUIRE(Config::log_level_from_string("loud", LogLevel::Info) == LogLevel::Info);
}

TEST_CASE("Config reports missing files", "[core][config]") {
    Config cfg;
    REQUIRE_FALSE(cfg.load_from_file("/nonexistent/modhost.ini"));
    REQUIRE(cfg.loaded_from_path().empty());
}
