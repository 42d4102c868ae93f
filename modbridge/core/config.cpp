#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace modbridge::core {

namespace {

std::string strip_quotes(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

} // namespace

std::string Config::trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string Config::to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool Config::parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

long long Config::parse_int(const std::string& v, long long default_value) {
    try {
        std::size_t idx = 0;
        const std::string s = trim(v);
        long long out = std::stoll(s, &idx, 10);
        if (idx != s.size()) return default_value;
        return out;
    } catch (const std::logic_error&) {
        // std::invalid_argument / std::out_of_range
        return default_value;
    }
}

double Config::parse_double(const std::string& v, double default_value) {
    try {
        std::size_t idx = 0;
        const std::string s = trim(v);
        double out = std::stod(s, &idx);
        if (idx != s.size()) return default_value;
        return out;
    } catch (const std::logic_error&) {
        return default_value;
    }
}

std::vector<std::string> Config::parse_list(const std::string& v) {
    std::vector<std::string> out;
    std::istringstream in(v);
    std::string item;
    while (std::getline(in, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

bool ModuleSettings::phase_allowed(const std::string& phase) const {
    return std::find(allowed_phases.begin(), allowed_phases.end(), phase) != allowed_phases.end();
}

LogLevel Config::log_level_from_string(const std::string& v, LogLevel default_value) {
    std::string s = to_lower(strip_quotes(v));

    static const std::unordered_map<std::string, LogLevel> map = {
        {"debug", LogLevel::Debug},
        {"trace", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warning", LogLevel::Warning}, {"warn", LogLevel::Warning},
        {"error", LogLevel::Error},
    };

    auto it = map.find(s);
    if (it != map.end()) return it->second;

    // Allow numeric.
    long long n = parse_int(s, -1);
    if (n >= 0 && n <= static_cast<long long>(LogLevel::Error)) {
        return static_cast<LogLevel>(n);
    }
    return default_value;
}

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "sandbox") {
        auto& sb = config_.sandbox;
        if (k == "max_memory_mb") {
            sb.max_memory_mb = static_cast<std::size_t>(
                std::clamp(parse_int(v, static_cast<long long>(sb.max_memory_mb)), 0LL,
                           static_cast<long long>(SandboxSettings::kMaxMemoryMB)));
        }
        else if (k == "max_instructions") {
            sb.max_instructions = static_cast<std::size_t>(std::max(0LL, parse_int(v, static_cast<long long>(sb.max_instructions))));
        }
        else if (k == "max_time_sec") sb.max_time_sec = std::max(0.0, parse_double(v, sb.max_time_sec));
        else if (k == "allow_source") sb.allow_source = parse_bool(v, sb.allow_source);
        else if (k == "allow_binary_chunks") sb.allow_binary_chunks = parse_bool(v, sb.allow_binary_chunks);
        return;
    }

    if (sec == "scheduler") {
        auto& sc = config_.scheduler;
        if (k == "worker_threads") {
            sc.worker_threads = static_cast<unsigned>(std::clamp(parse_int(v, sc.worker_threads), 0LL, 256LL));
        }
        else if (k == "instances_per_module") {
            sc.instances_per_module = static_cast<unsigned>(std::clamp(parse_int(v, sc.instances_per_module), 1LL, 64LL));
        }
        return;
    }

    if (sec == "components") {
        if (k == "auto_register_guest_types") {
            config_.components.auto_register_guest_types =
                parse_bool(v, config_.components.auto_register_guest_types);
        }
        return;
    }

    if (sec == "modules") {
        if (k == "allowed_phases") config_.modules.allowed_phases = parse_list(v);
        else if (k == "despawn_on_unload") config_.modules.despawn_on_unload = parse_bool(v, config_.modules.despawn_on_unload);
        return;
    }

    if (sec == "logging") {
        if (k == "enabled") config_.logging.enabled = parse_bool(v, config_.logging.enabled);
        else if (k == "level") config_.logging.level = log_level_from_string(v, config_.logging.level);
        else if (k == "file") config_.logging.file = v;
        return;
    }
}

void Config::parse_stream(std::istream& in) {
    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        // Strip comments (# or ;) - cut at first occurrence.
        auto hash = line.find('#');
        auto semi = line.find(';');
        std::size_t cut = std::string::npos;
        if (hash != std::string::npos) cut = hash;
        if (semi != std::string::npos) cut = (cut == std::string::npos) ? semi : std::min(cut, semi);
        if (cut != std::string::npos) line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        if (line.front() == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        apply_kv(section, key, value);
    }
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    parse_stream(in);
    loaded_from_path_ = path;
    return true;
}

void Config::load_from_string(const std::string& text) {
    std::istringstream in(text);
    parse_stream(in);
}

} // namespace modbridge::core
