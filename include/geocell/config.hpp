#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <type_traits>
#include "logging.hpp"

namespace geocell {

/**
 * Process-wide settings
 *
 * Values are strings keyed by dotted names ("geo.radius"). load() seeds
 * every known key from its environment variable or default, then lets an
 * optional key=value file override them. Reads convert on demand through
 * get<T>(), falling back to the caller's default when a value is missing
 * or does not parse.
 */
class Config {
public:
    struct Binding {
        const char* key;
        const char* env;
        const char* fallback;
    };

    static constexpr Binding BINDINGS[] = {
        {"log.level",  "GEOCELL_LOG_LEVEL",    "info"},
        {"log.file",   "GEOCELL_LOG_FILE",     ""},
        {"geo.radius", "GEOCELL_EARTH_RADIUS", "6371008.771415"},  // mean earth radius, meters
        {"geo.adjust", "GEOCELL_ADJUST",       "false"},
        {"geo.wrap",   "GEOCELL_WRAP",         "false"},
    };

    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Environment first, then the file if it exists; false if a value is unusable
    bool load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        for (const Binding& b : BINDINGS) {
            const char* env_value = std::getenv(b.env);
            values_[b.key] = (env_value && *env_value) ? env_value : b.fallback;
        }

        if (!config_file.empty() && std::filesystem::exists(config_file)) {
            read_file(config_file);
        }
        return validate();
    }

    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup<T>(key, default_value);
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

    // key = value lines, sorted by key
    void dump(std::ostream& os) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, value] : values_) {
            os << key << " = " << value << '\n';
        }
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static std::string trim(const std::string& s) {
        auto first = std::find_if_not(s.begin(), s.end(),
                                      [](unsigned char c) { return std::isspace(c); });
        auto last = std::find_if_not(s.rbegin(), s.rend(),
                                     [](unsigned char c) { return std::isspace(c); }).base();
        return first < last ? std::string(first, last) : std::string();
    }

    static bool parse_bool(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text == "true" || text == "1" || text == "yes" || text == "on";
    }

    template<typename T>
    T lookup(const std::string& key, T default_value) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        const std::string& raw = it->second;
        try {
            if constexpr (std::is_same_v<T, bool>) {
                return parse_bool(raw);
            } else if constexpr (std::is_same_v<T, int>) {
                return std::stoi(raw);
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(raw);
            } else {
                return raw;
            }
        } catch (const std::logic_error&) {
            LOG_WARN("Failed to parse config value for key '", key, "' ('", raw, "'), using default");
            return default_value;
        }
    }

    // '#' and ';' start comment lines
    void read_file(const std::string& filename) {
        std::ifstream in(filename);
        if (!in) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        std::string line;
        int count = 0;
        while (std::getline(in, line)) {
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t eq = line.find('=');
            if (eq == std::string::npos) continue;

            std::string key = trim(line.substr(0, eq));
            if (key.empty()) continue;
            values_[key] = trim(line.substr(eq + 1));
            ++count;
        }

        LOG_DEBUG("Read ", count, " settings from ", filename);
    }

    bool validate() {
        bool ok = true;

        double radius = lookup<double>("geo.radius", 0.0);
        if (!(radius > 0.0)) {
            LOG_ERROR("Invalid earth radius: '", values_["geo.radius"], "' (must be positive meters)");
            ok = false;
        }

        const std::string level = values_["log.level"];
        if (parse_log_level(level, LogLevel::FATAL) == LogLevel::FATAL && level != "fatal") {
            LOG_WARN("Unknown log level '", level, "', defaulting to 'info'");
            values_["log.level"] = "info";
        }

        return ok;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

// Load geocell.env (if present) and apply the logging settings
inline bool init_config(const std::string& config_file = "geocell.env") {
    // Honor the environment level for messages logged while loading
    if (const char* env_level = std::getenv("GEOCELL_LOG_LEVEL")) {
        set_log_level(parse_log_level(env_level));
    }

    Config& config = Config::getInstance();
    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    set_log_level(parse_log_level(config.get<std::string>("log.level", "info")));

    const std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream;
        log_stream.open(log_file, std::ios::app);
        if (log_stream) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_DEBUG("Configuration loaded");
    return true;
}

} // namespace geocell
