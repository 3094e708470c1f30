#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <istream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../config/AppConfig.hpp"

using namespace std;

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    static optional<double> stringToDouble(const std::string& str) {
        try {
            size_t pos;
            double val = std::stod(str, &pos);
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Function to parse key-value pairs from a string (using optional version)
    static optional<map<string, string>> parseArguments(const vector<string>& args) {
        map<string, string> argMap;
        for (const string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) { // Ensure key is not empty
                string key = arg.substr(0, delimiterPos);
                string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << endl;
                return nullopt;
            }
        }
        return argMap;
    }

    // One proxy address per line; blank lines and '#' comments are skipped.
    // A missing file yields an empty list.
    static vector<string> loadProxyList(const std::string& path) {
        vector<string> proxies;
        if (path.empty()) {
            return proxies;
        }
        std::ifstream file(path);
        if (!file.is_open()) {
            return proxies;
        }
        std::string line;
        while (getline(file, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }
            proxies.push_back(line);
        }
        return proxies;
    }

    // "<requests>,<window_seconds>,<strategy>", strategy optional (token_bucket).
    static optional<LimitConfig> parseLimit(const std::string& value) {
        std::vector<std::string> parts;
        std::stringstream ss(value);
        std::string part;
        while (getline(ss, part, ',')) {
            parts.push_back(trim(part));
        }
        if (parts.size() < 2 || parts.size() > 3) {
            return nullopt;
        }
        auto requests = stringToInt(parts[0]);
        auto window = stringToInt(parts[1]);
        if (!requests || !window || *requests <= 0 || *window <= 0) {
            return nullopt;
        }
        LimitConfig limit;
        limit.requests = *requests;
        limit.window_seconds = *window;
        if (parts.size() == 3) {
            try {
                limit.strategy = stringToStrategy(parts[2]);
            } catch (const std::invalid_argument&) {
                return nullopt;
            }
        }
        return limit;
    }

    // Applies one configuration entry. Returns false (after warning) when the
    // value is rejected; the previous value is kept in that case.
    static bool applyConfigValue(AppConfig& config, const std::string& key, const std::string& value) {
        auto warnInvalid = [&](const char* kind) {
            cerr << "Warning: Invalid " << kind << " for " << key << " in config file: " << value << endl;
            return false;
        };
        auto setPositiveInt = [&](int& target) {
            auto val = stringToInt(value);
            if (!val || *val <= 0) return warnInvalid("positive integer");
            target = *val;
            return true;
        };
        auto setNonNegativeDouble = [&](double& target) {
            auto val = stringToDouble(value);
            if (!val || *val < 0.0) return warnInvalid("non-negative number");
            target = *val;
            return true;
        };

        if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
            } catch (const std::invalid_argument&) {
                return warnInvalid("log level");
            }
            return true;
        } else if (key == "proxy_list_path") {
            config.proxy_list_path = value;
            return true;
        } else if (key == "max_consecutive_failures") {
            return setPositiveInt(config.max_consecutive_failures);
        } else if (key == "failure_cooldown_seconds") {
            return setNonNegativeDouble(config.failure_cooldown_seconds);
        } else if (key == "health_check_interval_seconds") {
            return setNonNegativeDouble(config.health_check_interval_seconds);
        } else if (key == "circuit_max_failures") {
            return setPositiveInt(config.circuit_max_failures);
        } else if (key == "circuit_base_backoff_seconds") {
            return setNonNegativeDouble(config.circuit_base_backoff_seconds);
        } else if (key == "circuit_max_backoff_seconds") {
            return setNonNegativeDouble(config.circuit_max_backoff_seconds);
        } else if (key == "use_redis") {
            if (auto val = stringToInt(value)) {
                config.use_redis = (val == 1);
                return true;
            }
            return warnInvalid("integer");
        } else if (key == "redis_host") {
            config.redis_host = value;
            return true;
        } else if (key == "redis_port") {
            return setPositiveInt(config.redis_port);
        } else if (key == "in_memory_storage_max_size") {
            return setPositiveInt(config.in_memory_storage_max_size);
        } else if (key == "default_limit") {
            if (auto limit = parseLimit(value)) {
                config.default_limit = *limit;
                return true;
            }
            return warnInvalid("limit");
        } else if (key.rfind("rate_limit:", 0) == 0) {
            // rate_limit:<endpoint>:<caller_class>
            size_t class_pos = key.rfind(':');
            std::string endpoint = key.substr(11, class_pos > 11 ? class_pos - 11 : 0);
            if (class_pos <= 11 || endpoint.empty()) {
                return warnInvalid("rate limit key");
            }
            CallerClass caller_class;
            try {
                caller_class = stringToCallerClass(key.substr(class_pos + 1));
            } catch (const std::invalid_argument&) {
                return warnInvalid("caller class");
            }
            if (auto limit = parseLimit(value)) {
                config.endpoint_limits[endpoint][caller_class] = *limit;
                return true;
            }
            return warnInvalid("limit");
        } else if (key == "recalibration_interval_seconds") {
            return setPositiveInt(config.recalibration_interval_seconds);
        } else if (key == "metrics_samples_path") {
            config.metrics_samples_path = value;
            return true;
        } else if (key == "metrics_backend") {
            if (value != "console" && value != "statsd") return warnInvalid("metrics backend");
            config.metrics_backend = value;
            return true;
        } else if (key == "metrics_batch_size") {
            return setPositiveInt(config.metrics_batch_size);
        } else if (key == "metrics_send_interval") {
            return setPositiveInt(config.metrics_send_interval_in_millis);
        }
        return false;
    }

    // Reads key=value lines; blank lines and '#' comments are ignored.
    static void parseConfigStream(std::istream& input, AppConfig& config) {
        std::string line;
        while (getline(input, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }
            size_t delimiterPos = line.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) {
                string key = trim(line.substr(0, delimiterPos));
                string value = trim(line.substr(delimiterPos + 1));
                applyConfigValue(config, key, value);
            } else {
                cerr << "Warning: Ignoring malformed config line: " << line << endl;
            }
        }
    }

    // Load configuration from the config file, then apply startup arguments
    // (which win over file values). "config=<path>" selects the file.
    static AppConfig loadConfiguration(const map<string, string>& startupArguments) {
        AppConfig config;

        std::vector<std::string> config_paths;
        auto explicit_path = startupArguments.find("config");
        if (explicit_path != startupArguments.end()) {
            config_paths.push_back(explicit_path->second);
        } else {
            config_paths = {
                Constants::CONFIG_FILE_NAME,                      // Current directory
                std::string("../") + Constants::CONFIG_FILE_NAME, // Parent directory
                std::string("/etc/egressguard/") + Constants::CONFIG_FILE_NAME
            };
        }

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (configFile.is_open()) {
                cout << "Reading configuration from " << config_path << "..." << endl;
                config_found = true;
                parseConfigStream(configFile, config);
                break;
            }
        }

        if (!config_found) {
            cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << endl;
        }

        for (const auto& [key, value] : startupArguments) {
            if (key == "config") {
                continue;
            }
            if (!applyConfigValue(config, key, value)) {
                cerr << "Warning: Ignoring startup argument '" << key << "'" << endl;
            }
        }

        return config;
    }
};

#endif // UTILS_HPP
