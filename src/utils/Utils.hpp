#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>

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
            // Check if the entire string was consumed
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

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r\f\v");
        if (string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r\f\v");
        return str.substr(first, (last - first + 1));
    }

    // ASCII lower-casing; multi-byte UTF-8 sequences pass through unchanged.
    static std::string toLower(std::string str) {
        std::transform(str.begin(), str.end(), str.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return str;
    }

    // Standard base64 with '=' padding.
    static std::string base64Encode(const std::string& input) {
        using namespace boost::archive::iterators;
        using Base64Iterator = base64_from_binary<transform_width<std::string::const_iterator, 6, 8>>;

        std::string encoded(Base64Iterator(input.begin()), Base64Iterator(input.end()));
        encoded.append((3 - input.size() % 3) % 3, '=');
        return encoded;
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
                return nullopt; // Signal failure
            }
        }
        return argMap; // Signal success
    }

    // Applies one key=value setting to config. Unknown keys are ignored; invalid
    // values leave the previous setting in place and print a warning.
    static void applySetting(AppConfig& config, const string& key, const string& value, const string& source) {
        auto positiveInt = [&](int& target) {
            auto val = stringToInt(value);
            if (val && *val > 0) {
                target = *val;
            } else {
                cerr << "Warning: Invalid positive integer for " << key << " in " << source << ": " << value << endl;
            }
        };

        if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
            } catch (const std::invalid_argument& e) {
                cerr << "Warning: " << e.what() << " in " << source << endl;
            }
        } else if (key == "query_cache_max_size_mb") {
            positiveInt(config.query_cache_max_size_mb);
        } else if (key == "query_cache_default_ttl_ms") {
            positiveInt(config.query_cache_default_ttl_ms);
        } else if (key == "query_cache_max_entries") {
            positiveInt(config.query_cache_max_entries);
        } else if (key == "query_cache_janitor_interval_ms") {
            positiveInt(config.query_cache_janitor_interval_ms);
        } else if (key == "metrics_batch_size") {
            positiveInt(config.metrics_batch_size);
        } else if (key == "metrics_send_interval") {
            // value provided in millis
            positiveInt(config.metrics_send_interval_in_millis);
        } else if (key == "num_io_threads") {
            int threads = static_cast<int>(config.num_io_threads);
            positiveInt(threads);
            config.num_io_threads = static_cast<unsigned int>(threads);
        } else if (key == "workload") {
            config.workload_path = value;
        } else if (key == "fixtures") {
            config.fixtures_path = value;
        }
    }

    // Load configuration from the config file, then command-line arguments on top
    static AppConfig loadConfiguration(const map<string, string>& startupArguments) {
        AppConfig config;

        // Try multiple config file locations
        std::vector<std::string> config_paths = {
            std::string(Constants::CONFIG_FILE_NAME),           // Current directory
            "../" + std::string(Constants::CONFIG_FILE_NAME),    // Parent directory
            "/app/" + std::string(Constants::CONFIG_FILE_NAME),  // Docker container path
            "../../" + std::string(Constants::CONFIG_FILE_NAME)  // Development path
        };

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (configFile.is_open()) {
                cout << "Reading configuration from " << config_path << "..." << endl;
                config_found = true;
                loadConfigurationStream(configFile, config, config_path);
                break;
            }
        }

        if (!config_found) {
            cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << endl;
        }

        for (const auto& pair : startupArguments) {
            applySetting(config, pair.first, pair.second, "command line");
        }

        return config;
    }

    // Reads key=value lines, skipping blanks and '#' comments.
    static void loadConfigurationStream(std::istream& in, AppConfig& config, const string& source) {
        std::string line;
        while (getline(in, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                continue;
            }
            size_t delimiterPos = line.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) {
                string key = trim(line.substr(0, delimiterPos));
                string value = trim(line.substr(delimiterPos + 1));
                applySetting(config, key, value, source);
            } else {
                cerr << "Warning: Ignoring malformed line in " << source << ": " << line << endl;
            }
        }
    }
};

#endif // UTILS_HPP
