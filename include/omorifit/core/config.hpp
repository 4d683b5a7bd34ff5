#pragma once

#include <string>
#include <map>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <stdexcept>

namespace omorifit {

/**
 * ConfigurationError - Invalid or unreadable configuration
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * Config - Simple INI-style configuration parser
 *
 * Keys inside a [section] are stored as "section.key". Typed getters
 * return the default for a missing key and throw ConfigurationError for
 * a value that does not parse.
 */
class Config {
public:
    Config() = default;

    bool loadFromFile(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) return false;

        std::string line;
        std::string section;
        while (std::getline(file, line)) {
            // Trim whitespace
            line.erase(0, line.find_first_not_of(" \t\r\n"));
            line.erase(line.find_last_not_of(" \t\r\n") + 1);

            // Skip empty lines and comments
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            // Section header
            if (line[0] == '[' && line.back() == ']') {
                section = line.substr(1, line.size() - 2);
                continue;
            }

            // Key-value pair, with an optional trailing comment
            auto pos = line.find('=');
            if (pos != std::string::npos) {
                std::string key = line.substr(0, pos);
                std::string value = line.substr(pos + 1);
                auto comment = value.find_first_of("#;");
                if (comment != std::string::npos) value.erase(comment);
                key.erase(key.find_last_not_of(" \t") + 1);
                value.erase(0, value.find_first_not_of(" \t"));
                value.erase(value.find_last_not_of(" \t") + 1);

                std::string full_key = section.empty() ? key : section + "." + key;
                values_[full_key] = value;
            }
        }
        return true;
    }

    bool saveToFile(const std::string& filename) const {
        std::ofstream file(filename);
        if (!file.is_open()) return false;

        std::string current_section;
        for (const auto& [key, value] : values_) {
            auto pos = key.find('.');
            std::string section = pos != std::string::npos ? key.substr(0, pos) : "";
            std::string name = pos != std::string::npos ? key.substr(pos + 1) : key;

            if (section != current_section) {
                if (!current_section.empty()) file << "\n";
                if (!section.empty()) file << "[" << section << "]\n";
                current_section = section;
            }
            file << name << " = " << value << "\n";
        }
        return true;
    }

    // Getters
    std::string getString(const std::string& key, const std::string& default_val = "") const {
        auto it = values_.find(key);
        return it != values_.end() ? it->second : default_val;
    }

    int getInt(const std::string& key, int default_val = 0) const {
        auto it = values_.find(key);
        if (it == values_.end()) return default_val;
        size_t used = 0;
        int value = 0;
        try {
            value = std::stoi(it->second, &used);
        } catch (const std::invalid_argument&) {
            throw badValue(key, it->second, "an integer");
        } catch (const std::out_of_range&) {
            throw badValue(key, it->second, "an integer");
        }
        if (used != it->second.size()) throw badValue(key, it->second, "an integer");
        return value;
    }

    double getDouble(const std::string& key, double default_val = 0.0) const {
        auto it = values_.find(key);
        if (it == values_.end()) return default_val;
        size_t used = 0;
        double value = 0.0;
        try {
            value = std::stod(it->second, &used);
        } catch (const std::invalid_argument&) {
            throw badValue(key, it->second, "a number");
        } catch (const std::out_of_range&) {
            throw badValue(key, it->second, "a number");
        }
        if (used != it->second.size()) throw badValue(key, it->second, "a number");
        return value;
    }

    bool getBool(const std::string& key, bool default_val = false) const {
        auto it = values_.find(key);
        if (it == values_.end()) return default_val;
        std::string v = it->second;
        std::transform(v.begin(), v.end(), v.begin(), ::tolower);
        if (v == "true" || v == "yes" || v == "1" || v == "on") return true;
        if (v == "false" || v == "no" || v == "0" || v == "off") return false;
        throw badValue(key, it->second, "a boolean");
    }

    // Setters
    void set(const std::string& key, const std::string& value) {
        values_[key] = value;
    }

    void set(const std::string& key, const char* value) {
        values_[key] = value;
    }

    void set(const std::string& key, int value) {
        values_[key] = std::to_string(value);
    }

    void set(const std::string& key, double value) {
        std::ostringstream oss;
        oss << std::setprecision(17) << value;
        values_[key] = oss.str();
    }

    void set(const std::string& key, bool value) {
        values_[key] = value ? "true" : "false";
    }

    bool has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    const std::map<std::string, std::string>& all() const { return values_; }

private:
    std::map<std::string, std::string> values_;

    static ConfigurationError badValue(const std::string& key, const std::string& value,
                                       const char* expected) {
        return ConfigurationError("Config key '" + key + "' = '" + value +
                                  "' is not " + expected);
    }
};

} // namespace omorifit
