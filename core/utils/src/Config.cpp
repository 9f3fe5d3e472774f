#include "Config.h"
#include "TextUtils.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>

namespace LureNet {

    Config::Config(const Config& other) {
        std::lock_guard<std::mutex> lock(other.mutex_);
        settings_ = other.settings_;
    }

    Config& Config::operator=(const Config& other) {
        if (this != &other) {
            std::unordered_map<std::string, std::string> copy;
            {
                std::lock_guard<std::mutex> lock(other.mutex_);
                copy = other.settings_;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            settings_ = std::move(copy);
        }
        return *this;
    }

    bool Config::loadFromFile(const std::string& path, bool overrideExisting) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::vector<std::pair<std::string, std::string>> parsed;
        std::string line;
        while (std::getline(file, line)) {
            auto trimmed = trim(line);
            if (trimmed.empty() || trimmed[0] == '#') continue;

            size_t delimiterPos = trimmed.find('=');
            if (delimiterPos == std::string::npos) continue;

            std::string key = trim(trimmed.substr(0, delimiterPos));
            std::string value = trim(trimmed.substr(delimiterPos + 1));
            if (!key.empty()) {
                parsed.emplace_back(key, value);
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, value] : parsed) {
            storeKV(key, value, overrideExisting);
        }
        return true;
    }

    bool Config::loadLayered(const std::vector<std::string>& paths, bool overrideExisting) {
        bool loaded = false;
        for (const auto& path : paths) {
            if (loadFromFile(path, overrideExisting)) {
                loaded = true;
            }
        }
        return loaded;
    }

    lnt::Result<void> Config::saveToFile(const std::string& path) const {
        std::map<std::string, std::string> sorted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sorted.insert(settings_.begin(), settings_.end());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            return lnt::Err(lnt::ErrorCode::InvalidConfig, "Cannot write config file: " + path);
        }
        file << "# LureNet configuration\n";
        for (const auto& [key, value] : sorted) {
            file << key << "=" << value << "\n";
        }
        return lnt::Ok();
    }

    bool Config::hasKey(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settings_.find(key) != settings_.end();
    }

    std::string Config::get(const std::string& key, const std::string& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = settings_.find(key);
        if (it != settings_.end()) {
            return it->second;
        }
        return defaultValue;
    }

    void Config::set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_[key] = value;
    }

    int Config::getInt(const std::string& key, int defaultValue) const {
        std::string val = get(key, "");
        if (val.empty()) return defaultValue;
        try {
            size_t consumed = 0;
            int parsed = std::stoi(val, &consumed);
            return consumed == val.size() ? parsed : defaultValue;
        } catch (const std::exception&) {
            return defaultValue;
        }
    }

    void Config::setInt(const std::string& key, int value) {
        set(key, std::to_string(value));
    }

    size_t Config::getSize(const std::string& key, size_t defaultValue) const {
        std::string val = get(key, "");
        if (val.empty() || val[0] == '-') return defaultValue;
        try {
            return static_cast<size_t>(std::stoull(val));
        } catch (const std::exception&) {
            return defaultValue;
        }
    }

    void Config::setSize(const std::string& key, size_t value) {
        set(key, std::to_string(value));
    }

    bool Config::getBool(const std::string& key, bool defaultValue) const {
        std::string val = TextUtils::toLower(get(key, ""));
        if (val.empty()) return defaultValue;
        if (val == "1" || val == "true" || val == "yes" || val == "on") {
            return true;
        }
        if (val == "0" || val == "false" || val == "no" || val == "off") {
            return false;
        }
        return defaultValue;
    }

    void Config::setBool(const std::string& key, bool value) {
        set(key, value ? "true" : "false");
    }

    lnt::Result<void> Config::validate(const std::unordered_map<std::string, Validator>& schema) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, validator] : schema) {
            auto it = settings_.find(key);
            if (it != settings_.end() && validator && !validator(key, it->second)) {
                return lnt::Err(lnt::ErrorCode::InvalidConfig,
                                "Invalid value for '" + key + "': " + it->second);
            }
        }
        return lnt::Ok();
    }

    Config::Validator Config::portValidator() {
        return [](const std::string&, const std::string& value) {
            try {
                size_t consumed = 0;
                int port = std::stoi(value, &consumed);
                return consumed == value.size() && port >= 0 && port <= 65535;
            } catch (const std::exception&) {
                return false;
            }
        };
    }

    Config::Validator Config::nonNegativeValidator() {
        return [](const std::string&, const std::string& value) {
            return !value.empty() &&
                   std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
        };
    }

    std::string Config::trim(const std::string& value) {
        return TextUtils::trim(value);
    }

    bool Config::storeKV(const std::string& key, const std::string& value, bool overrideExisting) {
        auto it = settings_.find(key);
        if (!overrideExisting && it != settings_.end()) {
            return false;
        }
        settings_[key] = value;
        return true;
    }

}
