#pragma once

#include "Result.h"
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace LureNet {

    /**
     * @brief Flat key=value settings store
     *
     * Lines starting with '#' are comments. Keys are dotted per decoy,
     * e.g. "ssh.port=2222".
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;

        // Copies the settings only; each instance keeps its own mutex
        Config(const Config& other);
        Config& operator=(const Config& other);

        bool loadFromFile(const std::string& path, bool overrideExisting = true);
        bool loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);
        lnt::Result<void> saveToFile(const std::string& path) const;

        bool hasKey(const std::string& key) const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        int getInt(const std::string& key, int defaultValue = 0) const;
        void setInt(const std::string& key, int value);

        size_t getSize(const std::string& key, size_t defaultValue = 0) const;
        void setSize(const std::string& key, size_t value);

        bool getBool(const std::string& key, bool defaultValue = false) const;
        void setBool(const std::string& key, bool value);

        /**
         * @brief Run each validator against its key, if the key is set
         * @return InvalidConfig naming the first offending key
         */
        lnt::Result<void> validate(const std::unordered_map<std::string, Validator>& schema) const;

        /// Validator accepting integers in [0, 65535]
        static Validator portValidator();
        /// Validator accepting non-negative integers
        static Validator nonNegativeValidator();

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
        bool storeKV(const std::string& key, const std::string& value, bool overrideExisting);
    };

}
