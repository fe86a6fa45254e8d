#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <mutex>

namespace SkipKP {

    /**
     * @brief Raw key=value settings loaded from a text file.
     *
     * Lines starting with '#' are comments. Typed getters fall back to the
     * supplied default when a key is absent or does not parse. The daemon
     * converts this into an immutable KeyProviderConfig once at startup.
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;

        bool loadFromFile(const std::string& path, bool overrideExisting = true);
        bool loadFromString(const std::string& text, bool overrideExisting = true);

        bool hasKey(const std::string& key) const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        int getInt(const std::string& key, int defaultValue = 0) const;
        void setInt(const std::string& key, int value);

        size_t getSize(const std::string& key, size_t defaultValue = 0) const;

        bool getBool(const std::string& key, bool defaultValue = false) const;
        void setBool(const std::string& key, bool value);

        /// Comma separated value split into trimmed, non-empty items
        std::vector<std::string> getList(const std::string& key) const;

        /// Keys whose value fails its validator; empty when all pass
        std::vector<std::string> validate(const std::unordered_map<std::string, Validator>& schema) const;

        static std::string trim(const std::string& value);

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        void parseLines(std::istream& in, bool overrideExisting);
    };

}
