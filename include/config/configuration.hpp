// File: config/configuration.hpp

#ifndef CONFIGURATION_HPP
#define CONFIGURATION_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"

namespace config {
    class Configuration {
    public:
        Configuration(const Configuration &) = delete;

        Configuration &operator=(const Configuration &) = delete;

        Configuration(Configuration &&) = delete;

        Configuration &operator=(Configuration &&) = delete;

        ~Configuration() = default;

        // Load from a YAML file. Throws common::ConfigurationError if the file is missing or malformed.
        explicit Configuration(const std::string &filename);

        // Load from an already parsed document (an empty node yields an empty configuration)
        explicit Configuration(const YAML::Node &root);

        // Initialize the process-wide configuration from a file. An empty filename falls back to the default
        // file, and to an empty configuration when the default file does not exist either.
        static void initialize(const std::string &filename);

        // Get the singleton instance, initializing it from the default file on first use
        static Configuration &getInstance();

        // Check if a key exists in the configuration
        [[nodiscard]] bool contains(const std::string &key) const;

        // Helper function to log entire configuration
        void show() const;

        // Get a value of type T from the configuration
        template<typename T>
        [[nodiscard]] std::optional<T> get(const std::string &key) const;

        // Get a value of type T from the configuration with a default value
        template<typename T>
        [[nodiscard]] T get(const std::string &key, T default_value) const;

        // Specialization to handle const char* as std::string
        [[nodiscard]] std::string get(const std::string &key, const char *default_value) const;

        // Like get<T>(key), but a missing or mistyped key is a common::ConfigurationError
        template<typename T>
        [[nodiscard]] T require(const std::string &key) const;

        // Missing key: default_value. Present but not convertible to T: common::ConfigurationError.
        template<typename T>
        [[nodiscard]] T require(const std::string &key, T default_value) const;

        template<typename T>
        bool set(const std::string &key, const T &value);

        [[nodiscard]] const std::string &source() const noexcept { return source_; }

    private:
        std::unordered_map<std::string, YAML::Node> config_map_;
        static constexpr std::string_view default_filename_ = "configuration.yaml";
        static std::shared_ptr<Configuration> instance_;
        static std::once_flag init_flag_;
        std::string source_;
        mutable std::shared_mutex mutex_;

        // Load the entire configuration into a map
        void load(const YAML::Node &node, const std::string &prefix = "");

        static std::shared_ptr<Configuration> fromDefaultFile();
    };

    // Template definitions
    template<typename T>
    std::optional<T> Configuration::get(const std::string &key) const {
        std::shared_lock lock(mutex_);
        const auto it = config_map_.find(key);
        if (it == config_map_.end()) {
            LOG_TRACE("Key '{}' not found in configuration", key);
            return std::nullopt;
        }
        try {
            return it->second.as<T>();
        } catch (const YAML::Exception &e) {
            LOG_ERROR("YAML parsing exception for key '{}': {}", key, e.what());
            return std::nullopt;
        }
    }

    template<typename T>
    T Configuration::get(const std::string &key, T default_value) const {
        auto value = get<T>(key);
        return value ? *value : default_value;
    }

    // Specialization to force const char* to std::string
    inline std::string Configuration::get(const std::string &key, const char *default_value) const {
        return get<std::string>(key, std::string(default_value));
    }

    template<typename T>
    T Configuration::require(const std::string &key) const {
        auto value = get<T>(key);
        if (!value) {
            LOG_ERROR("Required configuration key '{}' is missing or has the wrong type", key);
            throw common::ConfigurationError(fmt::format("Missing configuration value '{}'", key));
        }
        return *value;
    }

    template<typename T>
    T Configuration::require(const std::string &key, T default_value) const {
        return contains(key) ? require<T>(key) : default_value;
    }

    template<typename T>
    bool Configuration::set(const std::string &key, const T &value) {
        std::unique_lock lock(mutex_);
        try {
            YAML::Node node;
            node = value;
            config_map_[key] = node;
            return true;
        } catch (const YAML::Exception &e) {
            LOG_ERROR("Error setting value for key '{}': {}", key, e.what());
            return false;
        }
    }

    inline void initialize(const std::string &filename = {}) { Configuration::initialize(filename); }

    inline bool Configuration::contains(const std::string &key) const {
        std::shared_lock lock(mutex_);
        return config_map_.contains(key);
    }

    // Convenience functions for getting configuration values
    template<typename T>
    std::optional<T> get(const std::string &key) {
        return Configuration::getInstance().get<T>(key);
    }

    template<typename T>
    T get(const std::string &key, T default_value) {
        return Configuration::getInstance().get<T>(key, default_value);
    }

    // Specialization to handle const char* as std::string (yaml-cpp misbehaves with const char*)
    inline std::string get(const std::string &key, const char *default_value) {
        return Configuration::getInstance().get(key, default_value);
    }

    template<typename T>
    T require(const std::string &key) {
        return Configuration::getInstance().require<T>(key);
    }

    template<typename T>
    T require(const std::string &key, T default_value) {
        return Configuration::getInstance().require<T>(key, std::move(default_value));
    }

    template<typename T>
    bool set(const std::string &key, const T &value) {
        return Configuration::getInstance().set<T>(key, value);
    }

    inline bool contains(const std::string &key) { return Configuration::getInstance().contains(key); }

    inline void show() { Configuration::getInstance().show(); }
} // namespace config

#endif // CONFIGURATION_HPP
