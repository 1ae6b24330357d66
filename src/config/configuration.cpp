// File: config/configuration.cpp

#include "config/configuration.hpp"

#include <filesystem>

#include "common/errors.hpp"

namespace config {

    std::shared_ptr<Configuration> Configuration::instance_;
    std::once_flag Configuration::init_flag_;

    void Configuration::initialize(const std::string &filename) {
        auto configuration = filename.empty() ? fromDefaultFile() : std::make_shared<Configuration>(filename);
        std::call_once(init_flag_, [] {});
        instance_ = std::move(configuration);
    }

    Configuration &Configuration::getInstance() {
        std::call_once(init_flag_, [] { instance_ = fromDefaultFile(); });
        return *instance_;
    }

    std::shared_ptr<Configuration> Configuration::fromDefaultFile() {
        const std::string filename(default_filename_);
        if (std::filesystem::exists(filename)) {
            return std::make_shared<Configuration>(filename);
        }
        LOG_INFO("No '{}' found, using built-in defaults.", filename);
        return std::make_shared<Configuration>(YAML::Node());
    }

    Configuration::Configuration(const std::string &filename) : source_(filename) {
        LOG_INFO("Loading configuration from file: {}", filename);

        if (!std::filesystem::exists(filename)) {
            LOG_CRITICAL("Configuration file '{}' does not exist", filename);
            throw common::ConfigurationError(fmt::format("Configuration file not found: {}", filename));
        }

        try {
            const YAML::Node root = YAML::LoadFile(filename);
            LOG_INFO("Configuration file '{}' loaded successfully.", filename);
            load(root);
        } catch (const YAML::Exception &e) {
            LOG_CRITICAL("YAML exception while loading configuration: {}", e.what());
            throw common::ConfigurationError(fmt::format("Invalid configuration file {}: {}", filename, e.what()));
        }
    }

    Configuration::Configuration(const YAML::Node &root) : source_("<memory>") {
        if (root.IsMap()) {
            load(root);
        } else if (root.IsDefined() && !root.IsNull()) {
            throw common::ConfigurationError("Configuration root must be a mapping");
        }
    }

    void Configuration::load(const YAML::Node &node, const std::string &prefix) {
        for (const auto &it: node) {
            std::string key = prefix.empty() ? it.first.as<std::string>() : prefix + "." + it.first.as<std::string>();
            if (it.second.IsMap()) {
                LOG_DEBUG("Loading nested map for key: '{}'", key);
                load(it.second, key); // Recursively load nested maps
            } else {
                config_map_[key] = it.second;
                LOG_DEBUG("Loaded key: '{}', value: '{}'", key,
                          it.second.IsScalar() ? it.second.as<std::string>() : "[non-scalar]");
            }
        }
    }

    void Configuration::show() const {
        std::shared_lock lock(mutex_);
        LOG_INFO("Configuration details ({}):", source_);
        for (const auto &[key, value]: config_map_) {
            if (value.IsScalar()) {
                LOG_INFO("{}: {}", key, value.as<std::string>());
            } else {
                LOG_INFO("{}: {}", key, YAML::Dump(value));
            }
        }
    }
}
