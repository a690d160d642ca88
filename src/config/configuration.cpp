// File: config/configuration.cpp

#include "config/configuration.hpp"

#include <filesystem>

namespace config {

    std::shared_ptr<Configuration> Configuration::instance_;
    std::once_flag Configuration::init_flag_;

    void Configuration::initialize(const std::string &filename) { getInstance(filename); }

    Configuration &Configuration::getInstance(const std::string &filename) {
        std::call_once(init_flag_, [&filename] {
            if (!filename.empty()) {
                instance_ = std::make_shared<Configuration>(filename);
            } else if (std::filesystem::exists(default_filename_)) {
                instance_ = std::make_shared<Configuration>(std::string(default_filename_));
            } else {
                LOG_WARN("No '{}' found, using built-in defaults.", default_filename_);
                instance_ = std::make_shared<Configuration>(YAML::Node(YAML::NodeType::Map));
            }
        });
        return *instance_;
    }

    Configuration::Configuration(std::string filename) : filename_(std::move(filename)) {
        LOG_INFO("Loading configuration from file: {}", filename_);
        load(loadFile(filename_));
        LOG_INFO("Configuration file '{}' loaded successfully.", filename_);
    }

    Configuration::Configuration(const YAML::Node &root) { load(root); }

    YAML::Node Configuration::loadFile(const std::string &filename) {
        try {
            return YAML::LoadFile(filename);
        } catch (const YAML::BadFile &e) {
            LOG_CRITICAL("Could not open configuration file '{}': {}", filename, e.what());
            throw std::runtime_error("Could not open configuration file: " + filename);
        } catch (const YAML::Exception &e) {
            LOG_CRITICAL("YAML exception while loading configuration: {}", e.what());
            throw std::runtime_error("Malformed configuration file: " + filename);
        }
    }

    void Configuration::load(const YAML::Node &node, const std::string &prefix) {
        if (!node.IsMap()) {
            if (!node.IsNull()) {
                LOG_WARN("Configuration root is not a map, ignoring it.");
            }
            return;
        }
        for (const auto &it: node) {
            std::string key = prefix.empty() ? it.first.as<std::string>() : prefix + "." + it.first.as<std::string>();
            if (it.second.IsMap()) {
                LOG_TRACE("Loading nested map for key: '{}'", key);
                load(it.second, key);
            } else {
                config_map_[key] = it.second;
                LOG_TRACE("Loaded key: '{}', value: '{}'", key,
                          it.second.IsScalar() ? it.second.as<std::string>() : "[non-scalar]");
            }
        }
    }

    void Configuration::reload() {
        if (filename_.empty()) {
            LOG_DEBUG("Configuration has no backing file, nothing to reload.");
            return;
        }

        const YAML::Node root = loadFile(filename_);
        std::unordered_map<std::string, YAML::Node> snapshot;
        {
            std::unique_lock lock(mutex_);
            config_map_.clear();
            load(root);
            snapshot = config_map_;
        }
        LOG_INFO("Configuration file '{}' reloaded ({} keys).", filename_, snapshot.size());

        for (const auto &[key, value]: snapshot) {
            notifyChangeCallbacks(key, value);
        }
    }

    void Configuration::registerChangeCallback(ChangeCallback callback) {
        std::unique_lock lock(mutex_);
        change_callbacks_.push_back(std::move(callback));
    }

    void Configuration::notifyChangeCallbacks(const std::string &key, const YAML::Node &value) const {
        std::vector<ChangeCallback> callbacks;
        {
            std::shared_lock lock(mutex_);
            callbacks = change_callbacks_;
        }
        for (const auto &callback: callbacks) {
            callback(key, value);
        }
    }
} // namespace config
