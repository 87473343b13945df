#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "../ensemble/strategies.h"
#include "../settings/run_command.h"

namespace Mosaic {

// Global function to get configuration instance
const Configuration& GetConfig() {
    return Configuration::getInstance();
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYaml(const YAML::Node& yaml) {
    if (!yaml["mosaic"]) {
        LOG(WARNING) << "Configuration has no top-level 'mosaic' section, nothing applied";
        return;
    }
    auto root = yaml["mosaic"];

    // Database
    if (root["database"]) {
        auto db = root["database"];
        if (db["exe"]) config_.database.exe.set(db["exe"].as<std::string>());
        if (db["conf"]) config_.database.conf.set(db["conf"].as<std::string>());
        if (db["ai_module"]) config_.database.ai_module.set(db["ai_module"].as<std::string>());
        if (db["ip_module"]) config_.database.ip_module.set(db["ip_module"].as<std::string>());
        if (db["port"]) config_.database.port.set(db["port"].as<int>());
    }

    // Launcher
    if (root["launcher"]) {
        auto launcher = root["launcher"];
        if (launcher["run_command"]) config_.launcher.run_command.set(launcher["run_command"].as<std::string>());
        if (launcher["batch"]) config_.launcher.batch.set(launcher["batch"].as<bool>());
    }

    // Ensemble
    if (root["ensemble"]) {
        auto ensemble = root["ensemble"];
        if (ensemble["strategy"]) config_.ensemble.strategy.set(ensemble["strategy"].as<std::string>());
    }

    // Logging
    if (root["logging"]) {
        auto logging = root["logging"];
        if (logging["verbosity"]) config_.logging.verbosity.set(logging["verbosity"].as<int>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        applyYaml(YAML::LoadFile(filename));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        applyYaml(YAML::Load(yaml_content));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Validate port range
    if (config_.database.port.get() < 1024 || config_.database.port.get() > 65535) {
        validation_errors_.push_back("Database port must be between 1024 and 65535");
    }

    // Validate paths
    if (config_.database.exe.get().empty()) {
        validation_errors_.push_back("Database executable path must not be empty");
    }
    if (config_.database.conf.get().empty()) {
        validation_errors_.push_back("Database configuration file path must not be empty");
    }

    // Validate enumerated choices
    if (!TryParseRunCommand(config_.launcher.run_command.get()).has_value()) {
        validation_errors_.push_back("Unknown run command: " + config_.launcher.run_command.get());
    }
    const auto strategies = BuiltinStrategyNames();
    if (std::find(strategies.begin(), strategies.end(), config_.ensemble.strategy.get()) == strategies.end()) {
        validation_errors_.push_back("Unknown permutation strategy: " + config_.ensemble.strategy.get());
    }

    if (config_.logging.verbosity.get() < 0) {
        validation_errors_.push_back("Logging verbosity must not be negative");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Mosaic
