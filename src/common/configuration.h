#ifndef MOSAIC_CONFIGURATION_H_
#define MOSAIC_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace Mosaic {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct MosaicConfig {
    // Database executable and the modules it loads
    struct Database {
        ConfigValue<std::string> exe{"redis-server", "MOSAIC_DB_EXE"};
        ConfigValue<std::string> conf{"redis.conf", "MOSAIC_DB_CONF"};
        ConfigValue<std::string> ai_module{"redisai.so", "MOSAIC_DB_AI_MODULE"};
        ConfigValue<std::string> ip_module{"libredisip.so", "MOSAIC_DB_IP_MODULE"};
        ConfigValue<int> port{6379, "MOSAIC_DB_PORT"};
    } database;

    struct Launcher {
        // Supported: aprun, mpirun
        ConfigValue<std::string> run_command{"aprun", "MOSAIC_RUN_COMMAND"};
        ConfigValue<bool> batch{true, "MOSAIC_DB_BATCH"};
    } launcher;

    struct Ensemble {
        // Supported: all_perm, step, random
        ConfigValue<std::string> strategy{"all_perm", "MOSAIC_PERM_STRATEGY"};
    } ensemble;

    struct Logging {
        ConfigValue<int> verbosity{0, "MOSAIC_LOG_LEVEL"};
    } logging;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const MosaicConfig& config() const { return config_; }
    MosaicConfig& config() { return config_; }

    // Helper methods for common access patterns
    std::string getDatabaseExe() const { return config_.database.exe.get(); }
    std::string getDatabaseConf() const { return config_.database.conf.get(); }
    int getDatabasePort() const { return config_.database.port.get(); }
    std::string getRunCommand() const { return config_.launcher.run_command.get(); }
    std::string getStrategy() const { return config_.ensemble.strategy.get(); }

    // Restore built-in defaults (keeps env var bindings)
    void reset() { config_ = MosaicConfig{}; validation_errors_.clear(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    MosaicConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYaml(const YAML::Node& yaml);
};

const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Mosaic

#endif // MOSAIC_CONFIGURATION_H_
