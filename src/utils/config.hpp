#pragma once

#include "brightchain/error.hpp"
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace brightchain::utils {

using json = nlohmann::json;

/**
 * Configuration management system
 * JSON documents loaded from disk or strings
 */
class Config {
public:
    Config() = default;

    /**
     * Load configuration from JSON file
     */
    static Config load_from_file(const std::string& path);

    /**
     * Load configuration from JSON string
     */
    static Config load_from_json(const std::string& json_str);

    /**
     * Save configuration to file
     */
    void save_to_file(const std::string& path) const;

    /**
     * Get a value from config, nullopt when absent or of another type
     */
    template<typename T>
    std::optional<T> get(const std::string& key) const {
        if (!data_.contains(key)) {
            return std::nullopt;
        }
        try {
            return data_.at(key).get<T>();
        } catch (const json::type_error&) {
            return std::nullopt;
        }
    }

    /**
     * Get a value with default
     */
    template<typename T>
    T get_or(const std::string& key, const T& default_value) const {
        auto value = get<T>(key);
        return value.value_or(default_value);
    }

    template<typename T>
    void set(const std::string& key, const T& value) {
        data_[key] = value;
    }

    bool has(const std::string& key) const {
        return data_.contains(key);
    }

    const json& data() const { return data_; }

private:
    json data_;
};

/**
 * Engine tunables read from a Config
 */
struct EngineSettings {
    uint32_t block_size = 4096;
    size_t tuple_size = constants::tuple::SIZE;
    size_t tuple_min_size = constants::tuple::MIN_SIZE;
    size_t tuple_max_size = constants::tuple::MAX_SIZE;
    size_t parity_count = constants::fec::DEFAULT_PARITY_COUNT;
    size_t max_recipients = constants::ecies::multiple::MAX_RECIPIENTS;
    uint64_t max_file_size = constants::cbl::DEFAULT_MAX_NODE_FILE_SIZE;
    std::string log_level = "info";
    bool log_to_file = false;

    static EngineSettings from_config(const Config& config);

    /**
     * Reject settings the engine cannot run with
     */
    Result<void> validate() const;

    Config to_config() const;
};

} // namespace brightchain::utils
