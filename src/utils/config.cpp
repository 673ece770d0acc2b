#include "config.hpp"
#include "blocks/block_size.hpp"
#include <fstream>
#include <stdexcept>

namespace brightchain::utils {

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    Config config;
    try {
        file >> config.data_;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file: " + std::string(e.what()));
    }

    return config;
}

Config Config::load_from_json(const std::string& json_str) {
    Config config;
    try {
        config.data_ = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse JSON: " + std::string(e.what()));
    }
    return config;
}

void Config::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }

    file << data_.dump(2);
}

EngineSettings EngineSettings::from_config(const Config& config) {
    EngineSettings settings;
    settings.block_size = config.get_or<uint32_t>("block_size", settings.block_size);
    settings.tuple_size = config.get_or<size_t>("tuple_size", settings.tuple_size);
    settings.tuple_min_size = config.get_or<size_t>("tuple_min_size", settings.tuple_min_size);
    settings.tuple_max_size = config.get_or<size_t>("tuple_max_size", settings.tuple_max_size);
    settings.parity_count = config.get_or<size_t>("parity_count", settings.parity_count);
    settings.max_recipients = config.get_or<size_t>("max_recipients", settings.max_recipients);
    settings.max_file_size = config.get_or<uint64_t>("max_file_size", settings.max_file_size);
    settings.log_level = config.get_or<std::string>("log_level", settings.log_level);
    settings.log_to_file = config.get_or<bool>("log_to_file", settings.log_to_file);
    return settings;
}

Result<void> EngineSettings::validate() const {
    if (!blocks::is_valid_block_size(block_size)) {
        return Result<void>::Err(ErrorCode::InvalidBlockSize,
                                 "Unsupported block size " + std::to_string(block_size));
    }
    if (tuple_min_size < 2 || tuple_min_size > tuple_max_size) {
        return Result<void>::Err(ErrorCode::InvalidConfiguration, "Tuple size bounds are inconsistent");
    }
    if (tuple_size < tuple_min_size || tuple_size > tuple_max_size) {
        return Result<void>::Err(ErrorCode::InvalidTupleSize,
                                 "Tuple size " + std::to_string(tuple_size) + " outside [" +
                                 std::to_string(tuple_min_size) + ", " + std::to_string(tuple_max_size) + "]");
    }
    if (parity_count == 0 || tuple_size + parity_count > constants::fec::MAX_TOTAL_SHARDS) {
        return Result<void>::Err(ErrorCode::InvalidConfiguration, "Parity count must be in [1, 256 - tuple_size]");
    }
    if (max_recipients == 0 || max_recipients > constants::ecies::multiple::MAX_RECIPIENTS) {
        return Result<void>::Err(ErrorCode::InvalidConfiguration, "max_recipients must be in [1, 65535]");
    }
    return Result<void>::Ok();
}

Config EngineSettings::to_config() const {
    Config config;
    config.set("block_size", block_size);
    config.set("tuple_size", tuple_size);
    config.set("tuple_min_size", tuple_min_size);
    config.set("tuple_max_size", tuple_max_size);
    config.set("parity_count", parity_count);
    config.set("max_recipients", max_recipients);
    config.set("max_file_size", max_file_size);
    config.set("log_level", log_level);
    config.set("log_to_file", log_to_file);
    return config;
}

} // namespace brightchain::utils
