#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace cryptorand::utils {

using json = nlohmann::json;

/**
 * Configuration backed by a flat JSON object
 */
class Config {
public:
    Config() = default;

    /**
     * Load configuration from JSON file
     * @throws ConfigException if the file cannot be opened or parsed
     */
    static Config load_from_file(const std::string& path);

    /**
     * Load configuration from JSON string
     * @throws ConfigException if the string is not a JSON object
     */
    static Config load_from_json(const std::string& json_str);

    /**
     * Save configuration to file
     */
    void save_to_file(const std::string& path) const;

    /**
     * Get a value from config; nullopt when missing or of the wrong type
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
        } catch (const json::out_of_range&) {
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
    json data_ = json::object();
};

} // namespace cryptorand::utils
