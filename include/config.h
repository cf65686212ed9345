// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __SLITHER_CONFIG_H__
#define __SLITHER_CONFIG_H__

#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::json;

namespace slither {

/**
 * @brief Application configuration store
 *
 * Loads and manages the driver's configuration from a JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Should be initialized once at startup
 * and accessed from main thread only.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/path/to/slither.json");
 *
 * // Get with default fallback
 * int cell = cfg->get<int>("/game/cell_size", 20);
 *
 * // Set and save
 * cfg->set<double>("/game/speed", 40.0);
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    /**
     * @brief Construct configuration store
     *
     * Starts with the default document; call init() to bind it to a file.
     */
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Loads the JSON file, or writes one with defaults if it doesn't exist.
     * A file that fails to parse is replaced by the defaults in memory.
     * Missing top-level sections are filled in from the defaults.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * Throws nlohmann::json::exception if path doesn't exist.
     * Use the overload with default_value for safer access.
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path (e.g., "/game/cell_size")
     * @return Configuration value of type T
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) const {
        return data.at(json::json_pointer(json_ptr)).template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist. A value of the wrong
     * type still throws nlohmann::json::type_error.
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path (e.g., "/game/speed")
     * @param default_value Fallback value if path not found
     * @return Configuration value or default_value
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) const {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr)) {
            return data.at(ptr).template get<T>();
        }
        return default_value;
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist.
     * Changes are in-memory only until save() is called.
     *
     * @tparam T Value type to store
     * @param json_ptr JSON pointer path (e.g., "/game/seed")
     * @param v Value to set
     * @return The value that was set
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        data[json::json_pointer(json_ptr)] = v;
        return v;
    };

    /**
     * @brief Get JSON sub-object at path
     *
     * @param json_path JSON pointer path
     * @return Reference to JSON object at path
     */
    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * Writes in-memory config to disk with pretty formatting.
     *
     * @return true on success, false if the file could not be written
     */
    bool save();

    /**
     * @brief Get configuration file path
     *
     * @return Path to the loaded configuration file (empty before init())
     */
    std::string get_path() const;

    /**
     * @brief Default configuration document
     */
    static json get_default_config();

    /**
     * @brief Get singleton instance
     *
     * @return Pointer to global Config instance
     */
    static Config* get_instance();
};

} // namespace slither

#endif // __SLITHER_CONFIG_H__
