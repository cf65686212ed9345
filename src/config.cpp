// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "fruit_spawner.h"
#include "grid_space.h"
#include "snake_body.h"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iomanip>

namespace fs = std::filesystem;

namespace slither {

Config* Config::instance{nullptr};

Config::Config() : data(get_default_config()) {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

json Config::get_default_config() {
    // log_level intentionally absent: --test falls back to debug, otherwise warn
    return {{"log_dest", "console"},
            {"game",
             {{"play_width", DEFAULT_PLAY_WIDTH},
              {"play_height", DEFAULT_PLAY_HEIGHT},
              {"cell_size", DEFAULT_CELL_SIZE},
              {"initial_length", DEFAULT_SNAKE_LENGTH},
              {"speed", DEFAULT_SNAKE_SPEED},
              {"spawn_interval", DEFAULT_SPAWN_INTERVAL},
              {"spawn_max_attempts", DEFAULT_SPAWN_MAX_ATTEMPTS},
              {"seed", 0}}}};
}

void Config::init(const std::string& config_path) {
    path = config_path;
    bool config_modified = false;

    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            std::ifstream in(config_path);
            data = json::parse(in);
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            spdlog::warn("[Config] Config file is corrupt, using defaults");
            data = get_default_config();
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;
    }

    if (!data.is_object()) {
        spdlog::warn("[Config] Config root is not an object, using defaults");
        data = get_default_config();
        config_modified = true;
    }

    // Fill in any top-level keys added since the file was written
    json defaults = get_default_config();
    for (auto& [key, value] : defaults.items()) {
        if (!data.contains(key)) {
            data[key] = value;
            config_modified = true;
        }
    }

    if (config_modified && !save()) {
        spdlog::warn("[Config] Running with unsaved config, changes will not persist");
    }

    spdlog::debug("[Config] initialized from {}", path);
}

std::string Config::get_path() const {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    try {
        fs::path config_dir = fs::path(path).parent_path();
        if (!config_dir.empty() && !fs::exists(config_dir)) {
            fs::create_directories(config_dir);
        }

        std::ofstream o(path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", path);
            return false;
        }

        o.close();
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

} // namespace slither
