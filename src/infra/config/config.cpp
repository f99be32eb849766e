#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <vector>

#include "config.hpp"

namespace fcopy::infra {
    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".fcopy.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "fcopy" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "fcopy" / "config.yaml");
            }
        }

        return paths;
    }

    static auto parse_config(const std::filesystem::path& path)
        -> std::expected<Config, std::string>
    {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["follow_symlinks"]) cfg.follow_symlinks = config["follow_symlinks"].as<bool>();
            if (config["copy_metadata"]) cfg.copy_metadata = config["copy_metadata"].as<bool>();
            if (config["verify"]) cfg.verify = config["verify"].as<bool>();

            if (config["log_level"]) {
                auto level = config["log_level"].as<std::string>();
                // from_str возвращает off для неизвестных имён
                if (level != "off" && spdlog::level::from_str(level) == spdlog::level::off) {
                    return std::unexpected(fmt::format("Invalid log_level '{}' in {}", level, path.string()));
                }
                cfg.log_level = level;
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const YAML::Exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            if (!std::filesystem::exists(path)) continue;
            return parse_config(path);
        }

        // Файл не найден — возвращаем конфиг по умолчанию (не ошибка!)
        return Config{};
    }

    auto load_config_from_file(const std::filesystem::path& path)
        -> std::expected<Config, std::string>
    {
        if (!std::filesystem::exists(path)) {
            return std::unexpected(fmt::format("Config file not found: {}", path.string()));
        }
        return parse_config(path);
    }

    void apply_log_level(const Config& config) {
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
        spdlog::set_level(config.log_level
            ? spdlog::level::from_str(*config.log_level)
            : spdlog::level::info);
    }

} // namespace fcopy::infra
