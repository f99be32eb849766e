#pragma once

#include <string>
#include <optional>
#include <expected>
#include <filesystem>

namespace fcopy::infra {

struct Config {
    // Behavior
    bool follow_symlinks = true;
    bool copy_metadata = false;
    bool verify = false;

    // Logging: trace, debug, info, warn, error, critical, off
    std::optional<std::string> log_level;
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.fcopy.yaml
///   2. $XDG_CONFIG_HOME/fcopy/config.yaml или ~/.config/fcopy/config.yaml
/// Возвращает Config по умолчанию, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Загружает конкретный файл; отсутствие файла - ошибка.
[[nodiscard]] auto load_config_from_file(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Применяет log_level и формат вывода к логгеру spdlog по умолчанию.
void apply_log_level(const Config& config);

} // namespace fcopy::infra
