#pragma once

#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Biomorph {

/**
 * @brief Finds and parses JSON config files.
 *
 * Search order for load(), first hit wins:
 * 1. Directory set with setConfigDir()
 * 2. ./config/
 * 3. ~/.config/biomorph/
 * 4. /etc/biomorph/
 *
 * In each directory "<file>.local" replaces "<file>" entirely when present.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    // Parse a specific file, bypassing the search path.
    template <typename T>
    static Result<T, std::string> loadFromPath(const std::filesystem::path& path);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

    static Result<nlohmann::json, std::string> readJsonFile(const std::filesystem::path& path);

private:
    template <typename T>
    static Result<T, std::string> decode(const nlohmann::json& json, const std::string& origin);

    static std::optional<std::string> explicitConfigDir_;
};

template <typename T>
Result<T, std::string> ConfigLoader::decode(const nlohmann::json& json, const std::string& origin)
{
    try {
        T config;
        from_json(json, config);
        return Result<T, std::string>::okay(config);
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + origin + ": " + e.what());
    }
}

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    const auto path = findConfigFile(filename);
    if (!path.has_value()) {
        return Result<T, std::string>::error("Config file not found: " + filename);
    }
    return loadFromPath<T>(path.value());
}

template <typename T>
Result<T, std::string> ConfigLoader::loadFromPath(const std::filesystem::path& path)
{
    auto jsonResult = readJsonFile(path);
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }
    return decode<T>(jsonResult.value(), path.string());
}

} // namespace Biomorph
