#include "ConfigLoader.h"
#include "LoggingChannels.h"
#include <cstdlib>
#include <fstream>

namespace Biomorph {

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_ = std::nullopt;
}

std::vector<std::filesystem::path> ConfigLoader::getSearchPaths()
{
    namespace fs = std::filesystem;
    std::vector<fs::path> paths;

    if (explicitConfigDir_.has_value()) {
        paths.push_back(fs::path(explicitConfigDir_.value()));
    }

    paths.push_back(fs::current_path() / "config");

    if (const char* home = std::getenv("HOME")) {
        paths.push_back(fs::path(home) / ".config" / "biomorph");
    }

    paths.push_back(fs::path("/etc/biomorph"));

    return paths;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    namespace fs = std::filesystem;

    for (const auto& dir : getSearchPaths()) {
        const fs::path localPath = dir / (filename + ".local");
        if (fs::is_regular_file(localPath)) {
            return localPath;
        }

        const fs::path basePath = dir / filename;
        if (fs::is_regular_file(basePath)) {
            return basePath;
        }
    }

    LOG_DEBUG(Config, "No {} in any config search path", filename);
    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::readJsonFile(const std::filesystem::path& path)
{
    namespace fs = std::filesystem;
    using JsonResult = Result<nlohmann::json, std::string>;

    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return JsonResult::error("Cannot read " + path.string() + ": " + ec.message());
    }
    if (size == 0) {
        LOG_WARN(Config, "Empty config file: {}", path.string());
        return JsonResult::error("Empty config file: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return JsonResult::error("Cannot open config file: " + path.string());
    }

    try {
        LOG_INFO(Config, "Loading config from {}", path.string());
        return JsonResult::okay(nlohmann::json::parse(file));
    }
    catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR(Config, "Parse error in {}: {}", path.string(), e.what());
        return JsonResult::error("Parse error in " + path.string() + ": " + e.what());
    }
}

} // namespace Biomorph
