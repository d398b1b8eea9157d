#include "ConfigLoader.h"
#include "LoggingChannels.h"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace RNodeClient {

namespace {

constexpr const char* kConfigDirName = "rnode-client";
constexpr const char* kLocalSuffix = ".local";

using JsonResult = Result<nlohmann::json, std::string>;

JsonResult fail(std::string message)
{
    LOG_WARN(Cli, "ConfigLoader: {}", message);
    return JsonResult::error(std::move(message));
}

} // namespace

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_.reset();
}

std::vector<std::filesystem::path> ConfigLoader::getSearchPaths()
{
    namespace fs = std::filesystem;

    std::vector<fs::path> paths;
    if (explicitConfigDir_) {
        paths.emplace_back(*explicitConfigDir_);
    }

    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (!ec) {
        paths.push_back(cwd / "config");
    }

    const char* home = std::getenv("HOME");
    if (home != nullptr && *home != '\0') {
        paths.push_back(fs::path(home) / ".config" / kConfigDirName);
    }

    paths.push_back(fs::path("/etc") / kConfigDirName);
    return paths;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    namespace fs = std::filesystem;

    // A .local file replaces its sibling outright.
    const std::string candidates[] = { filename + kLocalSuffix, filename };

    for (const auto& dir : getSearchPaths()) {
        for (const auto& candidate : candidates) {
            std::error_code ec;
            fs::path path = dir / candidate;
            if (fs::is_regular_file(path, ec)) {
                LOG_DEBUG(Cli, "ConfigLoader: found {}", path.string());
                return path;
            }
        }
    }
    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::tryLoadJson(const std::filesystem::path& path)
{
    LOG_INFO(Cli, "ConfigLoader: loading {}", path.string());
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return fail("Cannot open config file: " + path.string());
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    const std::string text = contents.str();
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return fail("Empty config file: " + path.string());
    }

    try {
        return JsonResult::okay(nlohmann::json::parse(text));
    }
    catch (const nlohmann::json::parse_error& e) {
        return fail("Parse error in " + path.string() + ": " + e.what());
    }
}

} // namespace RNodeClient
