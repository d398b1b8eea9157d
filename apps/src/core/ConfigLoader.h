#pragma once

#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace RNodeClient {

/**
 * @brief Finds and parses JSON config files.
 *
 * Directories are tried in order and the first hit wins:
 * the directory given to setConfigDir(), ./config, ~/.config/rnode-client,
 * then /etc/rnode-client. Within a directory "<name>.local" shadows "<name>"
 * completely (no merging).
 *
 * Parsing goes through an ADL from_json(const nlohmann::json&, T&) overload.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    /**
     * @brief Load and parse the first matching file.
     *
     * A file missing from every search path is not an error and yields nullopt;
     * unreadable or malformed files are reported as errors.
     */
    template <typename T>
    static Result<std::optional<T>, std::string> loadIfPresent(const std::string& filename);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    static std::optional<std::string> explicitConfigDir_;
    static Result<nlohmann::json, std::string> tryLoadJson(const std::filesystem::path& path);

    template <typename T>
    static Result<T, std::string> parse(const nlohmann::json& json, const std::string& filename);
};

template <typename T>
Result<std::optional<T>, std::string> ConfigLoader::loadIfPresent(const std::string& filename)
{
    auto path = findConfigFile(filename);
    if (!path.has_value()) {
        return Result<std::optional<T>, std::string>::okay(std::nullopt);
    }

    auto jsonResult = tryLoadJson(path.value());
    if (jsonResult.isError()) {
        return Result<std::optional<T>, std::string>::error(jsonResult.errorValue());
    }

    auto parsed = parse<T>(jsonResult.value(), path->string());
    if (parsed.isError()) {
        return Result<std::optional<T>, std::string>::error(parsed.errorValue());
    }
    return Result<std::optional<T>, std::string>::okay(std::move(parsed.value()));
}

template <typename T>
Result<T, std::string> ConfigLoader::parse(const nlohmann::json& json, const std::string& filename)
{
    try {
        T config;
        // Use unqualified call to enable ADL (argument-dependent lookup).
        from_json(json, config);
        return Result<T, std::string>::okay(config);
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + filename + ": " + e.what());
    }
}

} // namespace RNodeClient
