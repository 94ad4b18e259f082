#include "dotenv/loader.hpp"
#include "dotenv/platform.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace dotenv {

namespace fs = std::filesystem;

Result<std::string> expand_home(const std::string& path) {
    if (path != "~" && path.rfind("~/", 0) != 0) {
        return Result<std::string>::ok(path);
    }

    auto home = home_directory();
    if (!home) {
        return Result<std::string>::err(
            Error(ErrorCode::CONFIG_ERROR, "unable to expand ~ in " + path + ": home directory unknown"));
    }
    if (path == "~") {
        return Result<std::string>::ok(*home);
    }
    return Result<std::string>::ok((fs::path(*home) / path.substr(2)).string());
}

Result<std::string> resolve_config_dir(const std::optional<std::string>& override_dir) {
    // 1. Explicit override
    if (override_dir && !override_dir->empty()) {
        return expand_home(*override_dir);
    }

    // 2. Environment variable
    auto env_dir = get_env(CONFIG_DIR_ENV);
    if (env_dir && !env_dir->empty()) {
        return expand_home(*env_dir);
    }

    // 3. Default: ~/.dotenv
    auto home = home_directory();
    if (!home) {
        return Result<std::string>::err(
            Error(ErrorCode::CONFIG_ERROR,
                  "home directory unknown; it is required to locate named environments"));
    }
    return Result<std::string>::ok((fs::path(*home) / ".dotenv").string());
}

std::string named_environment_path(const std::string& name, const std::string& config_dir) {
    return (fs::path(config_dir) / (name + ".env")).string();
}

Result<EnvironmentTable> load_env_file(const std::string& path) {
    auto content = read_file(path);
    if (content.isErr()) {
        return Result<EnvironmentTable>::err(content.error());
    }

    auto table = parse(content.value());
    if (table.isErr()) {
        return Result<EnvironmentTable>::err(table.error().withContext(path));
    }

    spdlog::debug("loaded {} variable(s) from {}", table.value().size(), path);
    return table;
}

Result<std::vector<LoadedLayer>> load_layers(const LoadRequest& request) {
    using LayersResult = Result<std::vector<LoadedLayer>>;
    std::vector<LoadedLayer> layers;

    if (request.environment) {
        if (request.environment->empty()) {
            return LayersResult::err(
                Error(ErrorCode::CONFIG_ERROR, "environment name must not be empty"));
        }
        auto dir = resolve_config_dir(request.config_dir);
        if (dir.isErr()) {
            return LayersResult::err(dir.error());
        }

        LoadedLayer layer;
        layer.path = named_environment_path(*request.environment, dir.value());
        auto table = load_env_file(layer.path);
        if (table.isErr()) {
            return LayersResult::err(
                table.error().withContext("environment '" + *request.environment + "'"));
        }
        layer.present = true;
        layer.table = std::move(table.value());
        layers.push_back(std::move(layer));
    }

    if (request.file) {
        auto path = expand_home(*request.file);
        if (path.isErr()) {
            return LayersResult::err(path.error());
        }

        LoadedLayer layer;
        layer.path = path.value();
        auto table = load_env_file(layer.path);
        if (table.isErr()) {
            return LayersResult::err(table.error());
        }
        layer.present = true;
        layer.table = std::move(table.value());
        layers.push_back(std::move(layer));
    } else {
        LoadedLayer layer;
        layer.path = (fs::path(request.working_dir) / DEFAULT_ENV_FILE).string();
        auto table = load_env_file(layer.path);
        if (table.isOk()) {
            layer.present = true;
            layer.table = std::move(table.value());
        } else if (table.error().code() == ErrorCode::NOT_FOUND) {
            spdlog::debug("no {} in {}", DEFAULT_ENV_FILE, request.working_dir);
        } else {
            return LayersResult::err(table.error());
        }
        layers.push_back(std::move(layer));
    }

    return LayersResult::ok(std::move(layers));
}

std::vector<EnvironmentTable> tables_of(const std::vector<LoadedLayer>& layers) {
    std::vector<EnvironmentTable> tables;
    tables.reserve(layers.size());
    for (const auto& layer : layers) {
        tables.push_back(layer.table);
    }
    return tables;
}

} // namespace dotenv
