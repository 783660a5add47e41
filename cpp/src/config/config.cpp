// ==============================================================================
// config.cpp - YAML конфигурация
// ==============================================================================

#include "portclean/config.hpp"

#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace portclean::config {

namespace {

Config parse_root(const YAML::Node& root) {
    Config cfg;

    // Пустой файл - допустимая конфигурация со значениями по умолчанию
    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("config root must be a mapping");
    }

    for (const auto& item : root) {
        const std::string key = item.first.as<std::string>();
        const YAML::Node& value = item.second;

        if (key == "force") {
            cfg.force = value.as<bool>();
        } else if (key == "all") {
            cfg.all = value.as<bool>();
        } else if (key == "quiet") {
            cfg.quiet = value.as<bool>();
        } else if (key == "json") {
            cfg.json = value.as<bool>();
        } else if (key == "verbose") {
            cfg.verbose = value.as<int>();
            if (cfg.verbose < 0) {
                throw std::runtime_error("verbose must not be negative");
            }
        } else if (key == "default_answer") {
            auto policy = confirm::parse_policy(value.as<std::string>());
            if (!policy) {
                throw std::runtime_error("default_answer must be 'yes' or 'no', got '" +
                                         value.as<std::string>() + "'");
            }
            cfg.default_answer = *policy;
        } else {
            cfg.unknown_keys.push_back(key);
        }
    }

    return cfg;
}

}  // namespace

std::string Error::format() const {
    return "failed to load config '" + path + "' - " + message;
}

ConfigResult parse_config(const std::string& yaml, const std::string& path) {
    ConfigResult result;
    try {
        result.config = parse_root(YAML::Load(yaml));
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), path};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), path};
    }
    return result;
}

ConfigResult load_config(const std::filesystem::path& path) {
    ConfigResult result;
    try {
        result.config = parse_root(YAML::LoadFile(path.string()));
        result.ok = true;
    } catch (const YAML::BadFile&) {
        result.error = Error{"file cannot be opened", path.string()};
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), path.string()};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), path.string()};
    }
    return result;
}

std::optional<std::filesystem::path> resolve_config_path(
    const std::optional<std::filesystem::path>& cli_path) {
    if (cli_path.has_value()) {
        return cli_path;
    }
    const char* env = std::getenv(CONFIG_ENV_VAR);
    if (env != nullptr && env[0] != '\0') {
        return std::filesystem::path(env);
    }
    return std::nullopt;
}

}  // namespace portclean::config
