#include "covenant/config.hpp"
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <algorithm>
#include <array>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace covenant
{
    namespace
    {
        constexpr std::array<std::string_view, 7> kLogLevels = {
            "trace", "debug", "info", "warn", "error", "critical", "off"};

        bool is_log_level(std::string_view level)
        {
            return std::find(kLogLevels.begin(), kLogLevels.end(), level) != kLogLevels.end();
        }

        Result<bool> parse_flag(std::string_view name, std::string_view value)
        {
            if (value == "1" || value == "true" || value == "yes")
                return true;
            if (value == "0" || value == "false" || value == "no")
                return false;
            return std::unexpected(CovenantError::config(
                std::format("{} must be a boolean, got '{}'", name, value)));
        }

        Result<CovenantConfig> parse_toml(const toml::table &tbl, CovenantConfig cfg)
        {
            if (auto keys = tbl["keys"].as_table())
            {
                if (auto path = (*keys)["private_key"].value<std::string>())
                    cfg.keys.private_key = *path;
                if (auto path = (*keys)["public_key"].value<std::string>())
                    cfg.keys.public_key = *path;
                if (auto env = (*keys)["passphrase_env"].value<std::string>())
                    cfg.keys.passphrase_env = *env;
                if ((*keys).contains("passphrase"))
                {
                    return std::unexpected(CovenantError::config(
                        "keys.passphrase is not allowed; name an environment variable in keys.passphrase_env"));
                }
            }

            if (auto output = tbl["output"].as_table())
            {
                if (auto pretty = (*output)["pretty"].value<bool>())
                    cfg.output.pretty = *pretty;
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                {
                    if (!is_log_level(*level))
                    {
                        return std::unexpected(CovenantError::config("Unknown logging.level: " + *level));
                    }
                    cfg.logging.level = *level;
                }
            }

            return cfg;
        }

    } // namespace

    std::optional<std::string> CovenantConfig::passphrase() const
    {
        if (keys.passphrase_env.empty())
            return std::nullopt;
        if (const char *value = std::getenv(keys.passphrase_env.c_str()))
            return std::string(value);
        return std::nullopt;
    }

    Result<CovenantConfig> ConfigLoader::defaults()
    {
        CovenantConfig cfg{};
        if (auto applied = apply_env_overrides(cfg); !applied)
            return std::unexpected(applied.error());
        return cfg;
    }

    Result<CovenantConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(CovenantError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        spdlog::debug("Loading config from {}", path);
        return from_string(buffer.str());
    }

    Result<CovenantConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        CovenantConfig cfg{};
        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return parsed;
            cfg = std::move(*parsed);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(CovenantError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        if (auto applied = apply_env_overrides(cfg); !applied)
            return std::unexpected(applied.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(CovenantConfig &cfg)
    {
        if (const char *path = std::getenv("COVENANT_PRIVATE_KEY"))
            cfg.keys.private_key = path;
        if (const char *path = std::getenv("COVENANT_PUBLIC_KEY"))
            cfg.keys.public_key = path;
        if (const char *env = std::getenv("COVENANT_PASSPHRASE_ENV"))
            cfg.keys.passphrase_env = env;
        if (const char *pretty = std::getenv("COVENANT_PRETTY"))
        {
            auto flag = parse_flag("COVENANT_PRETTY", pretty);
            if (!flag)
                return std::unexpected(flag.error());
            cfg.output.pretty = *flag;
        }
        if (const char *level = std::getenv("COVENANT_LOG_LEVEL"))
        {
            if (!is_log_level(level))
                return std::unexpected(CovenantError::config(std::string("Unknown COVENANT_LOG_LEVEL: ") + level));
            cfg.logging.level = level;
        }
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const CovenantConfig &cfg)
    {
        nlohmann::json j;
        j["keys"] = {
            {"private_key", cfg.keys.private_key},
            {"public_key", cfg.keys.public_key},
            {"passphrase_env", cfg.keys.passphrase_env}};
        j["output"] = {{"pretty", cfg.output.pretty}};
        j["logging"] = {{"level", cfg.logging.level}};
        j["has_passphrase"] = cfg.passphrase().has_value();
        return j;
    }

} // namespace covenant
