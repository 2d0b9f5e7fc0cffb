#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace covenant
{

    struct KeysConfig
    {
        std::string private_key{"keys/private.pem"};
        std::string public_key{"keys/public.pem"};
        std::string passphrase_env{"COVENANT_KEY_PASSPHRASE"};
    };

    struct OutputConfig
    {
        bool pretty{true};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
    };

    struct CovenantConfig
    {
        KeysConfig keys{};
        OutputConfig output{};
        LoggingConfig logging{};

        /** Passphrase from the variable named by keys.passphrase_env, if set */
        std::optional<std::string> passphrase() const;
    };

    /**
     * ConfigLoader loads TOML configs with environment overrides.
     * Secrets never live in the file; only the name of the environment
     * variable holding the key passphrase does.
     */
    class ConfigLoader
    {
    public:
        /** Defaults with environment overrides applied; invalid overrides are ErrorCode::ConfigError */
        static Result<CovenantConfig> defaults();

        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<CovenantConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<CovenantConfig> from_string(const std::string &toml_content);

        /** Serialize config to JSON for inspection (non-secret). */
        static nlohmann::json to_json(const CovenantConfig &cfg);

    private:
        static Result<void> apply_env_overrides(CovenantConfig &cfg);
    };

} // namespace covenant
