#pragma once
#include "cmd_args.hpp"
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>

// Environment variables consulted when an option is absent
inline constexpr const char* ENV_REALM_KEY = "REALMAUTH_REALM_KEY";
inline constexpr const char* ENV_REALM_NAME = "REALMAUTH_REALM_NAME";

using env_lookup = std::function<std::optional<std::string>(const std::string&)>;

inline std::optional<std::string> process_env(const std::string& name) {
    if (const char* value = std::getenv(name.c_str()); value != nullptr && *value != '\0') {
        return std::string(value);
    }
    return std::nullopt;
}

// Realm settings used by pairing-scoped commands.
// Command line options win over the environment.
struct realm_config {
    std::string key_path;
    std::string name;

    static realm_config resolve(const cmd_args& args, const env_lookup& env = process_env) {
        realm_config cfg;
        if (auto key = args.get({"realm-key", "k"})) {
            cfg.key_path = *key;
        } else if (auto key_env = env(ENV_REALM_KEY)) {
            cfg.key_path = *key_env;
        }
        if (auto name = args.get({"realm-name", "r"})) {
            cfg.name = *name;
        } else if (auto name_env = env(ENV_REALM_NAME)) {
            cfg.name = *name_env;
        }
        return cfg;
    }
};
