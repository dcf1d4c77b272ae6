/**
 * @file ConfigLoader.hpp
 * @brief Static utility for locating the profile home and reading its JSON configuration.
 *
 * Keeps all path conventions and configuration parsing of the profile home in
 * one place.
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "domain/Identity.hpp"

namespace radview::infrastructure {

/**
 * @struct ProfileConfig
 * @brief Contents of `<home>/config.json` relevant to the local node.
 */
struct ProfileConfig {
    domain::ActorId nodeId;
    std::optional<std::string> alias;
};

class ConfigLoader {
public:
    static constexpr const char* HomeEnvVar = "RAD_HOME";

    /**
     * @brief Resolves the profile home: `RAD_HOME`, else `$HOME/.radicle`.
     * @throws domain::ConfigError when neither variable is set.
     */
    static std::filesystem::path ResolveHome();

    static std::filesystem::path ConfigPath(const std::filesystem::path& home);
    static std::filesystem::path StoragePath(const std::filesystem::path& home);

    /**
     * @brief Reads `config.json`.
     * @throws domain::ConfigError on malformed JSON or a missing/invalid `node.id`,
     *         std::runtime_error when the file cannot be opened.
     */
    static ProfileConfig LoadProfileConfig(const std::filesystem::path& home);

    /**
     * @brief Reads `node/aliases.json`. A missing file yields no aliases;
     * malformed entries are skipped.
     */
    static std::map<domain::ActorId, std::string> LoadAliases(const std::filesystem::path& home);

    /** @brief Reads `node/policies.json`. @throws domain::ConfigError when malformed. */
    static std::set<domain::RepoId> LoadSeedingPolicies(const std::filesystem::path& home);

    /** @brief Reads `node/routing.json`. @throws domain::ConfigError when malformed. */
    static std::map<domain::RepoId, std::vector<domain::ActorId>> LoadRouting(const std::filesystem::path& home);
};

} // namespace radview::infrastructure
