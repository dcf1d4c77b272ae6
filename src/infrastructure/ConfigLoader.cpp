/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "domain/Errors.hpp"

namespace fs = std::filesystem;

namespace radview::infrastructure {

namespace {

std::optional<nlohmann::json> ReadJsonFile(const fs::path& path) {
    if (!fs::exists(path)) {
        return std::nullopt;
    }
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("cannot open " + path.string());
    }
    try {
        nlohmann::json j;
        f >> j;
        return j;
    } catch (const nlohmann::json::exception& e) {
        throw domain::ConfigError("malformed " + path.string() + ": " + e.what());
    }
}

} // namespace

fs::path ConfigLoader::ResolveHome() {
    const char* radHome = std::getenv(HomeEnvVar);
    if (radHome && *radHome) {
        return fs::path(radHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".radicle";
    }
    throw domain::ConfigError("Could not determine profile home: neither RAD_HOME nor HOME is set");
}

fs::path ConfigLoader::ConfigPath(const fs::path& home) {
    return home / "config.json";
}

fs::path ConfigLoader::StoragePath(const fs::path& home) {
    return home / "storage";
}

ProfileConfig ConfigLoader::LoadProfileConfig(const fs::path& home) {
    auto j = ReadJsonFile(ConfigPath(home));
    if (!j) {
        throw std::runtime_error("missing " + ConfigPath(home).string());
    }

    try {
        const auto& node = j->at("node");
        ProfileConfig config;
        config.nodeId = domain::ActorId::fromString(node.at("id").get<std::string>());
        if (node.contains("alias") && node["alias"].is_string()) {
            config.alias = node["alias"].get<std::string>();
        }
        return config;
    } catch (const nlohmann::json::exception& e) {
        throw domain::ConfigError("invalid " + ConfigPath(home).string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw domain::ConfigError("invalid " + ConfigPath(home).string() + ": " + e.what());
    }
}

std::map<domain::ActorId, std::string> ConfigLoader::LoadAliases(const fs::path& home) {
    std::map<domain::ActorId, std::string> aliases;
    std::optional<nlohmann::json> j;
    try {
        j = ReadJsonFile(home / "node" / "aliases.json");
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading aliases.json: " << e.what() << std::endl;
        return aliases;
    }
    if (!j || !j->is_object()) {
        return aliases;
    }

    for (const auto& [key, value] : j->items()) {
        if (!value.is_string()) continue;
        try {
            aliases[domain::ActorId::fromString(key)] = value.get<std::string>();
        } catch (const std::invalid_argument& e) {
            std::cerr << "[ConfigLoader] Ignoring alias entry: " << e.what() << std::endl;
        }
    }
    return aliases;
}

std::set<domain::RepoId> ConfigLoader::LoadSeedingPolicies(const fs::path& home) {
    std::set<domain::RepoId> seeding;
    auto j = ReadJsonFile(home / "node" / "policies.json");
    if (!j) {
        return seeding;
    }
    try {
        for (const auto& rid : j->value("seeding", nlohmann::json::array())) {
            seeding.insert(domain::RepoId::fromUrn(rid.get<std::string>()));
        }
    } catch (const std::exception& e) {
        throw domain::ConfigError(std::string("invalid policies.json: ") + e.what());
    }
    return seeding;
}

std::map<domain::RepoId, std::vector<domain::ActorId>> ConfigLoader::LoadRouting(const fs::path& home) {
    std::map<domain::RepoId, std::vector<domain::ActorId>> routing;
    auto j = ReadJsonFile(home / "node" / "routing.json");
    if (!j) {
        return routing;
    }
    try {
        for (const auto& [rid, seeds] : j->items()) {
            auto& entry = routing[domain::RepoId::fromUrn(rid)];
            for (const auto& nid : seeds) {
                entry.push_back(domain::ActorId::fromString(nid.get<std::string>()));
            }
        }
    } catch (const std::exception& e) {
        throw domain::ConfigError(std::string("invalid routing.json: ") + e.what());
    }
    return routing;
}

} // namespace radview::infrastructure
