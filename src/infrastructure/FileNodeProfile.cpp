/**
 * @file FileNodeProfile.cpp
 * @brief Implementation of FileNodeProfile and FileProfileContext.
 */

#include "infrastructure/FileNodeProfile.hpp"

#include <iostream>

#include "domain/Errors.hpp"
#include "infrastructure/GitWorkingCopy.hpp"
#include "infrastructure/SnapshotCobCache.hpp"

namespace fs = std::filesystem;

namespace radview::infrastructure {

namespace {

std::map<domain::ActorId, std::string> AliasesWithSelf(const fs::path& home, const ProfileConfig& config) {
    auto aliases = ConfigLoader::LoadAliases(home);
    if (config.alias) {
        aliases[config.nodeId] = *config.alias;
    }
    return aliases;
}

} // namespace

FileNodeProfile::FileNodeProfile(fs::path home, ProfileConfig config)
    : m_home(std::move(home)),
      m_config(std::move(config)),
      m_storage(ConfigLoader::StoragePath(m_home)),
      m_aliases(AliasesWithSelf(m_home, m_config)) {}

std::shared_ptr<const SnapshotRepository> FileNodeProfile::snapshotOf(const domain::Repository& repo) const {
    auto* snapshot = dynamic_cast<const SnapshotRepository*>(&repo);
    if (!snapshot) {
        throw domain::StorageError("repository " + repo.id().toUrn() + " is not backed by profile storage");
    }
    return snapshot->shared_from_this();
}

std::unique_ptr<domain::PatchCache> FileNodeProfile::patches(const domain::Repository& repo) {
    return std::make_unique<SnapshotPatchCache>(snapshotOf(repo));
}

std::unique_ptr<domain::IssueCache> FileNodeProfile::issues(const domain::Repository& repo) {
    return std::make_unique<SnapshotIssueCache>(snapshotOf(repo));
}

bool FileNodeProfile::isSeeding(const domain::RepoId& rid) const {
    if (!m_seeding) {
        m_seeding = ConfigLoader::LoadSeedingPolicies(m_home);
    }
    return m_seeding->count(rid) > 0;
}

std::size_t FileNodeProfile::seedCount(const domain::RepoId& rid) const {
    if (!m_routing) {
        m_routing = ConfigLoader::LoadRouting(m_home);
    }
    auto it = m_routing->find(rid);
    return it == m_routing->end() ? 0 : it->second.size();
}

FileProfileContext::FileProfileContext(std::optional<fs::path> home)
    : m_home(std::move(home)) {}

fs::path FileProfileContext::home() const {
    return m_home ? *m_home : ConfigLoader::ResolveHome();
}

std::shared_ptr<domain::NodeProfile> FileProfileContext::profile() {
    fs::path root = home();
    if (!fs::exists(root) || !fs::exists(ConfigLoader::ConfigPath(root))) {
        throw domain::HintedError("Radicle profile not found in '" + root.string() + "'.",
                                  "To setup your radicle profile, run `rad auth`.");
    }

    try {
        return std::make_shared<FileNodeProfile>(root, ConfigLoader::LoadProfileConfig(root));
    } catch (const domain::ConfigError&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[ProfileContext] Failed to load profile at " << root << ": " << e.what() << std::endl;
        throw std::runtime_error(std::string("Could not load radicle profile: ") + e.what());
    }
}

domain::RepoId FileProfileContext::repoIdAt(const fs::path& path) const {
    return GitWorkingCopy::RepoIdAt(path);
}

} // namespace radview::infrastructure
