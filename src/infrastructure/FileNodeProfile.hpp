/**
 * @file FileNodeProfile.hpp
 * @brief NodeProfile and ProfileContext backed by a profile home directory.
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <vector>

#include "domain/repositories/NodeProfile.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileAliasStore.hpp"
#include "infrastructure/FileRepositoryStore.hpp"

namespace radview::infrastructure {

/**
 * @class FileNodeProfile
 * @brief Local node profile read from `<home>`.
 *
 * Seeding policies and routing are read on first use, so a broken policy
 * file only affects the lookups that need it.
 */
class FileNodeProfile : public domain::NodeProfile {
public:
    FileNodeProfile(std::filesystem::path home, ProfileConfig config);

    domain::ActorId nodeId() const override { return m_config.nodeId; }

    domain::RepositoryStore& storage() override { return m_storage; }
    const domain::AliasStore& aliases() const override { return m_aliases; }

    /** @throws domain::StorageError for repositories not opened from this profile's storage. */
    std::unique_ptr<domain::PatchCache> patches(const domain::Repository& repo) override;
    std::unique_ptr<domain::IssueCache> issues(const domain::Repository& repo) override;

    bool isSeeding(const domain::RepoId& rid) const override;
    std::size_t seedCount(const domain::RepoId& rid) const override;

private:
    std::filesystem::path m_home;
    ProfileConfig m_config;
    FileRepositoryStore m_storage;
    FileAliasStore m_aliases;

    mutable std::optional<std::set<domain::RepoId>> m_seeding;
    mutable std::optional<std::map<domain::RepoId, std::vector<domain::ActorId>>> m_routing;

    std::shared_ptr<const SnapshotRepository> snapshotOf(const domain::Repository& repo) const;
};

/**
 * @class FileProfileContext
 * @brief Opens the profile found at an explicit home, or at the resolved default one.
 */
class FileProfileContext : public domain::ProfileContext {
public:
    explicit FileProfileContext(std::optional<std::filesystem::path> home = std::nullopt);

    std::filesystem::path home() const override;

    /**
     * @throws domain::HintedError when the home or its config.json is missing,
     *         domain::ConfigError on malformed configuration,
     *         std::runtime_error("Could not load radicle profile: ...") otherwise.
     */
    std::shared_ptr<domain::NodeProfile> profile() override;

    domain::RepoId repoIdAt(const std::filesystem::path& path) const override;

private:
    std::optional<std::filesystem::path> m_home;
};

} // namespace radview::infrastructure
