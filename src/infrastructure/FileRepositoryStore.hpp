/**
 * @file FileRepositoryStore.hpp
 * @brief Repository storage backed by per-repository JSON snapshots.
 *
 * Layout: `<storage>/<rid body>/repository.json`.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/repositories/Repository.hpp"

namespace radview::infrastructure {

/**
 * @class SnapshotRepository
 * @brief Repository handle over one parsed snapshot document.
 */
class SnapshotRepository : public domain::Repository,
                           public std::enable_shared_from_this<SnapshotRepository> {
public:
    SnapshotRepository(domain::RepoId rid, nlohmann::json document);

    const domain::RepoId& id() const override { return m_rid; }
    domain::IdentityDoc identityDoc() const override;
    domain::Oid head() const override;
    domain::RefMap remoteRefs(const domain::ActorId& remote) const override;

    /** @brief Raw `patches` object, keyed by patch id. */
    const nlohmann::json& patchesJson() const;
    /** @brief Raw `issues` object, keyed by issue id. */
    const nlohmann::json& issuesJson() const;

private:
    domain::RepoId m_rid;
    nlohmann::json m_document;
};

class FileRepositoryStore : public domain::RepositoryStore {
public:
    static constexpr const char* SnapshotFile = "repository.json";

    explicit FileRepositoryStore(std::filesystem::path storageRoot);

    std::shared_ptr<domain::Repository> repository(const domain::RepoId& rid) override;

    /** @brief Lists every readable snapshot; unreadable ones are logged and skipped. */
    std::vector<domain::RepoSummary> repositories() override;

private:
    std::filesystem::path m_root;

    nlohmann::json readSnapshot(const std::filesystem::path& path) const;
};

} // namespace radview::infrastructure
