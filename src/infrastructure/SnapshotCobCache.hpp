/**
 * @file SnapshotCobCache.hpp
 * @brief Patch and issue caches reading from a repository snapshot.
 */

#pragma once

#include <memory>

#include "domain/repositories/CobCache.hpp"
#include "infrastructure/FileRepositoryStore.hpp"

namespace radview::infrastructure {

class SnapshotPatchCache : public domain::PatchCache {
public:
    explicit SnapshotPatchCache(std::shared_ptr<const SnapshotRepository> repo);

    /** @brief Malformed entries are logged and left out. */
    std::vector<std::pair<domain::PatchId, domain::Patch>> list() override;

    /** @throws domain::StorageError when the entry exists but cannot be decoded. */
    std::optional<domain::Patch> get(const domain::PatchId& id) override;

    domain::PatchCounts counts() override;

private:
    std::shared_ptr<const SnapshotRepository> m_repo;
};

class SnapshotIssueCache : public domain::IssueCache {
public:
    explicit SnapshotIssueCache(std::shared_ptr<const SnapshotRepository> repo);

    std::vector<std::pair<domain::IssueId, domain::Issue>> list() override;
    std::optional<domain::Issue> get(const domain::IssueId& id) override;
    domain::IssueCounts counts() override;

private:
    std::shared_ptr<const SnapshotRepository> m_repo;
};

} // namespace radview::infrastructure
