/**
 * @file SnapshotCobCache.cpp
 * @brief Implementation of the snapshot-backed caches.
 */

#include "infrastructure/SnapshotCobCache.hpp"

#include <iostream>

#include "domain/Errors.hpp"
#include "infrastructure/SnapshotCodec.hpp"

namespace radview::infrastructure {

using json = nlohmann::json;

namespace {

// Decodes every entry of a snapshot object, skipping the ones that fail.
template <typename T, typename Decoder>
std::vector<std::pair<domain::Oid, T>> DecodeAll(const json& entries, Decoder decode, const char* component) {
    std::vector<std::pair<domain::Oid, T>> result;
    for (const auto& [key, value] : entries.items()) {
        try {
            result.emplace_back(domain::Oid::fromString(key), decode(value));
        } catch (const std::exception& e) {
            std::cerr << "[" << component << "] Skipping " << key << ": " << e.what() << std::endl;
        }
    }
    return result;
}

template <typename T, typename Decoder>
std::optional<T> DecodeOne(const json& entries, const domain::Oid& id, Decoder decode, const char* kind) {
    auto it = entries.find(id.toString());
    if (it == entries.end()) {
        return std::nullopt;
    }
    try {
        return decode(*it);
    } catch (const std::exception& e) {
        throw domain::StorageError(std::string(kind) + " " + id.toString() + " is unreadable: " + e.what());
    }
}

} // namespace

SnapshotPatchCache::SnapshotPatchCache(std::shared_ptr<const SnapshotRepository> repo)
    : m_repo(std::move(repo)) {}

std::vector<std::pair<domain::PatchId, domain::Patch>> SnapshotPatchCache::list() {
    return DecodeAll<domain::Patch>(m_repo->patchesJson(), &SnapshotCodec::DecodePatch, "PatchCache");
}

std::optional<domain::Patch> SnapshotPatchCache::get(const domain::PatchId& id) {
    return DecodeOne<domain::Patch>(m_repo->patchesJson(), id, &SnapshotCodec::DecodePatch, "patch");
}

domain::PatchCounts SnapshotPatchCache::counts() {
    domain::PatchCounts counts;
    for (const auto& [id, patch] : list()) {
        switch (patch.state.status) {
        case domain::PatchState::Status::Draft: ++counts.draft; break;
        case domain::PatchState::Status::Open: ++counts.open; break;
        case domain::PatchState::Status::Archived: ++counts.archived; break;
        case domain::PatchState::Status::Merged: ++counts.merged; break;
        }
    }
    return counts;
}

SnapshotIssueCache::SnapshotIssueCache(std::shared_ptr<const SnapshotRepository> repo)
    : m_repo(std::move(repo)) {}

std::vector<std::pair<domain::IssueId, domain::Issue>> SnapshotIssueCache::list() {
    return DecodeAll<domain::Issue>(m_repo->issuesJson(), &SnapshotCodec::DecodeIssue, "IssueCache");
}

std::optional<domain::Issue> SnapshotIssueCache::get(const domain::IssueId& id) {
    return DecodeOne<domain::Issue>(m_repo->issuesJson(), id, &SnapshotCodec::DecodeIssue, "issue");
}

domain::IssueCounts SnapshotIssueCache::counts() {
    domain::IssueCounts counts;
    for (const auto& [id, issue] : list()) {
        if (issue.state.status == domain::IssueState::Status::Open) ++counts.open;
        else ++counts.closed;
    }
    return counts;
}

} // namespace radview::infrastructure
