/**
 * @file CobCache.hpp
 * @brief Interfaces for the materialized issue and patch caches of a repository.
 */

#pragma once

#include <optional>
#include <utility>
#include <vector>

#include "domain/Issue.hpp"
#include "domain/Patch.hpp"

namespace radview::domain {

class PatchCache {
public:
    virtual ~PatchCache() = default;

    /** @brief All readable patches, in storage order. */
    virtual std::vector<std::pair<PatchId, Patch>> list() = 0;

    /** @return nullopt when no patch has this id. Throws on read failures. */
    virtual std::optional<Patch> get(const PatchId& id) = 0;

    virtual PatchCounts counts() = 0;
};

class IssueCache {
public:
    virtual ~IssueCache() = default;

    virtual std::vector<std::pair<IssueId, Issue>> list() = 0;
    virtual std::optional<Issue> get(const IssueId& id) = 0;
    virtual IssueCounts counts() = 0;
};

} // namespace radview::domain
