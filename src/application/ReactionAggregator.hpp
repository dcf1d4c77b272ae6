/**
 * @file ReactionAggregator.hpp
 * @brief Groups per-author reactions into one author list per emoji.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/AuthorResolver.hpp"
#include "domain/CodeLocation.hpp"
#include "domain/Thread.hpp"

namespace radview::application {

/**
 * @struct ReactionGroup
 * @brief All authors who reacted with one emoji at one location.
 */
struct ReactionGroup {
    std::string emoji;
    std::vector<AuthorView> authors;
    std::optional<domain::CodeLocation> location;

    /** @brief The `location` key is only present for located groups. */
    nlohmann::json toJson() const;
};

/**
 * @class ReactionAggregator
 * @brief Deterministic reaction grouping.
 *
 * Groups are ordered by emoji (byte order of the UTF-8 encoding, which is
 * code point order). Authors keep first-seen order and appear at most once
 * per group.
 */
class ReactionAggregator {
public:
    explicit ReactionAggregator(const AuthorResolver& authors);

    /**
     * @brief Groups reactions by emoji, ignoring their own locations.
     * @param location Attached to every produced group.
     */
    std::vector<ReactionGroup> group(const std::vector<domain::Reaction>& reactions,
                                     const std::optional<domain::CodeLocation>& location = std::nullopt) const;

    /**
     * @brief Buckets reactions by location, then groups each bucket by emoji.
     *
     * Unlocated reactions come first, then buckets in location order. The same
     * emoji at two locations yields two groups.
     */
    std::vector<ReactionGroup> groupByLocation(const std::vector<domain::Reaction>& reactions) const;

    static nlohmann::json ToJson(const std::vector<ReactionGroup>& groups);

private:
    const AuthorResolver& m_authors;
};

} // namespace radview::application
