/**
 * @file ReactionAggregator.cpp
 * @brief Implementation of ReactionAggregator.
 */

#include "application/ReactionAggregator.hpp"

#include <map>
#include <set>

#include "application/ViewEncoding.hpp"

namespace radview::application {

namespace {

struct AuthorList {
    std::vector<domain::ActorId> ordered;
    std::set<domain::ActorId> seen;
};

} // namespace

nlohmann::json ReactionGroup::toJson() const {
    nlohmann::json j;
    if (location) {
        j["location"] = application::ToJson(*location);
    }
    j["emoji"] = emoji;
    nlohmann::json list = nlohmann::json::array();
    for (const auto& author : authors) {
        list.push_back(author.toJson());
    }
    j["authors"] = list;
    return j;
}

ReactionAggregator::ReactionAggregator(const AuthorResolver& authors)
    : m_authors(authors) {}

std::vector<ReactionGroup> ReactionAggregator::group(const std::vector<domain::Reaction>& reactions,
                                                     const std::optional<domain::CodeLocation>& location) const {
    std::map<std::string, AuthorList> byEmoji;
    for (const auto& reaction : reactions) {
        auto& list = byEmoji[reaction.emoji];
        if (list.seen.insert(reaction.author).second) {
            list.ordered.push_back(reaction.author);
        }
    }

    std::vector<ReactionGroup> groups;
    groups.reserve(byEmoji.size());
    for (const auto& [emoji, list] : byEmoji) {
        ReactionGroup g;
        g.emoji = emoji;
        g.location = location;
        g.authors.reserve(list.ordered.size());
        for (const auto& actor : list.ordered) {
            g.authors.push_back(m_authors.resolve(actor));
        }
        groups.push_back(std::move(g));
    }
    return groups;
}

std::vector<ReactionGroup> ReactionAggregator::groupByLocation(const std::vector<domain::Reaction>& reactions) const {
    // nullopt orders before any location
    std::map<std::optional<domain::CodeLocation>, std::vector<domain::Reaction>> buckets;
    for (const auto& reaction : reactions) {
        buckets[reaction.location].push_back(reaction);
    }

    std::vector<ReactionGroup> groups;
    for (const auto& [location, bucket] : buckets) {
        auto located = group(bucket, location);
        groups.insert(groups.end(),
                      std::make_move_iterator(located.begin()),
                      std::make_move_iterator(located.end()));
    }
    return groups;
}

nlohmann::json ReactionAggregator::ToJson(const std::vector<ReactionGroup>& groups) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& g : groups) {
        out.push_back(g.toJson());
    }
    return out;
}

} // namespace radview::application
