/**
 * @file CommentProjector.cpp
 * @brief Implementation of CommentProjector.
 */

#include "application/CommentProjector.hpp"

#include "application/ViewEncoding.hpp"

namespace radview::application {

using json = nlohmann::json;

CommentProjector::CommentProjector(const AuthorResolver& authors, const ReactionAggregator& reactions)
    : m_authors(authors), m_reactions(reactions) {}

json CommentProjector::projectEdit(const domain::Edit& edit) const {
    return {
        {"author", m_authors.resolveJson(edit.author)},
        {"body", edit.body},
        {"timestamp", domain::ToUnixSeconds(edit.timestamp)},
        {"embeds", ToJson(edit.embeds)}
    };
}

json CommentProjector::projectEdits(const std::vector<domain::Edit>& edits) const {
    json out = json::array();
    for (const auto& edit : edits) {
        out.push_back(projectEdit(edit));
    }
    return out;
}

json CommentProjector::projectComment(const domain::Comment& comment, Flavor flavor) const {
    const bool located = flavor == Flavor::Located;
    auto groups = m_reactions.group(comment.reactions,
                                    located ? comment.location : std::optional<domain::CodeLocation>{});

    json j = {
        {"id", comment.id.toString()},
        {"author", m_authors.resolveJson(comment.author)},
        {"body", comment.body},
        {"edits", projectEdits(comment.edits)},
        {"embeds", ToJson(comment.embeds)},
        {"reactions", ReactionAggregator::ToJson(groups)},
        {"timestamp", domain::ToUnixSeconds(comment.timestamp)},
        {"replyTo", comment.replyTo ? json(comment.replyTo->toString()) : json(nullptr)},
        {"resolved", comment.resolved}
    };
    if (located) {
        j["location"] = ToJson(comment.location);
    }
    return j;
}

json CommentProjector::projectThread(const std::vector<domain::Comment>& comments, Flavor flavor) const {
    json out = json::array();
    for (const auto& comment : comments) {
        out.push_back(projectComment(comment, flavor));
    }
    return out;
}

} // namespace radview::application
