/**
 * @file CommentProjector.hpp
 * @brief Projects comments and their edit history into views.
 */

#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include "application/AuthorResolver.hpp"
#include "application/ReactionAggregator.hpp"
#include "domain/Thread.hpp"

namespace radview::application {

/**
 * @class CommentProjector
 * @brief One comment in, one view out. Siblings are never consulted.
 */
class CommentProjector {
public:
    enum class Flavor {
        Plain,   ///< Issue comments: no `location` key.
        Located  ///< Patch and review comments: `location` key, null when absent.
    };

    CommentProjector(const AuthorResolver& authors, const ReactionAggregator& reactions);

    nlohmann::json projectEdit(const domain::Edit& edit) const;
    nlohmann::json projectComment(const domain::Comment& comment, Flavor flavor) const;

    /** @brief Projects a thread, keeping its order. */
    nlohmann::json projectThread(const std::vector<domain::Comment>& comments, Flavor flavor) const;

    nlohmann::json projectEdits(const std::vector<domain::Edit>& edits) const;

private:
    const AuthorResolver& m_authors;
    const ReactionAggregator& m_reactions;
};

} // namespace radview::application
