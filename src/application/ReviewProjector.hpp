/**
 * @file ReviewProjector.hpp
 * @brief Projects patch reviews and merges.
 */

#pragma once

#include <nlohmann/json.hpp>

#include "application/AuthorResolver.hpp"
#include "application/CommentProjector.hpp"
#include "domain/Patch.hpp"

namespace radview::application {

class ReviewProjector {
public:
    ReviewProjector(const AuthorResolver& authors, const CommentProjector& comments);

    /** @brief `{id, author, verdict, summary, comments, timestamp}`; verdict and summary may be null. */
    nlohmann::json projectReview(const domain::Review& review) const;

    /** @brief `{author, commit, timestamp, revision}`; the author is built from the merging node id. */
    nlohmann::json projectMerge(const domain::Merge& merge) const;

private:
    const AuthorResolver& m_authors;
    const CommentProjector& m_comments;
};

} // namespace radview::application
