/**
 * @file ReviewProjector.cpp
 * @brief Implementation of ReviewProjector.
 */

#include "application/ReviewProjector.hpp"

#include "application/ViewEncoding.hpp"

namespace radview::application {

using json = nlohmann::json;

ReviewProjector::ReviewProjector(const AuthorResolver& authors, const CommentProjector& comments)
    : m_authors(authors), m_comments(comments) {}

json ReviewProjector::projectReview(const domain::Review& review) const {
    return {
        {"id", review.id.toString()},
        {"author", m_authors.resolveJson(review.author)},
        {"verdict", review.verdict ? json(VerdictToString(*review.verdict)) : json(nullptr)},
        {"summary", review.summary ? json(*review.summary) : json(nullptr)},
        {"comments", m_comments.projectThread(review.comments, CommentProjector::Flavor::Located)},
        {"timestamp", domain::ToUnixSeconds(review.timestamp)}
    };
}

json ReviewProjector::projectMerge(const domain::Merge& merge) const {
    domain::Author author(merge.author);
    return {
        {"author", m_authors.resolveJson(author)},
        {"commit", merge.commit.toString()},
        {"timestamp", domain::ToUnixSeconds(merge.timestamp)},
        {"revision", merge.revision.toString()}
    };
}

} // namespace radview::application
