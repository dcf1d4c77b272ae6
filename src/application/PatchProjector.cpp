/**
 * @file PatchProjector.cpp
 * @brief Implementation of PatchProjector.
 */

#include "application/PatchProjector.hpp"

#include "application/RefCorrelator.hpp"
#include "application/ViewEncoding.hpp"

namespace radview::application {

using json = nlohmann::json;

PatchProjector::PatchProjector(const Projectors& projectors, const domain::Repository& repo)
    : m_projectors(projectors), m_repo(repo) {}

json PatchProjector::project(const domain::PatchId& id, const domain::Patch& patch) const {
    if (patch.revisions.empty()) {
        throw ProjectionError("patch " + id.toString() + " has no revisions");
    }

    const auto& authors = m_projectors.authors;

    json merges = json::array();
    for (const auto& merge : patch.merges) {
        merges.push_back(m_projectors.reviews.projectMerge(merge));
    }

    json assignees = json::array();
    for (const auto& assignee : patch.assignees) {
        assignees.push_back(authors.resolveJson(assignee));
    }

    json revisions = json::array();
    for (const auto& revision : patch.revisions) {
        revisions.push_back(projectRevision(patch, revision));
    }

    return {
        {"id", id.toString()},
        {"author", authors.resolveJson(patch.author)},
        {"title", patch.title},
        {"state", ToJson(patch.state)},
        {"target", MergeTargetToString(patch.target)},
        {"labels", patch.labels},
        {"merges", merges},
        {"assignees", assignees},
        {"revisions", revisions}
    };
}

json PatchProjector::projectRevision(const domain::Patch& patch, const domain::Revision& revision) const {
    const auto& comments = m_projectors.comments;

    json reviews = json::array();
    for (const auto* review : patch.reviewsOf(revision.id)) {
        reviews.push_back(m_projectors.reviews.projectReview(*review));
    }

    // Refs are published under the patch author, not the revision author.
    auto refs = RefCorrelator::MatchingRefs(m_repo, patch.author.id, revision.head);

    return {
        {"id", revision.id.toString()},
        {"author", m_projectors.authors.resolveJson(revision.author)},
        {"description", revision.description},
        {"edits", comments.projectEdits(revision.edits)},
        {"reactions", ReactionAggregator::ToJson(m_projectors.reactions.groupByLocation(revision.reactions))},
        {"base", revision.base.toString()},
        {"oid", revision.head.toString()},
        {"refs", refs},
        {"discussions", comments.projectThread(revision.discussion, CommentProjector::Flavor::Located)},
        {"timestamp", domain::ToUnixSeconds(revision.timestamp)},
        {"reviews", reviews}
    };
}

} // namespace radview::application
