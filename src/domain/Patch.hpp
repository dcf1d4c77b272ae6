/**
 * @file Patch.hpp
 * @brief Patch collaborative object with its revisions, reviews and merges.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Identity.hpp"
#include "Thread.hpp"

namespace radview::domain {

enum class Verdict {
    Accept,
    Reject
};

/**
 * @struct Review
 * @brief A review of one revision.
 */
struct Review {
    ReviewId id;
    RevisionId revision; ///< Revision under review.
    Author author;
    std::optional<Verdict> verdict;
    std::optional<std::string> summary;
    std::vector<Comment> comments;
    Timestamp timestamp;
};

/**
 * @struct Merge
 * @brief Record of a delegate merging a revision.
 */
struct Merge {
    ActorId author; ///< Node that performed the merge.
    Oid commit;
    Timestamp timestamp;
    RevisionId revision;
};

/**
 * @struct Revision
 * @brief One proposed version of the patch change set.
 */
struct Revision {
    RevisionId id;
    Author author;
    std::string description;
    std::vector<Edit> edits;
    std::vector<Reaction> reactions; ///< May carry code locations.
    Oid base;
    Oid head;
    std::vector<Comment> discussion;
    Timestamp timestamp;
};

/**
 * @struct PatchState
 * @brief Lifecycle status of a patch.
 */
struct PatchState {
    enum class Status {
        Draft,
        Open,
        Archived,
        Merged
    };

    Status status = Status::Open;
    std::vector<std::pair<RevisionId, Oid>> conflicts; ///< Open only.
    RevisionId revision;                              ///< Merged only.
    Oid commit;                                       ///< Merged only.

    static PatchState draft() { return PatchState{Status::Draft, {}, {}, {}}; }
    static PatchState open() { return PatchState{}; }
    static PatchState archived() { return PatchState{Status::Archived, {}, {}, {}}; }
    static PatchState merged(RevisionId rev, Oid commit) {
        return PatchState{Status::Merged, {}, std::move(rev), std::move(commit)};
    }
};

/** @brief Target branch policy of a patch. Only the delegates' default branch exists. */
enum class MergeTarget {
    Delegates
};

/**
 * @struct Patch
 * @brief Snapshot of a patch. `revisions` is in timeline order, root first.
 */
struct Patch {
    Author author;
    std::string title;
    PatchState state;
    MergeTarget target = MergeTarget::Delegates;
    std::vector<std::string> labels;
    std::vector<ActorId> assignees;
    std::vector<Merge> merges;
    std::vector<Revision> revisions;
    std::vector<Review> reviews;

    /** @brief Timestamp of the latest revision, epoch for a patch without revisions. */
    Timestamp timestamp() const {
        return revisions.empty() ? Timestamp{} : revisions.back().timestamp;
    }

    std::vector<const Review*> reviewsOf(const RevisionId& revisionId) const {
        std::vector<const Review*> result;
        for (const auto& review : reviews) {
            if (review.revision == revisionId) {
                result.push_back(&review);
            }
        }
        return result;
    }
};

struct PatchCounts {
    std::size_t open = 0;
    std::size_t draft = 0;
    std::size_t archived = 0;
    std::size_t merged = 0;
};

} // namespace radview::domain
