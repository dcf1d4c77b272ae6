/**
 * @file Issue.hpp
 * @brief Issue collaborative object.
 */

#pragma once

#include <string>
#include <vector>

#include "Identity.hpp"
#include "Thread.hpp"

namespace radview::domain {

/**
 * @struct IssueState
 * @brief Open, or closed with a reason.
 */
struct IssueState {
    enum class Status {
        Open,
        Closed
    };
    enum class CloseReason {
        Other,
        Solved
    };

    Status status = Status::Open;
    CloseReason reason = CloseReason::Other; ///< Only meaningful when closed.

    static IssueState open() { return IssueState{}; }
    static IssueState closed(CloseReason r) { return IssueState{Status::Closed, r}; }
};

/**
 * @struct Issue
 * @brief Snapshot of an issue. `comments` starts with the issue description.
 */
struct Issue {
    Author author;
    std::string title;
    IssueState state;
    std::vector<ActorId> assignees;
    std::vector<std::string> labels;
    std::vector<Comment> comments;

    /** @brief Creation time, i.e. the timestamp of the opening comment. */
    Timestamp timestamp() const {
        return comments.empty() ? Timestamp{} : comments.front().timestamp;
    }
};

struct IssueCounts {
    std::size_t open = 0;
    std::size_t closed = 0;
};

} // namespace radview::domain
