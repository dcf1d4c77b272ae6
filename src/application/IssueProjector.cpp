/**
 * @file IssueProjector.cpp
 * @brief Implementation of IssueProjector.
 */

#include "application/IssueProjector.hpp"

#include "application/ViewEncoding.hpp"

namespace radview::application {

using json = nlohmann::json;

IssueProjector::IssueProjector(const Projectors& projectors)
    : m_projectors(projectors) {}

json IssueProjector::project(const domain::IssueId& id, const domain::Issue& issue) const {
    json assignees = json::array();
    for (const auto& assignee : issue.assignees) {
        assignees.push_back(m_projectors.authors.resolveJson(assignee));
    }

    return {
        {"id", id.toString()},
        {"author", m_projectors.authors.resolveJson(issue.author)},
        {"title", issue.title},
        {"state", ToJson(issue.state)},
        {"assignees", assignees},
        {"discussion", m_projectors.comments.projectThread(issue.comments, CommentProjector::Flavor::Plain)},
        {"labels", issue.labels}
    };
}

} // namespace radview::application
