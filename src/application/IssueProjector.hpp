/**
 * @file IssueProjector.hpp
 * @brief Assembles the full issue view.
 */

#pragma once

#include <nlohmann/json.hpp>

#include "application/Projectors.hpp"
#include "domain/Issue.hpp"

namespace radview::application {

class IssueProjector {
public:
    explicit IssueProjector(const Projectors& projectors);

    /** @brief `{id, author, title, state, assignees, discussion, labels}`. */
    nlohmann::json project(const domain::IssueId& id, const domain::Issue& issue) const;

private:
    const Projectors& m_projectors;
};

} // namespace radview::application
