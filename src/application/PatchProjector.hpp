/**
 * @file PatchProjector.hpp
 * @brief Assembles the full patch view: revisions, reviews, merges and refs.
 */

#pragma once

#include <nlohmann/json.hpp>

#include "application/Projectors.hpp"
#include "domain/Patch.hpp"
#include "domain/repositories/Repository.hpp"

namespace radview::application {

/**
 * @class PatchProjector
 * @brief Projects one patch. Fails as a whole: there is no partial revision output.
 */
class PatchProjector {
public:
    PatchProjector(const Projectors& projectors, const domain::Repository& repo);

    /**
     * @brief Builds `{id, author, title, state, target, labels, merges, assignees, revisions}`.
     * @throws ProjectionError for a patch without revisions; alias lookup failures propagate.
     */
    nlohmann::json project(const domain::PatchId& id, const domain::Patch& patch) const;

    /** @brief View of one revision; refs are looked up in the patch author's remote. */
    nlohmann::json projectRevision(const domain::Patch& patch, const domain::Revision& revision) const;

private:
    const Projectors& m_projectors;
    const domain::Repository& m_repo;
};

} // namespace radview::application
