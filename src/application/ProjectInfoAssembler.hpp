/**
 * @file ProjectInfoAssembler.hpp
 * @brief Builds the project view of a stored repository.
 */

#pragma once

#include <cstddef>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/AuthorResolver.hpp"
#include "domain/Issue.hpp"
#include "domain/Patch.hpp"
#include "domain/Project.hpp"
#include "domain/repositories/NodeProfile.hpp"

namespace radview::application {

/**
 * @struct ProjectInfo
 * @brief Project payload plus governance, head, activity counts and seeding.
 */
struct ProjectInfo {
    domain::Project payload;
    std::vector<AuthorView> delegates;
    std::size_t threshold = 0;
    domain::Visibility visibility;
    domain::Oid head;
    domain::PatchCounts patches;
    domain::IssueCounts issues;
    domain::RepoId id;
    std::size_t seeding = 0;

    /** @brief Payload fields are flattened into the top-level object. */
    nlohmann::json toJson() const;
};

class ProjectInfoAssembler {
public:
    ProjectInfoAssembler(domain::NodeProfile& profile, const AuthorResolver& authors);

    /**
     * @brief Assembles the info of `repo` described by `doc`.
     *
     * Head, payload and count failures propagate. A failing seed count
     * lookup yields zero.
     */
    ProjectInfo assemble(const domain::Repository& repo, const domain::IdentityDoc& doc) const;

private:
    domain::NodeProfile& m_profile;
    const AuthorResolver& m_authors;
};

} // namespace radview::application
