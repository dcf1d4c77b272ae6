/**
 * @file Project.hpp
 * @brief Repository identity document and project payload.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "Identity.hpp"

namespace radview::domain {

/**
 * @struct Project
 * @brief Project payload of an identity document.
 */
struct Project {
    std::string name;
    std::string description;
    std::string defaultBranch;
};

/**
 * @struct Visibility
 * @brief Public repositories are listed; private ones carry an allow list.
 */
struct Visibility {
    bool isPublic = true;
    std::vector<ActorId> allow; ///< Private only.

    static Visibility publicRepo() { return Visibility{}; }
    static Visibility privateRepo(std::vector<ActorId> allowed) {
        return Visibility{false, std::move(allowed)};
    }
};

/**
 * @struct IdentityDoc
 * @brief Governance document of a repository.
 */
struct IdentityDoc {
    Project project;
    std::vector<ActorId> delegates;
    std::size_t threshold = 1;
    Visibility visibility;
};

/**
 * @struct RepoSummary
 * @brief Entry of a storage listing.
 */
struct RepoSummary {
    RepoId rid;
    IdentityDoc doc;
};

} // namespace radview::domain
