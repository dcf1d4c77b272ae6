/**
 * @file RefCorrelator.hpp
 * @brief Finds the references of an author's remote that point at a commit.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/Identity.hpp"
#include "domain/repositories/Repository.hpp"

namespace radview::application {

/**
 * @class RefCorrelator
 * @brief Soft-failing reference lookup.
 *
 * Any storage failure yields an empty list; a revision view renders
 * without refs rather than not at all.
 */
class RefCorrelator {
public:
    /**
     * @brief Names of `author`'s remote references whose target is `commit`.
     * @return Matching names in reference map order, empty on no match or on failure.
     */
    static std::vector<std::string> MatchingRefs(const domain::Repository& repo,
                                                 const domain::ActorId& author,
                                                 const domain::Oid& commit);
};

} // namespace radview::application
