/**
 * @file RefCorrelator.cpp
 * @brief Implementation of RefCorrelator.
 */

#include "application/RefCorrelator.hpp"

#include <exception>
#include <iostream>

namespace radview::application {

std::vector<std::string> RefCorrelator::MatchingRefs(const domain::Repository& repo,
                                                     const domain::ActorId& author,
                                                     const domain::Oid& commit) {
    std::vector<std::string> names;
    domain::RefMap refs;
    try {
        refs = repo.remoteRefs(author);
    } catch (const std::exception& e) {
        std::cerr << "[RefCorrelator] No refs for " << author.toString()
                  << " in " << repo.id().toUrn() << ": " << e.what() << std::endl;
        return names;
    }

    for (const auto& [name, target] : refs) {
        if (target == commit) {
            names.push_back(name);
        }
    }
    return names;
}

} // namespace radview::application
