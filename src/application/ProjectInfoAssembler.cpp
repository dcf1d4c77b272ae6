/**
 * @file ProjectInfoAssembler.cpp
 * @brief Implementation of ProjectInfoAssembler.
 */

#include "application/ProjectInfoAssembler.hpp"

#include <exception>
#include <iostream>

#include "application/ViewEncoding.hpp"

namespace radview::application {

using json = nlohmann::json;

json ProjectInfo::toJson() const {
    json delegateViews = json::array();
    for (const auto& delegate : delegates) {
        delegateViews.push_back(delegate.toJson());
    }

    return {
        {"name", payload.name},
        {"description", payload.description},
        {"defaultBranch", payload.defaultBranch},
        {"delegates", delegateViews},
        {"threshold", threshold},
        {"visibility", ToJson(visibility)},
        {"head", head.toString()},
        {"patches", ToJson(patches)},
        {"issues", ToJson(issues)},
        {"id", id.toUrn()},
        {"seeding", seeding}
    };
}

ProjectInfoAssembler::ProjectInfoAssembler(domain::NodeProfile& profile, const AuthorResolver& authors)
    : m_profile(profile), m_authors(authors) {}

ProjectInfo ProjectInfoAssembler::assemble(const domain::Repository& repo, const domain::IdentityDoc& doc) const {
    ProjectInfo info;
    info.payload = doc.project;
    info.head = repo.head();
    for (const auto& did : doc.delegates) {
        info.delegates.push_back(m_authors.resolve(did));
    }
    info.threshold = doc.threshold;
    info.visibility = doc.visibility;
    info.issues = m_profile.issues(repo)->counts();
    info.patches = m_profile.patches(repo)->counts();
    info.id = repo.id();

    try {
        info.seeding = m_profile.seedCount(repo.id());
    } catch (const std::exception& e) {
        std::cerr << "[ProjectInfo] Seed count unavailable for " << repo.id().toUrn() << ": " << e.what() << std::endl;
        info.seeding = 0;
    }
    return info;
}

} // namespace radview::application
