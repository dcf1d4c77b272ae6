/**
 * @file NodeApi.cpp
 * @brief Implementation of NodeApi.
 */

#include "application/NodeApi.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>

#include "application/IssueProjector.hpp"
#include "application/PatchProjector.hpp"
#include "application/ProjectInfoAssembler.hpp"
#include "application/Projectors.hpp"
#include "application/ViewEncoding.hpp"
#include "domain/Errors.hpp"

namespace radview::application {

using json = nlohmann::json;

NodeApi::NodeApi(std::shared_ptr<domain::ProfileContext> context)
    : m_context(std::move(context)) {}

std::string NodeApi::currentNodeId() {
    return m_context->profile()->nodeId().toString();
}

std::string NodeApi::repoIdAtPath(const std::string& path) {
    try {
        return m_context->repoIdAt(path).toUrn();
    } catch (const std::exception& e) {
        std::cerr << "[NodeApi] " << path << ": " << e.what() << std::endl;
        throw std::runtime_error(path + " is not a Radicle repository");
    }
}

json NodeApi::getProject(const std::string& rid) {
    auto profile = m_context->profile();
    auto repo = profile->storage().repository(domain::RepoId::fromUrn(rid));
    auto doc = repo->identityDoc();

    Projectors projectors(profile->aliases());
    ProjectInfoAssembler assembler(*profile, projectors.authors);
    return assembler.assemble(*repo, doc).toJson();
}

json NodeApi::listProjects() {
    auto profile = m_context->profile();
    auto& storage = profile->storage();

    auto summaries = storage.repositories();
    summaries.erase(std::remove_if(summaries.begin(), summaries.end(),
                                   [](const domain::RepoSummary& s) { return !s.doc.visibility.isPublic; }),
                    summaries.end());
    std::sort(summaries.begin(), summaries.end(),
              [](const domain::RepoSummary& a, const domain::RepoSummary& b) { return a.rid < b.rid; });

    Projectors projectors(profile->aliases());
    ProjectInfoAssembler assembler(*profile, projectors.authors);

    json out = json::array();
    for (const auto& summary : summaries) {
        bool seeding = false;
        try {
            seeding = profile->isSeeding(summary.rid);
        } catch (const std::exception& e) {
            std::cerr << "[ProjectListing] Policy lookup failed for " << summary.rid.toUrn() << ": " << e.what() << std::endl;
        }
        if (!seeding) continue;

        try {
            auto repo = storage.repository(summary.rid);
            out.push_back(assembler.assemble(*repo, summary.doc).toJson());
        } catch (const std::exception& e) {
            std::cerr << "[ProjectListing] Skipping " << summary.rid.toUrn() << ": " << e.what() << std::endl;
        }
    }
    return out;
}

json NodeApi::listPatches(const std::string& rid, const std::optional<std::string>& status) {
    std::optional<domain::PatchState::Status> filter;
    if (status) {
        filter = PatchStatusFromString(*status);
    }

    auto profile = m_context->profile();
    auto repo = profile->storage().repository(domain::RepoId::fromUrn(rid));
    auto patches = profile->patches(*repo)->list();

    if (filter) {
        patches.erase(std::remove_if(patches.begin(), patches.end(),
                                     [&](const auto& entry) { return entry.second.state.status != *filter; }),
                      patches.end());
    }
    std::stable_sort(patches.begin(), patches.end(), [](const auto& a, const auto& b) {
        return a.second.timestamp() > b.second.timestamp();
    });

    Projectors projectors(profile->aliases());
    PatchProjector projector(projectors, *repo);

    json out = json::array();
    for (const auto& [id, patch] : patches) {
        try {
            out.push_back(projector.project(id, patch));
        } catch (const std::exception& e) {
            std::cerr << "[PatchListing] Skipping patch " << id.toString() << ": " << e.what() << std::endl;
        }
    }
    return out;
}

json NodeApi::getPatch(const std::string& rid, const std::string& patchId) {
    auto id = domain::PatchId::fromString(patchId);
    auto profile = m_context->profile();
    auto repo = profile->storage().repository(domain::RepoId::fromUrn(rid));

    auto patch = profile->patches(*repo)->get(id);
    if (!patch) {
        throw domain::NotFoundError("patch", "patch not found");
    }

    Projectors projectors(profile->aliases());
    return PatchProjector(projectors, *repo).project(id, *patch);
}

json NodeApi::listIssues(const std::string& rid) {
    auto profile = m_context->profile();
    auto repo = profile->storage().repository(domain::RepoId::fromUrn(rid));
    auto issues = profile->issues(*repo)->list();

    std::stable_sort(issues.begin(), issues.end(), [](const auto& a, const auto& b) {
        return a.second.timestamp() > b.second.timestamp();
    });

    Projectors projectors(profile->aliases());
    IssueProjector projector(projectors);

    json out = json::array();
    for (const auto& [id, issue] : issues) {
        try {
            out.push_back(projector.project(id, issue));
        } catch (const std::exception& e) {
            std::cerr << "[IssueListing] Skipping issue " << id.toString() << ": " << e.what() << std::endl;
        }
    }
    return out;
}

json NodeApi::getIssue(const std::string& rid, const std::string& issueId) {
    auto id = domain::IssueId::fromString(issueId);
    auto profile = m_context->profile();
    auto repo = profile->storage().repository(domain::RepoId::fromUrn(rid));

    auto issue = profile->issues(*repo)->get(id);
    if (!issue) {
        throw domain::NotFoundError("issue", "issue not found");
    }

    Projectors projectors(profile->aliases());
    return IssueProjector(projectors).project(id, *issue);
}

} // namespace radview::application
