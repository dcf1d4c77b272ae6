/**
 * @file NodeApi.hpp
 * @brief Entry operations returning project, patch and issue documents.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "domain/repositories/NodeProfile.hpp"

namespace radview::application {

/**
 * @class NodeApi
 * @brief Boundary surface over the local profile.
 *
 * The profile is loaded through the context on every call. Listings skip
 * entities that fail to project; single-entity lookups propagate failures,
 * with domain::NotFoundError for unknown ids.
 */
class NodeApi {
public:
    explicit NodeApi(std::shared_ptr<domain::ProfileContext> context);

    /** @brief Public key of the local node. */
    std::string currentNodeId();

    /** @brief Repository id (`rad:...`) of the working copy at `path`. */
    std::string repoIdAtPath(const std::string& path);

    nlohmann::json getProject(const std::string& rid);

    /** @brief Public, seeded projects ordered by repository id. */
    nlohmann::json listProjects();

    /**
     * @brief Patches of a repository, most recently updated first.
     * @param status Optional filter: "draft", "open", "archived" or "merged".
     */
    nlohmann::json listPatches(const std::string& rid, const std::optional<std::string>& status = std::nullopt);

    nlohmann::json getPatch(const std::string& rid, const std::string& patchId);

    /** @brief Issues of a repository, most recently opened first. */
    nlohmann::json listIssues(const std::string& rid);

    nlohmann::json getIssue(const std::string& rid, const std::string& issueId);

private:
    std::shared_ptr<domain::ProfileContext> m_context;
};

} // namespace radview::application
