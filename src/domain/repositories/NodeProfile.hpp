/**
 * @file NodeProfile.hpp
 * @brief The active local profile and the capability used to obtain it.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>

#include "domain/Identity.hpp"
#include "domain/repositories/AliasStore.hpp"
#include "domain/repositories/CobCache.hpp"
#include "domain/repositories/Repository.hpp"

namespace radview::domain {

/**
 * @class NodeProfile
 * @brief Read-only view of the local node: storage, aliases, caches and policies.
 */
class NodeProfile {
public:
    virtual ~NodeProfile() = default;

    /** @brief Public key of the local node. */
    virtual ActorId nodeId() const = 0;

    virtual RepositoryStore& storage() = 0;
    virtual const AliasStore& aliases() const = 0;

    virtual std::unique_ptr<PatchCache> patches(const Repository& repo) = 0;
    virtual std::unique_ptr<IssueCache> issues(const Repository& repo) = 0;

    /** @brief Seeding policy lookup. May throw on policy store failures. */
    virtual bool isSeeding(const RepoId& rid) const = 0;

    /** @brief Number of known seeds of a repository. May throw on routing store failures. */
    virtual std::size_t seedCount(const RepoId& rid) const = 0;
};

/**
 * @class ProfileContext
 * @brief Capability handed to every entry operation instead of global profile state.
 */
class ProfileContext {
public:
    virtual ~ProfileContext() = default;

    /** @brief Profile home directory. @throws ConfigError if it cannot be determined. */
    virtual std::filesystem::path home() const = 0;

    /**
     * @brief Loads the profile.
     * @throws HintedError when no profile exists, ConfigError on malformed configuration.
     */
    virtual std::shared_ptr<NodeProfile> profile() = 0;

    /** @brief Repository id of the working copy at `path`. */
    virtual RepoId repoIdAt(const std::filesystem::path& path) const = 0;
};

} // namespace radview::domain
