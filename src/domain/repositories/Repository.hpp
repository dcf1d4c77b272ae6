/**
 * @file Repository.hpp
 * @brief Interfaces for read access to stored repositories.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "domain/Identity.hpp"
#include "domain/Project.hpp"

namespace radview::domain {

/** @brief Reference name to target object, in reference name order. */
using RefMap = std::map<std::string, Oid>;

/**
 * @class Repository
 * @brief Handle to one stored repository.
 */
class Repository {
public:
    virtual ~Repository() = default;

    virtual const RepoId& id() const = 0;

    /** @throws StorageError when the identity document cannot be read. */
    virtual IdentityDoc identityDoc() const = 0;

    /** @brief Canonical head commit. @throws StorageError */
    virtual Oid head() const = 0;

    /**
     * @brief References published by one remote (author namespace).
     * @throws StorageError when the remote is unknown or unreadable.
     */
    virtual RefMap remoteRefs(const ActorId& remote) const = 0;
};

/**
 * @class RepositoryStore
 * @brief Storage holding all locally replicated repositories.
 */
class RepositoryStore {
public:
    virtual ~RepositoryStore() = default;

    /** @throws NotFoundError for an unknown id, StorageError on read failures. */
    virtual std::shared_ptr<Repository> repository(const RepoId& rid) = 0;

    virtual std::vector<RepoSummary> repositories() = 0;
};

} // namespace radview::domain
