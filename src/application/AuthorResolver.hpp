/**
 * @file AuthorResolver.hpp
 * @brief Maps actor identities to author views, attaching aliases when known.
 */

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "domain/Identity.hpp"
#include "domain/repositories/AliasStore.hpp"

namespace radview::application {

/**
 * @struct AuthorView
 * @brief An author as presented to callers. Without an alias it is the bare author.
 */
struct AuthorView {
    domain::ActorId id;
    std::optional<std::string> alias;

    /** @brief `{"id": did}` or `{"id": did, "alias": name}`; never a null alias. */
    nlohmann::json toJson() const;
};

/**
 * @class AuthorResolver
 * @brief Resolves authors against an alias store. A missing alias is not an error.
 */
class AuthorResolver {
public:
    explicit AuthorResolver(const domain::AliasStore& aliases);

    /** @brief Resolves a raw actor id (assignees, merges, edits, reactions). */
    AuthorView resolve(const domain::ActorId& actor) const;

    /** @brief Resolves a domain author. */
    AuthorView resolve(const domain::Author& author) const;

    nlohmann::json resolveJson(const domain::ActorId& actor) const { return resolve(actor).toJson(); }
    nlohmann::json resolveJson(const domain::Author& author) const { return resolve(author).toJson(); }

private:
    const domain::AliasStore& m_aliases;
};

} // namespace radview::application
