/**
 * @file AuthorResolver.cpp
 * @brief Implementation of AuthorResolver.
 */

#include "application/AuthorResolver.hpp"

namespace radview::application {

nlohmann::json AuthorView::toJson() const {
    nlohmann::json j = {{"id", id.toDid()}};
    if (alias) {
        j["alias"] = *alias;
    }
    return j;
}

AuthorResolver::AuthorResolver(const domain::AliasStore& aliases)
    : m_aliases(aliases) {}

AuthorView AuthorResolver::resolve(const domain::ActorId& actor) const {
    return AuthorView{actor, m_aliases.alias(actor)};
}

AuthorView AuthorResolver::resolve(const domain::Author& author) const {
    return resolve(author.id);
}

} // namespace radview::application
