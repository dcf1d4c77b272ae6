/**
 * @file FileAliasStore.cpp
 * @brief Implementation of FileAliasStore.
 */

#include "infrastructure/FileAliasStore.hpp"

namespace radview::infrastructure {

FileAliasStore::FileAliasStore(std::map<domain::ActorId, std::string> aliases)
    : m_aliases(std::move(aliases)) {}

std::optional<std::string> FileAliasStore::alias(const domain::ActorId& actor) const {
    auto it = m_aliases.find(actor);
    if (it == m_aliases.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace radview::infrastructure
