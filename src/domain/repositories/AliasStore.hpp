/**
 * @file AliasStore.hpp
 * @brief Interface resolving actors to human-readable display names.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/Identity.hpp"

namespace radview::domain {

class AliasStore {
public:
    virtual ~AliasStore() = default;

    /**
     * @brief Looks up the display name of an actor.
     * @return The alias, or nullopt when the actor has none.
     */
    virtual std::optional<std::string> alias(const ActorId& actor) const = 0;
};

} // namespace radview::domain
