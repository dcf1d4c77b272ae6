/**
 * @file FileAliasStore.hpp
 * @brief Alias store loaded from the profile home.
 */

#pragma once

#include <map>
#include <string>

#include "domain/repositories/AliasStore.hpp"

namespace radview::infrastructure {

class FileAliasStore : public domain::AliasStore {
public:
    explicit FileAliasStore(std::map<domain::ActorId, std::string> aliases);

    std::optional<std::string> alias(const domain::ActorId& actor) const override;

private:
    std::map<domain::ActorId, std::string> m_aliases;
};

} // namespace radview::infrastructure
