/**
 * @file SnapshotCodec.hpp
 * @brief Decodes materialized collaborative object snapshots from JSON.
 */

#pragma once

#include <nlohmann/json.hpp>

#include "domain/CodeLocation.hpp"
#include "domain/Issue.hpp"
#include "domain/Patch.hpp"
#include "domain/Project.hpp"
#include "domain/Thread.hpp"

namespace radview::infrastructure {

/**
 * @class SnapshotCodec
 * @brief JSON to domain decoding for snapshot files.
 *
 * Every decoder throws (nlohmann::json::exception or std::invalid_argument)
 * on missing fields or malformed identifiers.
 */
class SnapshotCodec {
public:
    static domain::CodeLocation DecodeLocation(const nlohmann::json& j);
    static domain::Comment DecodeComment(const nlohmann::json& j);
    static domain::Issue DecodeIssue(const nlohmann::json& j);
    static domain::Patch DecodePatch(const nlohmann::json& j);
    static domain::IdentityDoc DecodeIdentityDoc(const nlohmann::json& j);
};

} // namespace radview::infrastructure
