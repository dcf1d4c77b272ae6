/**
 * @file ViewEncoding.hpp
 * @brief JSON encoding of domain value objects embedded in views.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/CodeLocation.hpp"
#include "domain/Issue.hpp"
#include "domain/Patch.hpp"
#include "domain/Project.hpp"
#include "domain/Thread.hpp"

namespace radview::application {

nlohmann::json ToJson(const domain::CodeRange& range);
nlohmann::json ToJson(const domain::CodeLocation& location);
nlohmann::json ToJson(const std::optional<domain::CodeLocation>& location);
nlohmann::json ToJson(const std::vector<domain::Embed>& embeds);
nlohmann::json ToJson(const domain::IssueState& state);
nlohmann::json ToJson(const domain::PatchState& state);
nlohmann::json ToJson(const domain::Visibility& visibility);
nlohmann::json ToJson(const domain::PatchCounts& counts);
nlohmann::json ToJson(const domain::IssueCounts& counts);

std::string MergeTargetToString(domain::MergeTarget target);
std::string VerdictToString(domain::Verdict verdict);
std::string PatchStatusToString(domain::PatchState::Status status);

/** @throws std::invalid_argument for an unknown status name. */
domain::PatchState::Status PatchStatusFromString(const std::string& status);

} // namespace radview::application
