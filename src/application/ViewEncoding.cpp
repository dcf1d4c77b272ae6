/**
 * @file ViewEncoding.cpp
 * @brief Implementation of the value object encoders.
 */

#include "application/ViewEncoding.hpp"

#include <stdexcept>

namespace radview::application {

using json = nlohmann::json;

json ToJson(const domain::CodeRange& range) {
    json j;
    json span = {{"start", range.start}, {"end", range.end}};
    if (range.kind == domain::CodeRange::Kind::Lines) {
        j = {{"type", "lines"}, {"range", span}};
    } else {
        j = {{"type", "chars"}, {"line", range.line}, {"range", span}};
    }
    return j;
}

json ToJson(const domain::CodeLocation& location) {
    return {
        {"commit", location.commit.toString()},
        {"path", location.path},
        {"old", location.oldRange ? ToJson(*location.oldRange) : json(nullptr)},
        {"new", location.newRange ? ToJson(*location.newRange) : json(nullptr)}
    };
}

json ToJson(const std::optional<domain::CodeLocation>& location) {
    return location ? ToJson(*location) : json(nullptr);
}

json ToJson(const std::vector<domain::Embed>& embeds) {
    json out = json::array();
    for (const auto& embed : embeds) {
        out.push_back({{"name", embed.name}, {"content", embed.content}});
    }
    return out;
}

json ToJson(const domain::IssueState& state) {
    if (state.status == domain::IssueState::Status::Open) {
        return {{"status", "open"}};
    }
    const char* reason = state.reason == domain::IssueState::CloseReason::Solved ? "solved" : "other";
    return {{"status", "closed"}, {"reason", reason}};
}

json ToJson(const domain::PatchState& state) {
    json j = {{"status", PatchStatusToString(state.status)}};
    switch (state.status) {
    case domain::PatchState::Status::Open:
        if (!state.conflicts.empty()) {
            json conflicts = json::array();
            for (const auto& [revision, oid] : state.conflicts) {
                conflicts.push_back({revision.toString(), oid.toString()});
            }
            j["conflicts"] = conflicts;
        }
        break;
    case domain::PatchState::Status::Merged:
        j["revision"] = state.revision.toString();
        j["commit"] = state.commit.toString();
        break;
    default:
        break;
    }
    return j;
}

json ToJson(const domain::Visibility& visibility) {
    if (visibility.isPublic) {
        return {{"type", "public"}};
    }
    json j = {{"type", "private"}};
    if (!visibility.allow.empty()) {
        json allow = json::array();
        for (const auto& actor : visibility.allow) {
            allow.push_back(actor.toDid());
        }
        j["allow"] = allow;
    }
    return j;
}

json ToJson(const domain::PatchCounts& counts) {
    return {
        {"open", counts.open},
        {"draft", counts.draft},
        {"archived", counts.archived},
        {"merged", counts.merged}
    };
}

json ToJson(const domain::IssueCounts& counts) {
    return {{"open", counts.open}, {"closed", counts.closed}};
}

std::string MergeTargetToString(domain::MergeTarget) {
    return "delegates";
}

std::string VerdictToString(domain::Verdict verdict) {
    return verdict == domain::Verdict::Accept ? "accept" : "reject";
}

std::string PatchStatusToString(domain::PatchState::Status status) {
    switch (status) {
    case domain::PatchState::Status::Draft: return "draft";
    case domain::PatchState::Status::Open: return "open";
    case domain::PatchState::Status::Archived: return "archived";
    case domain::PatchState::Status::Merged: return "merged";
    }
    return "open";
}

domain::PatchState::Status PatchStatusFromString(const std::string& status) {
    if (status == "draft") return domain::PatchState::Status::Draft;
    if (status == "open") return domain::PatchState::Status::Open;
    if (status == "archived") return domain::PatchState::Status::Archived;
    if (status == "merged") return domain::PatchState::Status::Merged;
    throw std::invalid_argument("unknown patch status: '" + status + "'");
}

} // namespace radview::application
