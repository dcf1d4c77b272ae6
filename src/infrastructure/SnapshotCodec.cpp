/**
 * @file SnapshotCodec.cpp
 * @brief Implementation of SnapshotCodec.
 */

#include "infrastructure/SnapshotCodec.hpp"

#include <stdexcept>
#include <string>

namespace radview::infrastructure {

using json = nlohmann::json;
using namespace radview::domain;

namespace {

ActorId ActorFrom(const json& j) {
    return ActorId::fromString(j.get<std::string>());
}

Oid OidFrom(const json& j) {
    return Oid::fromString(j.get<std::string>());
}

Timestamp TimeFrom(const json& j) {
    return FromUnixSeconds(j.get<std::int64_t>());
}

std::vector<ActorId> ActorsFrom(const json& j) {
    std::vector<ActorId> actors;
    for (const auto& a : j) {
        actors.push_back(ActorFrom(a));
    }
    return actors;
}

std::optional<CodeRange> RangeFrom(const json& j) {
    if (j.is_null()) return std::nullopt;
    const auto& span = j.at("range");
    std::string type = j.at("type").get<std::string>();
    if (type == "lines") {
        return CodeRange::lines(span.at("start").get<std::size_t>(), span.at("end").get<std::size_t>());
    }
    if (type == "chars") {
        return CodeRange::chars(j.at("line").get<std::size_t>(), span.at("start").get<std::size_t>(),
                                span.at("end").get<std::size_t>());
    }
    throw std::invalid_argument("unknown code range type: '" + type + "'");
}

std::vector<Embed> EmbedsFrom(const json& j) {
    std::vector<Embed> embeds;
    for (const auto& e : j) {
        embeds.push_back({e.at("name").get<std::string>(), e.at("content").get<std::string>()});
    }
    return embeds;
}

Edit EditFrom(const json& j) {
    Edit edit;
    edit.author = ActorFrom(j.at("author"));
    edit.body = j.at("body").get<std::string>();
    edit.timestamp = TimeFrom(j.at("timestamp"));
    edit.embeds = EmbedsFrom(j.value("embeds", json::array()));
    return edit;
}

std::vector<Edit> EditsFrom(const json& j) {
    std::vector<Edit> edits;
    for (const auto& e : j) {
        edits.push_back(EditFrom(e));
    }
    return edits;
}

std::vector<Reaction> ReactionsFrom(const json& j) {
    std::vector<Reaction> reactions;
    for (const auto& r : j) {
        Reaction reaction;
        reaction.emoji = r.at("emoji").get<std::string>();
        reaction.author = ActorFrom(r.at("author"));
        if (r.contains("location") && !r["location"].is_null()) {
            reaction.location = SnapshotCodec::DecodeLocation(r["location"]);
        }
        reactions.push_back(std::move(reaction));
    }
    return reactions;
}

std::vector<Comment> CommentsFrom(const json& j) {
    std::vector<Comment> comments;
    for (const auto& c : j) {
        comments.push_back(SnapshotCodec::DecodeComment(c));
    }
    return comments;
}

IssueState IssueStateFrom(const json& j) {
    std::string status = j.at("status").get<std::string>();
    if (status == "open") return IssueState::open();
    if (status == "closed") {
        std::string reason = j.value("reason", "other");
        return IssueState::closed(reason == "solved" ? IssueState::CloseReason::Solved
                                                     : IssueState::CloseReason::Other);
    }
    throw std::invalid_argument("unknown issue status: '" + status + "'");
}

PatchState PatchStateFrom(const json& j) {
    std::string status = j.at("status").get<std::string>();
    if (status == "draft") return PatchState::draft();
    if (status == "archived") return PatchState::archived();
    if (status == "merged") {
        return PatchState::merged(OidFrom(j.at("revision")), OidFrom(j.at("commit")));
    }
    if (status == "open") {
        PatchState state = PatchState::open();
        for (const auto& c : j.value("conflicts", json::array())) {
            state.conflicts.emplace_back(OidFrom(c.at(0)), OidFrom(c.at(1)));
        }
        return state;
    }
    throw std::invalid_argument("unknown patch status: '" + status + "'");
}

std::optional<Verdict> VerdictFrom(const json& j) {
    if (j.is_null()) return std::nullopt;
    std::string verdict = j.get<std::string>();
    if (verdict == "accept") return Verdict::Accept;
    if (verdict == "reject") return Verdict::Reject;
    throw std::invalid_argument("unknown verdict: '" + verdict + "'");
}

Revision RevisionFrom(const json& j) {
    Revision rev;
    rev.id = OidFrom(j.at("id"));
    rev.author = Author(ActorFrom(j.at("author")));
    rev.description = j.value("description", "");
    rev.edits = EditsFrom(j.value("edits", json::array()));
    rev.reactions = ReactionsFrom(j.value("reactions", json::array()));
    rev.base = OidFrom(j.at("base"));
    rev.head = OidFrom(j.at("oid"));
    rev.discussion = CommentsFrom(j.value("discussion", json::array()));
    rev.timestamp = TimeFrom(j.at("timestamp"));
    return rev;
}

Review ReviewFrom(const json& j) {
    Review review;
    review.id = OidFrom(j.at("id"));
    review.revision = OidFrom(j.at("revision"));
    review.author = Author(ActorFrom(j.at("author")));
    review.verdict = VerdictFrom(j.value("verdict", json()));
    if (j.contains("summary") && j["summary"].is_string()) {
        review.summary = j["summary"].get<std::string>();
    }
    review.comments = CommentsFrom(j.value("comments", json::array()));
    review.timestamp = TimeFrom(j.at("timestamp"));
    return review;
}

Merge MergeFrom(const json& j) {
    return Merge{
        ActorFrom(j.at("author")),
        OidFrom(j.at("commit")),
        TimeFrom(j.at("timestamp")),
        OidFrom(j.at("revision"))
    };
}

} // namespace

CodeLocation SnapshotCodec::DecodeLocation(const json& j) {
    CodeLocation location;
    location.commit = OidFrom(j.at("commit"));
    location.path = j.at("path").get<std::string>();
    location.oldRange = RangeFrom(j.value("old", json()));
    location.newRange = RangeFrom(j.value("new", json()));
    return location;
}

Comment SnapshotCodec::DecodeComment(const json& j) {
    Comment comment;
    comment.id = OidFrom(j.at("id"));
    comment.author = ActorFrom(j.at("author"));
    comment.body = j.at("body").get<std::string>();
    comment.edits = EditsFrom(j.value("edits", json::array()));
    comment.embeds = EmbedsFrom(j.value("embeds", json::array()));
    comment.reactions = ReactionsFrom(j.value("reactions", json::array()));
    comment.timestamp = TimeFrom(j.at("timestamp"));
    if (j.contains("replyTo") && !j["replyTo"].is_null()) {
        comment.replyTo = OidFrom(j["replyTo"]);
    }
    comment.resolved = j.value("resolved", false);
    if (j.contains("location") && !j["location"].is_null()) {
        comment.location = DecodeLocation(j["location"]);
    }
    return comment;
}

Issue SnapshotCodec::DecodeIssue(const json& j) {
    Issue issue;
    issue.author = Author(ActorFrom(j.at("author")));
    issue.title = j.at("title").get<std::string>();
    issue.state = IssueStateFrom(j.at("state"));
    issue.assignees = ActorsFrom(j.value("assignees", json::array()));
    issue.labels = j.value("labels", std::vector<std::string>{});
    issue.comments = CommentsFrom(j.value("comments", json::array()));
    return issue;
}

Patch SnapshotCodec::DecodePatch(const json& j) {
    Patch patch;
    patch.author = Author(ActorFrom(j.at("author")));
    patch.title = j.at("title").get<std::string>();
    patch.state = PatchStateFrom(j.at("state"));
    std::string target = j.value("target", "delegates");
    if (target != "delegates") {
        throw std::invalid_argument("unknown merge target: '" + target + "'");
    }
    patch.labels = j.value("labels", std::vector<std::string>{});
    patch.assignees = ActorsFrom(j.value("assignees", json::array()));
    for (const auto& m : j.value("merges", json::array())) {
        patch.merges.push_back(MergeFrom(m));
    }
    for (const auto& r : j.value("revisions", json::array())) {
        patch.revisions.push_back(RevisionFrom(r));
    }
    for (const auto& r : j.value("reviews", json::array())) {
        patch.reviews.push_back(ReviewFrom(r));
    }
    return patch;
}

IdentityDoc SnapshotCodec::DecodeIdentityDoc(const json& j) {
    IdentityDoc doc;
    const auto& payload = j.at("payload");
    doc.project.name = payload.at("name").get<std::string>();
    doc.project.description = payload.value("description", "");
    doc.project.defaultBranch = payload.value("defaultBranch", "main");
    doc.delegates = ActorsFrom(j.at("delegates"));
    doc.threshold = j.value("threshold", static_cast<std::size_t>(1));

    const auto visibility = j.value("visibility", json{{"type", "public"}});
    std::string type = visibility.value("type", "public");
    if (type == "public") {
        doc.visibility = Visibility::publicRepo();
    } else if (type == "private") {
        doc.visibility = Visibility::privateRepo(ActorsFrom(visibility.value("allow", json::array())));
    } else {
        throw std::invalid_argument("unknown visibility: '" + type + "'");
    }
    return doc;
}

} // namespace radview::infrastructure
