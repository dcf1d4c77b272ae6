/**
 * @file Fakes.hpp
 * @brief In-memory collaborators and fixture builders shared by the tests.
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "domain/Errors.hpp"
#include "domain/Issue.hpp"
#include "domain/Patch.hpp"
#include "domain/Project.hpp"
#include "domain/repositories/AliasStore.hpp"
#include "domain/repositories/CobCache.hpp"
#include "domain/repositories/NodeProfile.hpp"
#include "domain/repositories/Repository.hpp"

namespace radview::test {

inline const std::string AliceKey = "z6MkrLMMsiPWUcNPHcRajuMi9mDfYckSoJyPwwnknocNYPm7";
inline const std::string BobKey = "z6MkvGdFqjXW5RjNd2iBcf7K6nSzwLzMQ3XhyGPXQxoSmJDq";
inline const std::string CarolKey = "z6MkhaXgBZDvotDkL5257faiztiGiC2QtKLGpbnnEGta2doK";

inline const std::string RidA = "rad:z3gqcJUoA1n9HaHKufZs5FCSGazv5";
inline const std::string RidB = "rad:z4V1sjrXqjvFdnCUbxPFqd5p4DtH5";

inline domain::ActorId Actor(const std::string& key) { return domain::ActorId::fromString(key); }
inline domain::Author AuthorOf(const std::string& key) { return domain::Author(Actor(key)); }

/** @brief Object id made of one repeated hex digit, e.g. Hex('a'). */
inline domain::Oid Hex(char digit) { return domain::Oid::fromString(std::string(40, digit)); }

inline domain::Timestamp At(std::int64_t secs) { return domain::FromUnixSeconds(secs); }

inline domain::Reaction React(const std::string& emoji, const std::string& key,
                              std::optional<domain::CodeLocation> location = std::nullopt) {
    return domain::Reaction{emoji, Actor(key), std::move(location)};
}

inline domain::CodeLocation Loc(const std::string& path, std::size_t start, std::size_t end) {
    domain::CodeLocation loc;
    loc.commit = Hex('c');
    loc.path = path;
    loc.newRange = domain::CodeRange::lines(start, end);
    return loc;
}

inline domain::Comment MakeComment(char id, const std::string& key, const std::string& body, std::int64_t secs) {
    domain::Comment c;
    c.id = Hex(id);
    c.author = Actor(key);
    c.body = body;
    c.timestamp = At(secs);
    c.edits.push_back(domain::Edit{c.author, body, c.timestamp, {}});
    return c;
}

inline domain::Revision MakeRevision(char id, const std::string& key, char head, std::int64_t secs) {
    domain::Revision r;
    r.id = Hex(id);
    r.author = AuthorOf(key);
    r.description = "revision " + std::string(1, id);
    r.base = Hex('0');
    r.head = Hex(head);
    r.timestamp = At(secs);
    r.edits.push_back(domain::Edit{r.author.id, r.description, r.timestamp, {}});
    return r;
}

inline domain::Patch MakePatch(const std::string& title, const std::string& key, char revId, char head, std::int64_t secs) {
    domain::Patch p;
    p.author = AuthorOf(key);
    p.title = title;
    p.revisions.push_back(MakeRevision(revId, key, head, secs));
    return p;
}

inline domain::Issue MakeIssue(const std::string& title, const std::string& key, char commentId, std::int64_t secs) {
    domain::Issue i;
    i.author = AuthorOf(key);
    i.title = title;
    i.comments.push_back(MakeComment(commentId, key, "description of " + title, secs));
    return i;
}

inline domain::IdentityDoc MakeDoc(const std::string& name, const std::vector<std::string>& delegates, bool isPublic = true) {
    domain::IdentityDoc doc;
    doc.project = domain::Project{name, name + " project", "main"};
    for (const auto& key : delegates) {
        doc.delegates.push_back(Actor(key));
    }
    doc.threshold = 1;
    doc.visibility = isPublic ? domain::Visibility::publicRepo() : domain::Visibility::privateRepo({});
    return doc;
}

class FakeAliasStore : public domain::AliasStore {
public:
    std::map<domain::ActorId, std::string> names;
    std::set<domain::ActorId> failing; ///< Lookups for these actors throw.

    std::optional<std::string> alias(const domain::ActorId& actor) const override {
        if (failing.count(actor)) {
            throw domain::StorageError("alias store unavailable for " + actor.toString());
        }
        auto it = names.find(actor);
        if (it == names.end()) return std::nullopt;
        return it->second;
    }
};

class FakeRepository : public domain::Repository {
public:
    domain::RepoId rid;
    domain::IdentityDoc doc;
    std::optional<domain::Oid> headOid;
    std::map<domain::ActorId, domain::RefMap> remotes;
    bool refsUnavailable = false;

    std::vector<std::pair<domain::PatchId, domain::Patch>> patches;
    std::vector<std::pair<domain::IssueId, domain::Issue>> issues;
    bool cacheUnavailable = false;

    const domain::RepoId& id() const override { return rid; }

    domain::IdentityDoc identityDoc() const override { return doc; }

    domain::Oid head() const override {
        if (!headOid) {
            throw domain::StorageError("no canonical head for " + rid.toUrn());
        }
        return *headOid;
    }

    domain::RefMap remoteRefs(const domain::ActorId& remote) const override {
        if (refsUnavailable) {
            throw domain::StorageError("reference store unavailable");
        }
        auto it = remotes.find(remote);
        if (it == remotes.end()) {
            throw domain::StorageError("remote " + remote.toString() + " not found");
        }
        return it->second;
    }
};

class FakeRepositoryStore : public domain::RepositoryStore {
public:
    std::map<domain::RepoId, std::shared_ptr<FakeRepository>> repos;

    std::shared_ptr<FakeRepository> add(const std::string& urn, domain::IdentityDoc doc) {
        auto repo = std::make_shared<FakeRepository>();
        repo->rid = domain::RepoId::fromUrn(urn);
        repo->doc = std::move(doc);
        repo->headOid = Hex('f');
        repos[repo->rid] = repo;
        return repo;
    }

    std::shared_ptr<domain::Repository> repository(const domain::RepoId& rid) override {
        auto it = repos.find(rid);
        if (it == repos.end()) {
            throw domain::NotFoundError("repository", "repository " + rid.toUrn() + " not found");
        }
        return it->second;
    }

    std::vector<domain::RepoSummary> repositories() override {
        std::vector<domain::RepoSummary> out;
        // Reverse order, so listings have to sort.
        for (auto it = repos.rbegin(); it != repos.rend(); ++it) {
            out.push_back({it->first, it->second->doc});
        }
        return out;
    }
};

template <typename T>
class FakeCache {
public:
    FakeCache(std::vector<std::pair<domain::Oid, T>> entries, bool unavailable)
        : m_entries(std::move(entries)), m_unavailable(unavailable) {}

protected:
    std::vector<std::pair<domain::Oid, T>> entries() const {
        if (m_unavailable) throw domain::StorageError("cache unavailable");
        return m_entries;
    }

    std::optional<T> find(const domain::Oid& id) const {
        for (const auto& [key, value] : entries()) {
            if (key == id) return value;
        }
        return std::nullopt;
    }

private:
    std::vector<std::pair<domain::Oid, T>> m_entries;
    bool m_unavailable;
};

class FakePatchCache : public domain::PatchCache, FakeCache<domain::Patch> {
public:
    using FakeCache::FakeCache;

    std::vector<std::pair<domain::PatchId, domain::Patch>> list() override { return entries(); }
    std::optional<domain::Patch> get(const domain::PatchId& id) override { return find(id); }

    domain::PatchCounts counts() override {
        domain::PatchCounts c;
        for (const auto& [id, patch] : entries()) {
            switch (patch.state.status) {
            case domain::PatchState::Status::Draft: ++c.draft; break;
            case domain::PatchState::Status::Open: ++c.open; break;
            case domain::PatchState::Status::Archived: ++c.archived; break;
            case domain::PatchState::Status::Merged: ++c.merged; break;
            }
        }
        return c;
    }
};

class FakeIssueCache : public domain::IssueCache, FakeCache<domain::Issue> {
public:
    using FakeCache::FakeCache;

    std::vector<std::pair<domain::IssueId, domain::Issue>> list() override { return entries(); }
    std::optional<domain::Issue> get(const domain::IssueId& id) override { return find(id); }

    domain::IssueCounts counts() override {
        domain::IssueCounts c;
        for (const auto& [id, issue] : entries()) {
            if (issue.state.status == domain::IssueState::Status::Open) ++c.open;
            else ++c.closed;
        }
        return c;
    }
};

class FakeNodeProfile : public domain::NodeProfile {
public:
    domain::ActorId nid = Actor(AliceKey);
    FakeRepositoryStore store;
    FakeAliasStore aliasStore;
    std::set<domain::RepoId> seeding;
    std::map<domain::RepoId, std::size_t> seeds;
    std::set<domain::RepoId> policyFailures;
    bool routingUnavailable = false;

    domain::ActorId nodeId() const override { return nid; }
    domain::RepositoryStore& storage() override { return store; }
    const domain::AliasStore& aliases() const override { return aliasStore; }

    std::unique_ptr<domain::PatchCache> patches(const domain::Repository& repo) override {
        const auto& fake = dynamic_cast<const FakeRepository&>(repo);
        return std::make_unique<FakePatchCache>(fake.patches, fake.cacheUnavailable);
    }

    std::unique_ptr<domain::IssueCache> issues(const domain::Repository& repo) override {
        const auto& fake = dynamic_cast<const FakeRepository&>(repo);
        return std::make_unique<FakeIssueCache>(fake.issues, fake.cacheUnavailable);
    }

    bool isSeeding(const domain::RepoId& rid) const override {
        if (policyFailures.count(rid)) {
            throw domain::ConfigError("policy store unavailable");
        }
        return seeding.count(rid) > 0;
    }

    std::size_t seedCount(const domain::RepoId& rid) const override {
        if (routingUnavailable) {
            throw domain::ConfigError("routing store unavailable");
        }
        auto it = seeds.find(rid);
        return it == seeds.end() ? 0 : it->second;
    }
};

class FakeProfileContext : public domain::ProfileContext {
public:
    std::shared_ptr<FakeNodeProfile> node; ///< Null means no profile exists.
    std::map<std::string, domain::RepoId> workingCopies;

    std::filesystem::path home() const override { return "/nonexistent/.radicle"; }

    std::shared_ptr<domain::NodeProfile> profile() override {
        if (!node) {
            throw domain::HintedError("Radicle profile not found in '" + home().string() + "'.",
                                      "To setup your radicle profile, run `rad auth`.");
        }
        return node;
    }

    domain::RepoId repoIdAt(const std::filesystem::path& path) const override {
        auto it = workingCopies.find(path.string());
        if (it == workingCopies.end()) {
            throw std::runtime_error("no git repository at " + path.string());
        }
        return it->second;
    }
};

} // namespace radview::test
