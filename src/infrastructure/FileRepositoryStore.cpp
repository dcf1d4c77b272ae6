/**
 * @file FileRepositoryStore.cpp
 * @brief Implementation of FileRepositoryStore and SnapshotRepository.
 */

#include "infrastructure/FileRepositoryStore.hpp"

#include <fstream>
#include <iostream>

#include "domain/Errors.hpp"
#include "infrastructure/SnapshotCodec.hpp"

namespace fs = std::filesystem;

namespace radview::infrastructure {

using json = nlohmann::json;

namespace {

const json& EmptyObject() {
    static const json empty = json::object();
    return empty;
}

} // namespace

SnapshotRepository::SnapshotRepository(domain::RepoId rid, json document)
    : m_rid(std::move(rid)), m_document(std::move(document)) {}

domain::IdentityDoc SnapshotRepository::identityDoc() const {
    try {
        return SnapshotCodec::DecodeIdentityDoc(m_document.at("doc"));
    } catch (const std::exception& e) {
        throw domain::StorageError("identity document of " + m_rid.toUrn() + " is unreadable: " + e.what());
    }
}

domain::Oid SnapshotRepository::head() const {
    try {
        return domain::Oid::fromString(m_document.at("head").get<std::string>());
    } catch (const std::exception& e) {
        throw domain::StorageError("head of " + m_rid.toUrn() + " is unreadable: " + e.what());
    }
}

domain::RefMap SnapshotRepository::remoteRefs(const domain::ActorId& remote) const {
    auto remotes = m_document.find("remotes");
    if (remotes == m_document.end() || !remotes->contains(remote.toString())) {
        throw domain::StorageError("remote " + remote.toString() + " not found in " + m_rid.toUrn());
    }

    domain::RefMap refs;
    try {
        const json published = remotes->at(remote.toString()).value("refs", json::object());
        for (const auto& [name, target] : published.items()) {
            refs[name] = domain::Oid::fromString(target.get<std::string>());
        }
    } catch (const std::exception& e) {
        throw domain::StorageError("refs of remote " + remote.toString() + " are unreadable: " + e.what());
    }
    return refs;
}

const json& SnapshotRepository::patchesJson() const {
    auto it = m_document.find("patches");
    return it != m_document.end() && it->is_object() ? *it : EmptyObject();
}

const json& SnapshotRepository::issuesJson() const {
    auto it = m_document.find("issues");
    return it != m_document.end() && it->is_object() ? *it : EmptyObject();
}

FileRepositoryStore::FileRepositoryStore(fs::path storageRoot)
    : m_root(std::move(storageRoot)) {}

json FileRepositoryStore::readSnapshot(const fs::path& path) const {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw domain::StorageError("cannot open " + path.string());
    }
    try {
        json j;
        f >> j;
        return j;
    } catch (const json::exception& e) {
        throw domain::StorageError("malformed snapshot " + path.string() + ": " + e.what());
    }
}

std::shared_ptr<domain::Repository> FileRepositoryStore::repository(const domain::RepoId& rid) {
    fs::path path = m_root / rid.body() / SnapshotFile;
    if (!fs::exists(path)) {
        throw domain::NotFoundError("repository", "repository " + rid.toUrn() + " not found");
    }
    return std::make_shared<SnapshotRepository>(rid, readSnapshot(path));
}

std::vector<domain::RepoSummary> FileRepositoryStore::repositories() {
    std::vector<domain::RepoSummary> summaries;
    if (!fs::exists(m_root)) {
        return summaries;
    }

    for (const auto& entry : fs::directory_iterator(m_root)) {
        if (!entry.is_directory()) continue;
        fs::path snapshot = entry.path() / SnapshotFile;
        if (!fs::exists(snapshot)) continue;

        try {
            auto rid = domain::RepoId::fromUrn("rad:" + entry.path().filename().string());
            SnapshotRepository repo(rid, readSnapshot(snapshot));
            summaries.push_back({rid, repo.identityDoc()});
        } catch (const std::exception& e) {
            std::cerr << "[FileRepositoryStore] Skipping " << entry.path() << ": " << e.what() << std::endl;
        }
    }
    return summaries;
}

} // namespace radview::infrastructure
