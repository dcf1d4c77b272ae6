/**
 * @file GitWorkingCopy.cpp
 * @brief Implementation of GitWorkingCopy on libgit2.
 */

#include "infrastructure/GitWorkingCopy.hpp"

#include <memory>
#include <stdexcept>

#include <git2.h>

namespace radview::infrastructure {

namespace {

// Keeps libgit2 initialized for the lifetime of one lookup. Init is reference counted.
class Libgit2Session {
public:
    Libgit2Session() {
        if (int status = git_libgit2_init(); status < 0) {
            throw std::runtime_error("Failed to initialize libgit2: " + std::to_string(status));
        }
    }
    ~Libgit2Session() { git_libgit2_shutdown(); }

    Libgit2Session(const Libgit2Session&) = delete;
    Libgit2Session& operator=(const Libgit2Session&) = delete;
};

struct RepositoryDeleter {
    void operator()(git_repository* repo) const { git_repository_free(repo); }
};

struct RemoteDeleter {
    void operator()(git_remote* remote) const { git_remote_free(remote); }
};

std::string LastError(int status) {
    const git_error* err = git_error_last();
    if (err && err->message) {
        return err->message;
    }
    return "libgit2 error " + std::to_string(status);
}

} // namespace

domain::RepoId GitWorkingCopy::RepoIdFromRemoteUrl(const std::string& url) {
    const std::string scheme = "rad://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw std::invalid_argument("not a rad:// remote url: '" + url + "'");
    }
    std::string rest = url.substr(scheme.size());
    std::string body = rest.substr(0, rest.find('/'));
    return domain::RepoId::fromUrn("rad:" + body);
}

domain::RepoId GitWorkingCopy::RepoIdAt(const std::filesystem::path& path) {
    Libgit2Session session;

    git_repository* rawRepo = nullptr;
    if (int status = git_repository_open(&rawRepo, path.string().c_str()); status < 0) {
        throw std::runtime_error("no git repository at " + path.string() + ": " + LastError(status));
    }
    std::unique_ptr<git_repository, RepositoryDeleter> repo(rawRepo);

    git_remote* rawRemote = nullptr;
    if (int status = git_remote_lookup(&rawRemote, repo.get(), RadRemote); status < 0) {
        throw std::runtime_error("no '" + std::string(RadRemote) + "' remote in " + path.string() + ": " +
                                 LastError(status));
    }
    std::unique_ptr<git_remote, RemoteDeleter> remote(rawRemote);

    const char* url = git_remote_url(remote.get());
    if (!url) {
        throw std::runtime_error("'" + std::string(RadRemote) + "' remote has no url in " + path.string());
    }
    return RepoIdFromRemoteUrl(url);
}

} // namespace radview::infrastructure
