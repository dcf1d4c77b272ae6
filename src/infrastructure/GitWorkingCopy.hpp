/**
 * @file GitWorkingCopy.hpp
 * @brief Reads the repository id a git working copy is bound to.
 */

#pragma once

#include <filesystem>
#include <string>

#include "domain/Identity.hpp"

namespace radview::infrastructure {

/**
 * @class GitWorkingCopy
 * @brief libgit2 lookup of the `rad` remote of a checkout.
 *
 * Plain checkouts, bare repositories and linked worktrees are opened the way
 * git itself opens them, so the remote configuration is always read from the
 * common git directory.
 */
class GitWorkingCopy {
public:
    static constexpr const char* RadRemote = "rad";

    /**
     * @brief Repository id from the `rad` remote of the working copy at `path`.
     * @throws std::runtime_error when `path` is no git repository or has no `rad` remote,
     *         std::invalid_argument when the remote URL holds a malformed id.
     */
    static domain::RepoId RepoIdAt(const std::filesystem::path& path);

    /** @brief Converts `rad://z.../z6Mk...` to `rad:z...`. */
    static domain::RepoId RepoIdFromRemoteUrl(const std::string& url);
};

} // namespace radview::infrastructure
