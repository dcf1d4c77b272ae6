/**
 * @file Thread.hpp
 * @brief Discussion entities: reactions, edits and comments.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "CodeLocation.hpp"
#include "Identity.hpp"

namespace radview::domain {

/**
 * @struct Reaction
 * @brief One author applying one emoji, optionally anchored to code.
 */
struct Reaction {
    std::string emoji;                    ///< UTF-8 encoded emoji.
    ActorId author;
    std::optional<CodeLocation> location; ///< Only set for revision reactions.
};

/**
 * @struct Embed
 * @brief Named attachment referenced from a comment body.
 */
struct Embed {
    std::string name;
    std::string content; ///< Content URI, e.g. `git:<oid>`.
};

/**
 * @struct Edit
 * @brief One version of a comment body.
 */
struct Edit {
    ActorId author;
    std::string body;
    Timestamp timestamp;
    std::vector<Embed> embeds;
};

/**
 * @struct Comment
 * @brief Threaded comment. `location` is only present on code review comments.
 *
 * The first element of `edits` is the creation of the comment; `body` and
 * `embeds` reflect the latest edit.
 */
struct Comment {
    CommentId id;
    ActorId author;
    std::string body;
    std::vector<Edit> edits;
    std::vector<Embed> embeds;
    std::vector<Reaction> reactions;
    Timestamp timestamp;
    std::optional<CommentId> replyTo;
    bool resolved = false;
    std::optional<CodeLocation> location;
};

} // namespace radview::domain
