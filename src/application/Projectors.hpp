/**
 * @file Projectors.hpp
 * @brief Wires the per-entity projectors against one alias store.
 */

#pragma once

#include <stdexcept>

#include "application/AuthorResolver.hpp"
#include "application/CommentProjector.hpp"
#include "application/ReactionAggregator.hpp"
#include "application/ReviewProjector.hpp"
#include "domain/repositories/AliasStore.hpp"

namespace radview::application {

/** @brief A domain snapshot violates an invariant the projection relies on. */
class ProjectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct Projectors
 * @brief Component projectors sharing one author resolver.
 *
 * Members hold references to earlier members, so the bundle is pinned in place.
 */
struct Projectors {
    explicit Projectors(const domain::AliasStore& aliases)
        : authors(aliases),
          reactions(authors),
          comments(authors, reactions),
          reviews(authors, comments) {}

    Projectors(const Projectors&) = delete;
    Projectors& operator=(const Projectors&) = delete;

    AuthorResolver authors;
    ReactionAggregator reactions;
    CommentProjector comments;
    ReviewProjector reviews;
};

} // namespace radview::application
