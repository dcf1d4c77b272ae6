/**
 * @file Identity.hpp
 * @brief Value objects identifying actors, git objects and repositories.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace radview::domain {

/** @brief Point in time of a collaborative object change, at second precision. */
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

inline Timestamp FromUnixSeconds(std::int64_t secs) {
    return Timestamp(std::chrono::seconds(secs));
}

inline std::int64_t ToUnixSeconds(const Timestamp& ts) {
    return ts.time_since_epoch().count();
}

namespace detail {

inline bool IsBase58(const std::string& text) {
    static const std::string alphabet =
        "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
    for (char c : text) {
        if (alphabet.find(c) == std::string::npos) return false;
    }
    return true;
}

} // namespace detail

/**
 * @class ActorId
 * @brief Public key of a participant, in multibase (`z` + base58) form.
 */
class ActorId {
public:
    ActorId() = default;

    /**
     * @brief Parses a multibase public key.
     * @throws std::invalid_argument when the text is not a `z`-prefixed base58 key.
     */
    static ActorId fromString(const std::string& text) {
        std::string key = text;
        const std::string didPrefix = "did:key:";
        if (key.compare(0, didPrefix.size(), didPrefix) == 0) {
            key = key.substr(didPrefix.size());
        }
        if (key.size() < 2 || key[0] != 'z' || !detail::IsBase58(key.substr(1))) {
            throw std::invalid_argument("invalid actor id: '" + text + "'");
        }
        ActorId id;
        id.m_key = std::move(key);
        return id;
    }

    const std::string& toString() const { return m_key; }
    std::string toDid() const { return "did:key:" + m_key; }
    bool empty() const { return m_key.empty(); }

    bool operator==(const ActorId& other) const { return m_key == other.m_key; }
    bool operator!=(const ActorId& other) const { return m_key != other.m_key; }
    bool operator<(const ActorId& other) const { return m_key < other.m_key; }

private:
    std::string m_key;
};

/**
 * @struct Author
 * @brief Author of a collaborative object, as stored in the domain model.
 */
struct Author {
    ActorId id;

    Author() = default;
    explicit Author(ActorId actor) : id(std::move(actor)) {}
};

/**
 * @class Oid
 * @brief Hex-encoded git object id (SHA-1).
 */
class Oid {
public:
    static constexpr std::size_t HexLength = 40;

    Oid() = default;

    /** @throws std::invalid_argument on anything but 40 hex digits. */
    static Oid fromString(const std::string& text) {
        if (text.size() != HexLength) {
            throw std::invalid_argument("invalid object id: '" + text + "'");
        }
        Oid oid;
        oid.m_hex.reserve(HexLength);
        for (char c : text) {
            if (c >= '0' && c <= '9') oid.m_hex.push_back(c);
            else if (c >= 'a' && c <= 'f') oid.m_hex.push_back(c);
            else if (c >= 'A' && c <= 'F') oid.m_hex.push_back(static_cast<char>(c - 'A' + 'a'));
            else throw std::invalid_argument("invalid object id: '" + text + "'");
        }
        return oid;
    }

    const std::string& toString() const { return m_hex; }
    bool empty() const { return m_hex.empty(); }

    bool operator==(const Oid& other) const { return m_hex == other.m_hex; }
    bool operator!=(const Oid& other) const { return m_hex != other.m_hex; }
    bool operator<(const Oid& other) const { return m_hex < other.m_hex; }

private:
    std::string m_hex;
};

using PatchId = Oid;
using IssueId = Oid;
using RevisionId = Oid;
using ReviewId = Oid;
using CommentId = Oid;

/**
 * @class RepoId
 * @brief Repository identifier in URN form (`rad:z...`).
 */
class RepoId {
public:
    RepoId() = default;

    /** @throws std::invalid_argument when the URN is malformed. */
    static RepoId fromUrn(const std::string& urn) {
        const std::string prefix = "rad:";
        if (urn.compare(0, prefix.size(), prefix) != 0) {
            throw std::invalid_argument("invalid repository id '" + urn + "': expected 'rad:' prefix");
        }
        std::string body = urn.substr(prefix.size());
        if (body.size() < 2 || body[0] != 'z' || !detail::IsBase58(body.substr(1))) {
            throw std::invalid_argument("invalid repository id '" + urn + "'");
        }
        RepoId rid;
        rid.m_body = std::move(body);
        return rid;
    }

    std::string toUrn() const { return "rad:" + m_body; }
    /** @brief URN without the `rad:` prefix, as used for storage paths. */
    const std::string& body() const { return m_body; }

    bool operator==(const RepoId& other) const { return m_body == other.m_body; }
    bool operator!=(const RepoId& other) const { return m_body != other.m_body; }
    bool operator<(const RepoId& other) const { return m_body < other.m_body; }

private:
    std::string m_body;
};

} // namespace radview::domain
