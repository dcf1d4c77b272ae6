/**
 * @file CodeLocation.hpp
 * @brief Value objects anchoring comments and reactions into a diff.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <tuple>

#include "Identity.hpp"

namespace radview::domain {

/**
 * @struct CodeRange
 * @brief Range of lines, or of characters within one line.
 */
struct CodeRange {
    enum class Kind {
        Lines,
        Chars
    };

    Kind kind = Kind::Lines;
    std::size_t line = 0;   ///< Only meaningful for Kind::Chars.
    std::size_t start = 0;
    std::size_t end = 0;

    static CodeRange lines(std::size_t start, std::size_t end) {
        return CodeRange{Kind::Lines, 0, start, end};
    }

    static CodeRange chars(std::size_t line, std::size_t start, std::size_t end) {
        return CodeRange{Kind::Chars, line, start, end};
    }

    bool operator==(const CodeRange& o) const {
        return std::tie(kind, line, start, end) == std::tie(o.kind, o.line, o.start, o.end);
    }
    bool operator!=(const CodeRange& o) const { return !(*this == o); }
    bool operator<(const CodeRange& o) const {
        return std::tie(kind, line, start, end) < std::tie(o.kind, o.line, o.start, o.end);
    }
};

/**
 * @struct CodeLocation
 * @brief A file position in a commit, on the old and/or new side of a diff.
 */
struct CodeLocation {
    Oid commit;
    std::string path;
    std::optional<CodeRange> oldRange;
    std::optional<CodeRange> newRange;

    bool operator==(const CodeLocation& o) const {
        return std::tie(commit, path, oldRange, newRange) ==
               std::tie(o.commit, o.path, o.oldRange, o.newRange);
    }
    bool operator!=(const CodeLocation& o) const { return !(*this == o); }
    bool operator<(const CodeLocation& o) const {
        return std::tie(commit, path, oldRange, newRange) <
               std::tie(o.commit, o.path, o.oldRange, o.newRange);
    }
};

} // namespace radview::domain
