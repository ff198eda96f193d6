#pragma once

#include "protoplan/utility.hpp"

#include <string>
#include <string_view>

namespace protoplan {

/**
 * @brief A build label of the form `//dir/sub:name(//toolchain:name)`.
 */
class Label {
public:
    /**
     * @brief Parses a label.
     *
     * `:name` labels resolve against `current_dir`. A label without `:name`
     * takes the last directory component as its name.
     *
     * @param text The label text.
     * @param current_dir Source-absolute directory of the declaring build file.
     * @return The parsed label, or `MalformedLabel`.
     */
    static Result<Label> parse(std::string_view text, std::string_view current_dir = "//");

    const std::string &dir() const {
        return dir_;
    }
    const std::string &name() const {
        return name_;
    }
    const std::string &toolchain() const {
        return toolchain_;
    }

    /** @brief Returns a copy of this label bound to another toolchain. */
    Label with_toolchain(std::string_view toolchain) const;

    /** @brief `//dir:name`, plus `(toolchain)` when one is set. */
    std::string str() const;

private:
    std::string dir_; ///< `//dir/sub`, no trailing slash except for the root.
    std::string name_;
    std::string toolchain_;
};

/**
 * @brief Strips a leading `//` and normalizes a source-root-relative path.
 *
 * Returns "." for the source root itself.
 */
std::string source_relative(std::string_view path);

/**
 * @brief Expresses `path` relative to `base`. Both are source-root-relative.
 */
std::string rebase_path(std::string_view path, std::string_view base);

/** @brief Joins two source-root-relative path fragments, dropping "." parts. */
std::string join_path(std::string_view lhs, std::string_view rhs);

/** @brief Per-source substitutions for one file of a per-file action. */
struct SourceParts {
    std::string path;      ///< `dir/sub/foo.proto`
    std::string dir;       ///< `dir/sub`, or "." at the root
    std::string file_part; ///< `foo.proto`
    std::string name_part; ///< `foo`
};

/**
 * @brief Resolves a source against the declaring directory and splits it.
 *
 * Sources starting with `//` are source-absolute; anything else is relative
 * to `directory`.
 */
SourceParts split_source(std::string_view source, std::string_view directory);

} // namespace protoplan
