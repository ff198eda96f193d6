#pragma once

#include "protoplan/builder.hpp"
#include "protoplan/utility.hpp"

#include <filesystem>
#include <string_view>

namespace protoplan {

/**
 * @brief Parses a target manifest file into the builder.
 *
 * `DEF|key|value` lines set build-context fields; `TARGET|//dir:name` opens a
 * target whose `field|value` lines follow. Targets are resolved once the
 * whole manifest has been read, so definitions apply regardless of position.
 *
 * @param builder The builder to populate.
 * @param path The manifest (typically "protoplan.build").
 * On any error the builder is left exactly as it was before the call: no
 * definitions and no targets from the manifest are kept.
 *
 * @return Success, `Io` if the file cannot be read, `ParseError` for malformed
 *         lines, or the first target resolution error.
 */
Result<void> parse(PlanBuilder &builder, const std::filesystem::path &path);

/** @brief Same as `parse`, on manifest text already in memory. */
Result<void> parse_manifest(PlanBuilder &builder, std::string_view content);

} // namespace protoplan
