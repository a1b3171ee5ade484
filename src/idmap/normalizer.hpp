#pragma once

#include "idmap/types.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>


namespace idmap {


/**
 * Token grammar:
 *
 *   combined := spec ['=' spec]      container side '=' host side
 *   option   := id ['=' id]          container id '=' host id
 *   spec     := id [':' id]          user id ':' group id
 *   id       := ['-'] digit+
 *
 * Omitted right-hand parts copy the left-hand part. Anything else throws
 * error::MalformedToken. Ranges are not checked here, see validate().
 */
std::array<PointMapping, 2> parse_combined(std::string_view token);

PointMapping parse_option(std::string_view token, IdClass cls);

// throws error::OutOfRange for the first id outside [ID_MIN, ID_MAX]
void validate(const std::vector<PointMapping>& points);

/**
 * Parses all tokens, then validates. Output order is the order of
 * appearance: combined tokens (user point, group point), then user options,
 * then group options.
 */
std::vector<PointMapping> normalize(const std::vector<std::string>& mappings,
                                    const std::vector<std::string>& users,
                                    const std::vector<std::string>& groups);


} // namespace idmap
