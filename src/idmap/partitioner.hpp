#pragma once

#include "idmap/types.hpp"

#include <vector>


namespace idmap {


/**
 * Covers [0, ID_SPACE_END) for one class: every point of class `cls` becomes
 * an exact single-id record, every gap between them a filler record with
 * host_start = container_start + FILLER_OFFSET. Points of other classes are
 * ignored. Records come out sorted by container_start.
 *
 * Throws error::StructuralConflict if two points share a container id.
 */
std::vector<RangeRecord> partition_class(const std::vector<PointMapping>& points, IdClass cls);

// all classes concatenated in order(), USER records first
std::vector<RangeRecord> partition(const std::vector<PointMapping>& points);

/**
 * Checks that every class is present and covers [0, ID_SPACE_END) exactly
 * once, contiguous and ascending, and that fillers use FILLER_OFFSET.
 * Throws error::CoverageViolation.
 */
void verify_partition(const std::vector<RangeRecord>& records);


} // namespace idmap
