#include "partitioner.hpp"

#include "idmap/errors.hpp"
#include "utils/log.hpp"

#include <algorithm>
#include <array>
#include <iterator>


namespace idmap {


std::vector<RangeRecord> partition_class(const std::vector<PointMapping>& points, IdClass cls) {
    std::vector<PointMapping> sorted;
    std::copy_if(points.begin(), points.end(), std::back_inserter(sorted),
                 [cls](const PointMapping& p) { return p.cls == cls; });
    std::stable_sort(sorted.begin(), sorted.end(), [](const PointMapping& a, const PointMapping& b) {
        return a.container_id < b.container_id;
    });

    std::vector<RangeRecord> records;
    records.reserve(2 * sorted.size() + 1);

    ident_t next_container_id = 0;
    for (size_t i = 0; i < sorted.size(); ++i) {
        auto& p = sorted[i];
        if (i != 0 && p.container_id < next_container_id) {
            throw error::StructuralConflict(cls, p.container_id, sorted[i - 1].host_id, p.host_id);
        }
        if (p.container_id > next_container_id) {
            records.emplace_back(RangeRecord::filler(cls, next_container_id, p.container_id));
        }
        records.emplace_back(RangeRecord::exact(p));
        next_container_id = p.container_id + 1;
    }
    if (next_container_id < ID_SPACE_END) {
        records.emplace_back(RangeRecord::filler(cls, next_container_id, ID_SPACE_END));
    }

    LOG_DEBUG("%s: %zu points -> %zu ranges", display_name(cls).data(), sorted.size(), records.size());
    return records;
}

std::vector<RangeRecord> partition(const std::vector<PointMapping>& points) {
    auto classes = std::to_array(ALL_ID_CLASSES);
    std::sort(classes.begin(), classes.end(), [](IdClass a, IdClass b) { return order(a) < order(b); });

    std::vector<RangeRecord> records;
    for (auto cls : classes) {
        auto part = partition_class(points, cls);
        records.insert(records.end(), part.begin(), part.end());
    }
    return records;
}

void verify_partition(const std::vector<RangeRecord>& records) {
    for (auto cls : ALL_ID_CLASSES) {
        ident_t expected_start = 0;
        const RangeRecord* last = nullptr;
        for (auto& r : records) {
            if (r.cls != cls) {
                continue;
            }
            if (r.container_start != expected_start) {
                throw error::CoverageViolation(cls, r.container_start,
                                               r.container_start < expected_start ? "overlap" : "gap");
            }
            if (r.length < 1) {
                throw error::CoverageViolation(cls, r.container_start, "empty range");
            }
            if (r.kind == RangeKind::FILLER && r.host_start != r.container_start + FILLER_OFFSET) {
                throw error::CoverageViolation(cls, r.container_start, "filler without default offset");
            }
            expected_start = r.container_end();
            last = &r;
        }
        if (!last) {
            throw error::CoverageViolation(cls, 0, "class has no ranges");
        }
        if (expected_start < ID_SPACE_END) {
            throw error::CoverageViolation(cls, expected_start, "space not covered up to the end");
        }
        // only the exact record of container id ID_MAX may sit past the end
        bool exact_at_max = last->kind == RangeKind::EXACT && last->container_start == ID_MAX && last->length == 1;
        if (expected_start != ID_SPACE_END && !exact_at_max) {
            throw error::CoverageViolation(cls, last->container_start, "ranges run past the end of the space");
        }
    }
}


} // namespace idmap
