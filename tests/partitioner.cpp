#include "check.hpp"
#include "idmap/errors.hpp"
#include "idmap/normalizer.hpp"
#include "idmap/partitioner.hpp"
#include "utils/util.hpp"

#include <algorithm>
#include <vector>

// g++ -std=c++20 -g -I../src -I. partitioner.cpp ../src/idmap/partitioner.cpp ../src/idmap/normalizer.cpp -o partitioner && ./partitioner

using namespace idmap;

using Records = std::vector<RangeRecord>;

static RangeRecord fill(IdClass cls, ident_t start, ident_t host, ident_t length) {
    return RangeRecord{cls, start, host, length, RangeKind::FILLER};
}

static RangeRecord exact(IdClass cls, ident_t start, ident_t host) {
    return RangeRecord{cls, start, host, 1, RangeKind::EXACT};
}

static Records of_class(const Records& records, IdClass cls) {
    Records out;
    std::copy_if(records.begin(), records.end(), std::back_inserter(out),
                 [cls](const RangeRecord& r) { return r.cls == cls; });
    return out;
}

// every id of [0, ID_SPACE_END) covered by exactly one record
static void expect_exact_cover(const Records& records, IdClass cls) {
    std::vector<int> hits(ID_SPACE_END, 0);
    for (auto& r : of_class(records, cls)) {
        EXPECT(r.length >= 1);
        for (auto c = r.container_start; c < r.container_end() && c < ID_SPACE_END; ++c) {
            hits[c]++;
        }
    }
    EXPECT(std::all_of(hits.begin(), hits.end(), [](int h) { return h == 1; }));
}

static void single_id_shorthand() {
    auto records = partition({{IdClass::USER, 1000, 1000}, {IdClass::GROUP, 1000, 1000}});
    EXPECT_EQ(records, (Records{
                           fill(IdClass::USER, 0, 100000, 1000),
                           exact(IdClass::USER, 1000, 1000),
                           fill(IdClass::USER, 1001, 101001, 64535),
                           fill(IdClass::GROUP, 0, 100000, 1000),
                           exact(IdClass::GROUP, 1000, 1000),
                           fill(IdClass::GROUP, 1001, 101001, 64535),
                       }));
}

static void group_only() {
    auto records = partition({{IdClass::GROUP, 500, 600}});
    EXPECT_EQ(records, (Records{
                           fill(IdClass::USER, 0, 100000, 65536),
                           fill(IdClass::GROUP, 0, 100000, 500),
                           exact(IdClass::GROUP, 500, 600),
                           fill(IdClass::GROUP, 501, 100501, 65035),
                       }));
}

static void sorts_by_container_id() {
    auto records = partition({{IdClass::USER, 5000, 6000}, {IdClass::USER, 1000, 3000}});
    EXPECT_EQ(of_class(records, IdClass::USER), (Records{
                                                    fill(IdClass::USER, 0, 100000, 1000),
                                                    exact(IdClass::USER, 1000, 3000),
                                                    fill(IdClass::USER, 1001, 101001, 3999),
                                                    exact(IdClass::USER, 5000, 6000),
                                                    fill(IdClass::USER, 5001, 105001, 60535),
                                                }));
    EXPECT_EQ(of_class(records, IdClass::GROUP), (Records{fill(IdClass::GROUP, 0, 100000, 65536)}));
}

static void user_records_come_first() {
    auto records = partition({{IdClass::GROUP, 10, 10}, {IdClass::USER, 20, 20}});
    auto first_group = std::find_if(records.begin(), records.end(),
                                    [](const RangeRecord& r) { return r.cls == IdClass::GROUP; });
    EXPECT(std::all_of(records.begin(), first_group, [](const RangeRecord& r) { return r.cls == IdClass::USER; }));
    EXPECT(std::all_of(first_group, records.end(), [](const RangeRecord& r) { return r.cls == IdClass::GROUP; }));
}

static void edges() {
    // no gap before container id 0
    EXPECT_EQ(partition_class({{IdClass::USER, 0, 5}}, IdClass::USER),
              (Records{exact(IdClass::USER, 0, 5), fill(IdClass::USER, 1, 100001, 65535)}));

    // adjacent points, no filler between them
    EXPECT_EQ(partition_class({{IdClass::USER, 2, 7}, {IdClass::USER, 1, 9}}, IdClass::USER),
              (Records{
                  fill(IdClass::USER, 0, 100000, 1),
                  exact(IdClass::USER, 1, 9),
                  exact(IdClass::USER, 2, 7),
                  fill(IdClass::USER, 3, 100003, 65533),
              }));

    // last id of the space, no tail filler
    EXPECT_EQ(partition_class({{IdClass::GROUP, 65535, 1}}, IdClass::GROUP),
              (Records{fill(IdClass::GROUP, 0, 100000, 65535), exact(IdClass::GROUP, 65535, 1)}));

    // ID_MAX itself sits right past the end of the space
    EXPECT_EQ(partition_class({{IdClass::GROUP, 65536, 1}}, IdClass::GROUP),
              (Records{fill(IdClass::GROUP, 0, 100000, 65536), exact(IdClass::GROUP, 65536, 1)}));

    // a length one gap is still a filler
    auto gap = partition_class({{IdClass::USER, 1000, 1000}, {IdClass::USER, 1002, 1002}}, IdClass::USER);
    EXPECT_EQ(gap.at(2), fill(IdClass::USER, 1001, 101001, 1));
}

static void full_span_has_no_fillers() {
    std::vector<PointMapping> points;
    for (ident_t c = ID_SPACE_END - 1; c >= 0; --c) {
        points.push_back({IdClass::USER, c, c + 1});
    }
    auto records = partition_class(points, IdClass::USER);
    EXPECT_EQ(records.size(), static_cast<size_t>(ID_SPACE_END));
    EXPECT(std::all_of(records.begin(), records.end(),
                       [](const RangeRecord& r) { return r.kind == RangeKind::EXACT && r.length == 1; }));
    expect_exact_cover(records, IdClass::USER);
}

static void laws() {
    std::vector<std::vector<PointMapping>> inputs = {
        normalize({"1000"}, {}, {}),
        normalize({"1:2=3:4", "65536", "33000:12=7"}, {"500=501", "65535"}, {"17"}),
        normalize({}, {"5000=6000", "1000=3000", "1001"}, {}),
        normalize({}, {}, {"7000=8000", "2000=4000", "3333=4444", "111"}),
    };
    for (auto& points : inputs) {
        auto records = partition(points);

        verify_partition(records);
        for (auto cls : ALL_ID_CLASSES) {
            expect_exact_cover(records, cls);
        }

        // exactly one exact record per point
        for (auto& p : points) {
            EXPECT_EQ(std::count(records.begin(), records.end(), RangeRecord::exact(p)), 1);
        }
        auto exact_count = std::count_if(records.begin(), records.end(),
                                         [](const RangeRecord& r) { return r.kind == RangeKind::EXACT; });
        EXPECT_EQ(static_cast<size_t>(exact_count), points.size());

        for (auto& r : records) {
            if (r.kind == RangeKind::FILLER) {
                EXPECT_EQ(r.host_start, r.container_start + FILLER_OFFSET);
            }
        }

        // pure, same input same output
        EXPECT_EQ(partition(points), records);
    }
}

static void duplicate_container_id() {
    EXPECT_THROW(partition({{IdClass::USER, 1000, 1}, {IdClass::USER, 1000, 2}}), error::StructuralConflict, {
        EXPECT_EQ(e.cls, IdClass::USER);
        EXPECT_EQ(e.container_id, 1000);
        EXPECT_EQ(e.first_host_id, 1);
        EXPECT_EQ(e.second_host_id, 2);
    });
    EXPECT_THROW(partition(normalize({"1000", "2000:1000"}, {}, {})), error::StructuralConflict,
                 EXPECT_EQ(e.cls, IdClass::GROUP));

    // same container id in different classes is fine
    verify_partition(partition({{IdClass::USER, 1000, 1}, {IdClass::GROUP, 1000, 2}}));
}

static void verifier_rejects_broken_ranges() {
    auto good = partition({{IdClass::USER, 1000, 1000}});

    auto gap = good;
    gap.erase(gap.begin() + 1);
    EXPECT_THROW(verify_partition(gap), error::CoverageViolation, EXPECT_EQ(e.container_id, 1001));

    auto overlap = good;
    overlap[0].length += 1;
    EXPECT_THROW(verify_partition(overlap), error::CoverageViolation, EXPECT_EQ(e.cls, IdClass::USER));

    auto short_tail = good;
    short_tail[2].length -= 1;
    EXPECT_THROW(verify_partition(short_tail), error::CoverageViolation, (void) e);

    auto bad_offset = good;
    bad_offset[0].host_start += 1;
    EXPECT_THROW(verify_partition(bad_offset), error::CoverageViolation, (void) e);

    auto missing_class = of_class(good, IdClass::USER);
    EXPECT_THROW(verify_partition(missing_class), error::CoverageViolation, EXPECT_EQ(e.cls, IdClass::GROUP));

    // nothing but the exact record of ID_MAX may end past the space
    Records filler_past_end = {RangeRecord::filler(IdClass::USER, 0, ID_SPACE_END + 1),
                               RangeRecord::filler(IdClass::GROUP, 0, ID_SPACE_END)};
    EXPECT_THROW(verify_partition(filler_past_end), error::CoverageViolation, {
        EXPECT_EQ(e.cls, IdClass::USER);
        EXPECT_EQ(e.container_id, 0);
    });

    Records filler_at_max = {RangeRecord::filler(IdClass::USER, 0, ID_SPACE_END),
                             RangeRecord::filler(IdClass::USER, ID_MAX, ID_MAX + 1),
                             RangeRecord::filler(IdClass::GROUP, 0, ID_SPACE_END)};
    EXPECT_THROW(verify_partition(filler_at_max), error::CoverageViolation, EXPECT_EQ(e.container_id, ID_MAX));

    Records wide_exact = {RangeRecord::filler(IdClass::USER, 0, ID_MAX),
                          RangeRecord{IdClass::USER, ID_MAX, 1, 2, RangeKind::EXACT},
                          RangeRecord::filler(IdClass::GROUP, 0, ID_SPACE_END)};
    EXPECT_THROW(verify_partition(wide_exact), error::CoverageViolation, EXPECT_EQ(e.cls, IdClass::USER));

    verify_partition(partition({{IdClass::USER, ID_MAX, 1}, {IdClass::GROUP, ID_MAX, 2}}));
}


int main(void) {
    single_id_shorthand();
    group_only();
    sorts_by_container_id();
    user_records_come_first();
    edges();
    full_span_has_no_fillers();
    laws();
    duplicate_container_id();
    verifier_rejects_broken_ranges();
    return report("partitioner");
}
