#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>


namespace idmap {


using ident_t = int64_t;

constexpr ident_t ID_MIN = 1; // 0 is root, never mapped
constexpr ident_t ID_MAX = 65536;
constexpr ident_t ID_SPACE_END = 65536; // exclusive end of [0, 65536)
constexpr ident_t FILLER_OFFSET = 100000;


enum class IdClass {
    USER,
    GROUP,
};

constexpr IdClass ALL_ID_CLASSES[] = {IdClass::USER, IdClass::GROUP};

// presentation order, USER first
constexpr int order(IdClass cls) {
    switch (cls) {
        case IdClass::USER:
            return 0;
        case IdClass::GROUP:
            return 1;
    }
    return 2;
}

constexpr char prefix(IdClass cls) {
    switch (cls) {
        case IdClass::USER:
            return 'u';
        case IdClass::GROUP:
            return 'g';
    }
    return '?';
}

constexpr std::string_view display_name(IdClass cls) {
    switch (cls) {
        case IdClass::USER:
            return "UID";
        case IdClass::GROUP:
            return "GID";
    }
    return "???";
}

constexpr std::string_view subid_file(IdClass cls) {
    switch (cls) {
        case IdClass::USER:
            return "/etc/subuid";
        case IdClass::GROUP:
            return "/etc/subgid";
    }
    return "";
}

inline std::ostream& operator<<(std::ostream& os, const IdClass& cls) {
    return os << display_name(cls);
}


struct PointMapping {
    IdClass cls;
    ident_t container_id;
    ident_t host_id;

    bool operator==(const PointMapping&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const PointMapping& p) {
    return os << '(' << p.cls << ' ' << p.container_id << "->" << p.host_id << ')';
}


enum class RangeKind {
    EXACT,  // one explicit PointMapping
    FILLER, // gap covered with FILLER_OFFSET
};

/**
 * Maps container ids [container_start, container_start+length) onto
 * host ids [host_start, host_start+length).
 */
struct RangeRecord {
    IdClass cls;
    ident_t container_start;
    ident_t host_start;
    ident_t length;
    RangeKind kind;

    static constexpr RangeRecord exact(const PointMapping& p) {
        return RangeRecord{p.cls, p.container_id, p.host_id, 1, RangeKind::EXACT};
    }

    static constexpr RangeRecord filler(IdClass cls, ident_t start, ident_t end) {
        return RangeRecord{cls, start, start + FILLER_OFFSET, end - start, RangeKind::FILLER};
    }

    constexpr ident_t container_end() const {
        return container_start + length;
    }

    bool operator==(const RangeRecord&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const RangeRecord& r) {
    return os << '(' << prefix(r.cls) << ' ' << r.container_start << ' ' << r.host_start << ' ' << r.length
              << (r.kind == RangeKind::EXACT ? " exact" : " filler") << ')';
}


} // namespace idmap
