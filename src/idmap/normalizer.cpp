#include "normalizer.hpp"

#include "idmap/errors.hpp"
#include "utils/log.hpp"

#include <charconv>
#include <optional>
#include <utility>


namespace idmap {


namespace {

struct Split {
    std::string_view left;
    std::optional<std::string_view> right;
};

Split split_once(std::string_view token, std::string_view part, char delim) {
    auto pos = part.find(delim);
    if (pos == std::string_view::npos) {
        return Split{part, std::nullopt};
    }
    auto right = part.substr(pos + 1);
    if (right.find(delim) != std::string_view::npos) {
        throw error::MalformedToken(std::string{token}, std::string{"more than one '"} + delim + '\'');
    }
    return Split{part.substr(0, pos), right};
}

ident_t parse_id(std::string_view token, std::string_view part) {
    if (part.empty()) {
        throw error::MalformedToken(std::string{token}, "empty id");
    }
    if (part.front() == '+') {
        throw error::MalformedToken(std::string{token}, "\"" + std::string{part} + "\" is not a number");
    }

    ident_t value = 0;
    auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
    if (ec == std::errc::result_out_of_range) {
        throw error::MalformedToken(std::string{token}, "\"" + std::string{part} + "\" is too large");
    }
    if (ec != std::errc{} || ptr != part.data() + part.size()) {
        throw error::MalformedToken(std::string{token}, "\"" + std::string{part} + "\" is not a number");
    }
    return value;
}

// spec := id [':' id], returns (user, group)
std::pair<ident_t, ident_t> parse_spec(std::string_view token, std::string_view spec) {
    auto [user, group] = split_once(token, spec, ':');
    auto user_id = parse_id(token, user);
    auto group_id = group ? parse_id(token, *group) : user_id;
    return {user_id, group_id};
}

void check_range(const PointMapping& p, ident_t id, error::Side side) {
    if (!(ID_MIN <= id && id <= ID_MAX)) {
        throw error::OutOfRange(id, p.cls, side);
    }
}

} // namespace


std::array<PointMapping, 2> parse_combined(std::string_view token) {
    if (token.empty()) {
        throw error::MalformedToken(std::string{token}, "empty mapping");
    }

    auto [container, host] = split_once(token, token, '=');
    auto [lxc_uid, lxc_gid] = parse_spec(token, container);
    auto [host_uid, host_gid] = host ? parse_spec(token, *host) : std::make_pair(lxc_uid, lxc_gid);

    return {
        PointMapping{IdClass::USER, lxc_uid, host_uid},
        PointMapping{IdClass::GROUP, lxc_gid, host_gid},
    };
}

PointMapping parse_option(std::string_view token, IdClass cls) {
    if (token.empty()) {
        throw error::MalformedToken(std::string{token}, "empty mapping");
    }
    if (token.find(':') != std::string_view::npos) {
        throw error::MalformedToken(std::string{token}, "single class option takes no ':'");
    }

    auto [container, host] = split_once(token, token, '=');
    auto container_id = parse_id(token, container);
    auto host_id = host ? parse_id(token, *host) : container_id;
    return PointMapping{cls, container_id, host_id};
}

void validate(const std::vector<PointMapping>& points) {
    for (auto& p : points) {
        check_range(p, p.container_id, error::Side::CONTAINER);
        check_range(p, p.host_id, error::Side::HOST);
    }
}

std::vector<PointMapping> normalize(const std::vector<std::string>& mappings,
                                    const std::vector<std::string>& users,
                                    const std::vector<std::string>& groups) {
    if (mappings.empty() && users.empty() && groups.empty()) {
        throw error::NoInput();
    }

    std::vector<PointMapping> points;
    points.reserve(2 * mappings.size() + users.size() + groups.size());

    for (auto& token : mappings) {
        for (auto& p : parse_combined(token)) {
            points.emplace_back(p);
        }
    }
    for (auto& token : users) {
        points.emplace_back(parse_option(token, IdClass::USER));
    }
    for (auto& token : groups) {
        points.emplace_back(parse_option(token, IdClass::GROUP));
    }

    validate(points);

    LOG_DEBUG("%zu combined, %zu user, %zu group tokens -> %zu points", mappings.size(), users.size(), groups.size(),
              points.size());
    return points;
}


} // namespace idmap
