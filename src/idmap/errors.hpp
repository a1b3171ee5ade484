#pragma once

#include "idmap/types.hpp"

#include <stdexcept>
#include <string>


namespace idmap::error {


struct IdmapError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};


enum class Side {
    CONTAINER,
    HOST,
};

constexpr std::string_view side_name(Side side) {
    return side == Side::CONTAINER ? "container" : "host";
}


struct OutOfRange : public IdmapError {
    ident_t id;
    IdClass cls;
    Side side;

    OutOfRange(ident_t id, IdClass cls, Side side)
        : IdmapError(std::string{side_name(side)} + ' ' + std::string{display_name(cls)} + ' ' +
                     std::to_string(id) + " is not in range " + std::to_string(ID_MIN) + '-' +
                     std::to_string(ID_MAX)),
          id(id), cls(cls), side(side) {}
};

struct StructuralConflict : public IdmapError {
    IdClass cls;
    ident_t container_id;
    ident_t first_host_id;
    ident_t second_host_id;

    StructuralConflict(IdClass cls, ident_t container_id, ident_t first_host_id, ident_t second_host_id)
        : IdmapError("container " + std::string{display_name(cls)} + ' ' + std::to_string(container_id) +
                     " is mapped twice (to " + std::to_string(first_host_id) + " and " +
                     std::to_string(second_host_id) + ')'),
          cls(cls), container_id(container_id), first_host_id(first_host_id), second_host_id(second_host_id) {}
};

struct NoInput : public IdmapError {
    NoInput() : IdmapError("no id mappings given") {}
};

struct MalformedToken : public IdmapError {
    std::string token;

    MalformedToken(const std::string& token, const std::string& reason)
        : IdmapError("malformed mapping \"" + token + "\": " + reason), token(token) {}
};

struct CoverageViolation : public IdmapError {
    IdClass cls;
    ident_t container_id;

    CoverageViolation(IdClass cls, ident_t container_id, const std::string& reason)
        : IdmapError(std::string{display_name(cls)} + " ranges broken at " + std::to_string(container_id) + ": " +
                     reason),
          cls(cls), container_id(container_id) {}
};


} // namespace idmap::error
