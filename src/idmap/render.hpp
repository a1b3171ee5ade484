#pragma once

#include "idmap/types.hpp"

#include <string>
#include <string_view>
#include <vector>


namespace idmap {


constexpr auto DEFAULT_CONF_PATH = "/etc/pve/lxc/<container_id>.conf";
constexpr auto DEFAULT_OWNER = "root";


// "lxc.idmap = u 0 100000 1000"
std::string render_idmap_line(const RangeRecord& record);

std::string render_idmap_config(const std::vector<RangeRecord>& records, std::string_view conf_path);

// only EXACT records are reserved, one "owner:host_id:1" line each
std::string render_subid_reservations(const std::vector<RangeRecord>& records, std::string_view owner);

// config block and both reservation blocks, each preceded by a blank line
std::string render_report(const std::vector<RangeRecord>& records, std::string_view conf_path,
                          std::string_view owner);


} // namespace idmap
