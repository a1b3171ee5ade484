#include "render.hpp"

#include <sstream>


namespace idmap {


std::string render_idmap_line(const RangeRecord& record) {
    std::stringstream ss;
    ss << "lxc.idmap = " << prefix(record.cls) << ' ' << record.container_start << ' ' << record.host_start << ' '
       << record.length;
    return ss.str();
}

std::string render_idmap_config(const std::vector<RangeRecord>& records, std::string_view conf_path) {
    std::stringstream ss;
    ss << "# Add to " << conf_path << ":\n";
    for (auto cls : ALL_ID_CLASSES) {
        for (auto& r : records) {
            if (r.cls == cls) {
                ss << render_idmap_line(r) << '\n';
            }
        }
    }
    return ss.str();
}

std::string render_subid_reservations(const std::vector<RangeRecord>& records, std::string_view owner) {
    std::stringstream ss;
    for (size_t i = 0; auto cls : ALL_ID_CLASSES) {
        if (i++ != 0) {
            ss << '\n';
        }
        ss << "# Add to " << subid_file(cls) << ":\n";
        for (auto& r : records) {
            if (r.cls == cls && r.kind == RangeKind::EXACT) {
                ss << owner << ':' << r.host_start << ":1\n";
            }
        }
    }
    return ss.str();
}

std::string render_report(const std::vector<RangeRecord>& records, std::string_view conf_path,
                          std::string_view owner) {
    std::stringstream ss;
    ss << '\n' << render_idmap_config(records, conf_path);
    ss << '\n' << render_subid_reservations(records, owner);
    return ss.str();
}


} // namespace idmap
