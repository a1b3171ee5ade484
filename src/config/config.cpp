#include "config.hpp"

#include "idmap/render.hpp"

#include <algorithm>
#include <cxxopts.hpp>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string_view>


namespace {

bool is_negative_id(std::string_view arg) {
    return arg.size() > 1 && arg[0] == '-' &&
           std::all_of(arg.begin() + 1, arg.end(), [](char c) { return '0' <= c && c <= '9'; });
}

// cxxopts takes "-1" for a short option. Moving bare negative ids behind "--"
// makes them positional mappings, so they fail range validation instead.
std::vector<const char*> negative_ids_to_positional(int argc, const char* const* argv) {
    static const std::set<std::string_view> takes_value = {
        "-u", "--user", "-g", "--group", "-c", "--container_id", "-o", "--owner",
    };

    std::vector<const char*> args;
    std::vector<const char*> negative;
    int i = 0;
    for (; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--") {
            break;
        }
        if (i != 0 && is_negative_id(arg) && !takes_value.contains(argv[i - 1])) {
            negative.push_back(argv[i]);
            continue;
        }
        args.push_back(argv[i]);
    }

    if (!negative.empty() || i < argc) {
        args.push_back("--");
    }
    args.insert(args.end(), negative.begin(), negative.end());
    for (++i; i < argc; ++i) {
        args.push_back(argv[i]);
    }
    return args;
}

} // namespace


void Config::parse_cli(int argc, const char* const* argv) {
    cxxopts::Options options("lxc-idmapper", "Id mappings for unprivileged LXCs on Proxmox");
    options.positional_help("lxc_uid[:lxc_gid][=host_uid[:host_gid]] ...");

    // clang-format off
    options.add_options()
        ("mappings", "Container uid and optional gid to map to host, the gid defaults to the uid", cxxopts::value<std::vector<std::string>>())
        ("u,user", "Container uid with optional host uid (1000 or 1000=107), no gid mapping is created", cxxopts::value<std::vector<std::string>>())
        ("g,group", "Container gid with optional host gid (1000 or 1000=107), no uid mapping is created", cxxopts::value<std::vector<std::string>>())
        ("c,container_id", "Proxmox container id used in the config path", cxxopts::value<uint64_t>())
        ("o,owner", "Account owning the /etc/subuid and /etc/subgid entries", cxxopts::value<std::string>()->default_value(idmap::DEFAULT_OWNER))
        ("verify", "Check that the generated ranges cover the id space exactly once", cxxopts::value<bool>()->default_value("false"))
        ("v,verbose", "Debug output on stderr", cxxopts::value<bool>()->default_value("false"))
        ("h,help", "Print usage")
    ;
    // clang-format on
    options.parse_positional({"mappings"});
    usage = options.help();

    auto args = negative_ids_to_positional(argc, argv);
    auto result = options.parse(static_cast<int>(args.size()), args.data());

    help = result.count("help") != 0;

    mappings.clear();
    users.clear();
    groups.clear();
    if (result.count("mappings")) {
        mappings = result["mappings"].as<std::vector<std::string>>();
    }
    if (result.count("user")) {
        users = result["user"].as<std::vector<std::string>>();
    }
    if (result.count("group")) {
        groups = result["group"].as<std::vector<std::string>>();
    }

    container_id.reset();
    if (result.count("container_id")) {
        container_id = result["container_id"].as<uint64_t>();
        if (*container_id == 0) {
            throw std::invalid_argument("container_id must be > 0");
        }
    }

    owner = result["owner"].as<std::string>();
    if (owner.empty() || owner.find(':') != std::string::npos) {
        throw std::invalid_argument("owner must be a non-empty account name without ':'");
    }

    verify = result["verify"].as<bool>();
    verbose = result["verbose"].as<bool>();
}

std::string Config::conf_path() const {
    if (!container_id) {
        return idmap::DEFAULT_CONF_PATH;
    }
    return "/etc/pve/lxc/" + std::to_string(*container_id) + ".conf";
}

void Config::print(std::ostream& os) {
    std::stringstream ss;
    ss << std::boolalpha;
    ss << "mappings=" << mappings << '\n';
    ss << "user=" << users << '\n';
    ss << "group=" << groups << '\n';
    ss << "conf_path=" << conf_path() << '\n';
    ss << "owner=" << owner << '\n';
    ss << "verify=" << verify << '\n';
    ss << "verbose=" << verbose << '\n';

    os << ss.str();
}
