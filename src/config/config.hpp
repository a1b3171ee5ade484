#pragma once

#include "utils/util.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>


class Config : public HeapSingleton<Config> {
    friend class HeapSingleton<Config>;


protected:
    Config() = default;

public:
    // throws cxxopts::exceptions::exception or std::invalid_argument on bad usage
    void parse_cli(int argc, const char* const* argv);
    void print(std::ostream& os);

    // "/etc/pve/lxc/<container_id>.conf" with the id filled in if known
    std::string conf_path() const;


    std::vector<std::string> mappings;
    std::vector<std::string> users;
    std::vector<std::string> groups;

    std::optional<uint64_t> container_id;
    std::string owner;
    bool verify;
    bool verbose;
    bool help;

    std::string usage;
};
