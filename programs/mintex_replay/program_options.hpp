#pragma once

#include <mintex/protocol/config.hpp>

#include <boost/filesystem/path.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/program_options.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace bfs = boost::filesystem;
namespace bpo = boost::program_options;
using bpo::options_description;
using bpo::variables_map;

struct program_options {
    bfs::path data_dir;
    uint64_t shared_file_size = MINTEX_DEFAULT_SHARED_FILE_SIZE;
    std::string admin;
    std::vector<std::string> balances;
    bfs::path operations_file;
    std::string start_time;
    bool authorize_exchange = false;
    int exit_code = 0;
    bool proceed = false;
};

inline program_options get_program_options(int argc, char** argv) {
    program_options po;

    options_description cli("mintex_replay applies a list of operations to a registry and exchange state.\n"
        "\n"
        "The operations file is a JSON array. Each entry is an operation like\n"
        "[\"nft_mint\", {\"minter\": \"alice\", ...}] or {\"advance_time\": <seconds>}.\n"
        "\n"
        "Example of usage:\n"
        "mintex_replay -d /tmp/state -o ops.json -b alice=1000 -b bob=500 --authorize-exchange\n"
        "\n"
        "Command line options");

    cli.add_options()
        ("data-dir,d", bpo::value<bfs::path>(&po.data_dir), "Directory of the state file.")
        ("shared-file-size", bpo::value<uint64_t>(&po.shared_file_size)->default_value(MINTEX_DEFAULT_SHARED_FILE_SIZE),
            "Size of the state file in bytes.")
        ("admin,a", bpo::value<std::string>(&po.admin)->default_value(MINTEX_INIT_ADMIN_NAME),
            "Administrator of a new state.")
        ("balance,b", bpo::value<std::vector<std::string>>(&po.balances)->composing(),
            "Initial balance as name=amount. Can be repeated.")
        ("operations,o", bpo::value<bfs::path>(&po.operations_file), "Path to JSON file with operations.")
        ("start-time,s", bpo::value<std::string>(&po.start_time),
            "Head time of a new state, ISO format (2024-01-01T00:00:00).")
        ("authorize-exchange", bpo::bool_switch(&po.authorize_exchange),
            "Grant the exchange the right to transfer ownership before applying operations.")
        ("help,h", "Print this help message and exit.")
        ;

    variables_map vmap;
    bpo::store(bpo::parse_command_line(argc, argv, cli), vmap);
    bpo::notify(vmap);
    if (vmap.count("help") > 0 || vmap.count("data-dir") == 0 || vmap.count("operations") == 0) {
        cli.print(std::cerr);
        return po;
    }

    if (!bfs::exists(po.operations_file)) {
        std::cerr << po.operations_file.string() << " not exists." << std::endl;
        po.exit_code = -1;
        return po;
    }

    if (!bfs::is_regular_file(po.operations_file)) {
        std::cerr << po.operations_file.string() << " is not a file, it is a directory or something another." << std::endl;
        po.exit_code = -2;
        return po;
    }

    po.proceed = true;
    return po;
}
