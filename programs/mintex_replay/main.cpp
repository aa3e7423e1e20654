#include <fc/exception/exception.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/variant_object.hpp>
#include <fc/stacktrace.hpp>
#include <fc/string.hpp>

#include <mintex/api/nft_api.hpp>
#include <mintex/chain/database.hpp>

#include "./program_options.hpp"

#include <boost/algorithm/string/trim.hpp>

using namespace mintex::chain;
using mintex::protocol::operation;
using mintex::protocol::operation_name;

int unsafe_main(int argc, char** argv);

int main(int argc, char** argv) {
    try {
        return unsafe_main(argc, argv);
    } catch (const fc::exception& e) {
        std::cout << e.to_detail_string() << "\n";
        return -1;
    }
}

void seed_balance(database& db, const std::string& entry) {
    auto pos = entry.find('=');
    FC_ASSERT(pos != std::string::npos, "Balance ${b} should look like name=amount", ("b", entry));

    auto name = boost::algorithm::trim_copy(entry.substr(0, pos));
    auto amount = fc::to_int64(boost::algorithm::trim_copy(entry.substr(pos + 1)));
    FC_ASSERT(mintex::protocol::is_valid_account_name(name), "Account name ${name} is invalid", ("name", name));
    FC_ASSERT(!mintex::protocol::is_reserved_account_name(name), "Cannot fund the escrow account ${name}", ("name", name));
    FC_ASSERT(amount >= 0, "Balance of ${name} cannot be negative", ("name", name));

    db.adjust_balance(name, amount);
    ilog("Balance of ${name} is ${b}", ("name", name)("b", db.get_balance(name)));
}

int unsafe_main(int argc, char** argv) {
    auto po = get_program_options(argc, argv);

    if (!po.proceed) {
        return po.exit_code;
    }

    fc::install_stacktrace_crash_handler();

    time_point_sec start_time = fc::time_point_sec(fc::time_point::now());
    if (po.start_time.size()) {
        start_time = fc::time_point_sec::from_iso_string(po.start_time);
    }

    database db;
    db.open(po.data_dir, po.shared_file_size, po.admin, start_time);

    db.on_event.connect([&](const operation_notification& note) {
        ilog("#${seq} ${name} ${op}",
            ("seq", note.sequence)("name", operation_name(note.op))("op", fc::json::to_string(note.op)));
    });

    for (const auto& b : po.balances) {
        seed_balance(db, b);
    }

    if (po.authorize_exchange) {
        mintex::protocol::set_authorized_operation op;
        op.admin = db.get_dynamic_global_properties().admin;
        op.caller = MINTEX_EXCHANGE_ACCOUNT;
        op.enabled = true;
        db.apply_operation(op);
    }

    auto entries = fc::json::from_file(po.operations_file).get_array();

    uint32_t applied = 0;
    uint32_t failed = 0;

    for (const auto& entry : entries) {
        if (entry.is_object()) {
            const auto& obj = entry.get_object();
            if (obj.contains("advance_time")) {
                auto seconds = obj["advance_time"].as_uint64();
                db.set_head_block_time(db.head_block_time() + uint32_t(seconds));
                ilog("Head time is ${t}", ("t", db.head_block_time()));
                continue;
            }
            elog("Unknown entry ${e}", ("e", entry));
            ++failed;
            continue;
        }

        operation op;
        fc::from_variant(entry, op);

        try {
            db.apply_operation(op);
            ++applied;
        } catch (const fc::exception& e) {
            ++failed;
            wlog("${name} failed: ${e}", ("name", operation_name(op))("e", e.to_detail_string()));
        }
    }

    std::cout << "Applied: " << applied << ", failed: " << failed << std::endl;

    db.close();

    return failed ? 1 : 0;
}
