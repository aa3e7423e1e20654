#include <mintex/chain/database.hpp>
#include <mintex/chain/nft_evaluators.hpp>

#include <fc/log/logger.hpp>

namespace mintex { namespace chain {

using mintex::protocol::is_virtual_operation;
using mintex::protocol::operation_validate;

database::database()
        : _evaluator_registry(*this),
          _entropy(std::make_shared<sha256_entropy_source>()) {
}

database::~database() {
    on_event.disconnect_all_slots();
    on_payment.disconnect_all_slots();
}

void database::open(const boost::filesystem::path& data_dir, uint64_t shared_file_size,
    const account_name_type& admin, time_point_sec start_time) {
    try {
        chainbase::database::open(data_dir, chainbase::database::read_write, shared_file_size);

        initialize_indexes();
        initialize_evaluators();

        if (!find<dynamic_global_property_object>()) {
            init_genesis(admin, start_time);
        }

        ilog("Opened state at ${dir}, admin is ${admin}",
            ("dir", data_dir.string())("admin", get_dynamic_global_properties().admin));
    } FC_CAPTURE_LOG_AND_RETHROW((data_dir.string())(shared_file_size))
}

void database::close() {
    try {
        chainbase::database::close();
    } FC_CAPTURE_AND_RETHROW()
}

void database::wipe(const boost::filesystem::path& data_dir) {
    close();
    chainbase::database::wipe(data_dir);
}

void database::initialize_indexes() {
    add_index<dynamic_global_property_index>();
    add_index<account_balance_index>();
    add_index<transfer_grant_index>();
    add_index<nft_collection_index>();
    add_index<nft_index>();
    add_index<nft_listing_index>();
    add_index<nft_auction_index>();
}

void database::initialize_evaluators() {
    _evaluator_registry.register_evaluator<collection_create_evaluator>();
    _evaluator_registry.register_evaluator<nft_mint_evaluator>();
    _evaluator_registry.register_evaluator<nft_transfer_evaluator>();
    _evaluator_registry.register_evaluator<set_authorized_evaluator>();
    _evaluator_registry.register_evaluator<nft_list_evaluator>();
    _evaluator_registry.register_evaluator<nft_cancel_listing_evaluator>();
    _evaluator_registry.register_evaluator<nft_buy_evaluator>();
    _evaluator_registry.register_evaluator<nft_auction_create_evaluator>();
    _evaluator_registry.register_evaluator<nft_bid_evaluator>();
    _evaluator_registry.register_evaluator<nft_auction_end_evaluator>();
    _evaluator_registry.register_evaluator<nft_auction_finalize_evaluator>();
}

void database::init_genesis(const account_name_type& admin, time_point_sec start_time) {
    MINTEX_CHECK_VALUE(mintex::protocol::is_valid_account_name(admin),
        "Administrator name ${admin} is invalid", ("admin", admin));
    MINTEX_CHECK_VALUE(!mintex::protocol::is_reserved_account_name(admin),
        "Administrator cannot be the escrow account ${admin}", ("admin", admin));

    create<dynamic_global_property_object>([&](auto& gpo) {
        gpo.time = start_time;
        gpo.admin = admin;
    });

    create<account_balance_object>([&](auto& abo) {
        abo.account = MINTEX_EXCHANGE_ACCOUNT;
        abo.balance = 0;
    });
}

void database::apply_operation(const operation& op) {
    try {
        MINTEX_CHECK_VALUE(!is_virtual_operation(op), "Virtual operations cannot be applied");
        operation_validate(op);

        auto& eval = _evaluator_registry.get_evaluator(op);

        const auto events_mark = _pending_events.size();
        ++_apply_depth;
        try {
            auto session = start_undo_session(true);
            eval.apply(op);
            session.squash();
        } catch (...) {
            --_apply_depth;
            _pending_events.erase(_pending_events.begin() + events_mark, _pending_events.end());
            throw;
        }
        --_apply_depth;

        if (_apply_depth == 0) {
            flush_events();
        }
    } FC_CAPTURE_AND_RETHROW((op))
}

void database::push_event(const operation& op) {
    FC_ASSERT(_apply_depth > 0, "Events can be raised only while applying an operation");
    _pending_events.push_back(op);
}

void database::flush_events() {
    std::vector<operation> events;
    events.swap(_pending_events);

    for (const auto& e : events) {
        operation_notification note(e);
        note.sequence = ++_event_sequence;
        note.timestamp = head_block_time();
        // the operation is already committed, a subscriber cannot fail it
        try {
            on_event(note);
        } catch (const fc::exception& ex) {
            elog("Caught exception in event handler: ${e}", ("e", ex.to_detail_string()));
        } catch (const std::exception& ex) {
            elog("Caught exception in event handler: ${e}", ("e", ex.what()));
        } catch (...) {
            elog("Caught unknown exception in event handler");
        }
    }
}

const dynamic_global_property_object& database::get_dynamic_global_properties() const {
    try {
        return get<dynamic_global_property_object>();
    } FC_CAPTURE_AND_RETHROW()
}

time_point_sec database::head_block_time() const {
    return get_dynamic_global_properties().time;
}

void database::set_head_block_time(time_point_sec time) {
    const auto& gpo = get_dynamic_global_properties();
    FC_ASSERT(time >= gpo.time, "Clock cannot go backwards: ${new} < ${old}", ("new", time)("old", gpo.time));
    modify(gpo, [&](auto& gpo) {
        gpo.time = time;
    });
}

void database::set_entropy_source(std::shared_ptr<entropy_source> source) {
    FC_ASSERT(source, "Entropy source cannot be null");
    _entropy = std::move(source);
}

const entropy_source& database::get_entropy_source() const {
    return *_entropy;
}

const account_balance_object* database::find_balance(const account_name_type& account) const {
    return find<account_balance_object, by_account>(account);
}

share_type database::get_balance(const account_name_type& account) const {
    const auto* abo = find_balance(account);
    return abo ? abo->balance : share_type(0);
}

void database::adjust_balance(const account_name_type& account, share_type delta) {
    const auto* abo = find_balance(account);
    if (!abo) {
        MINTEX_ASSERT(delta >= 0, mintex::insufficient_funds,
            "Account ${a} has no funds, cannot withdraw ${d}", ("a", account)("d", -delta));
        create<account_balance_object>([&](auto& abo) {
            abo.account = account;
            abo.balance = delta;
        });
        return;
    }

    MINTEX_ASSERT(abo->balance + delta >= 0, mintex::insufficient_funds,
        "Account ${a} has ${b}, cannot withdraw ${d}", ("a", account)("b", abo->balance)("d", -delta));
    modify(*abo, [&](auto& abo) {
        abo.balance += delta;
    });
}

void database::collect_payment(const account_name_type& from, share_type amount) {
    MINTEX_CHECK_VALUE(amount >= 0, "Payment cannot be negative");
    if (amount == 0) {
        return;
    }

    MINTEX_ASSERT(get_balance(from) >= amount, mintex::insufficient_funds,
        "Account ${a} cannot pay ${amount}", ("a", from)("amount", amount));

    adjust_balance(from, -amount);
    adjust_balance(MINTEX_EXCHANGE_ACCOUNT, amount);
}

void database::pay(const account_name_type& recipient, share_type amount) {
    MINTEX_CHECK_VALUE(amount >= 0, "Payment cannot be negative");
    if (amount == 0) {
        return;
    }

    MINTEX_ASSERT(get_balance(MINTEX_EXCHANGE_ACCOUNT) >= amount, mintex::insufficient_funds,
        "Escrow cannot pay ${amount} to ${r}", ("amount", amount)("r", recipient));

    adjust_balance(MINTEX_EXCHANGE_ACCOUNT, -amount);
    adjust_balance(recipient, amount);

    try {
        on_payment(payment_notification(recipient, amount));
    } catch (const mintex::payment_refused&) {
        wlog("${r} refused payment of ${amount}", ("r", recipient)("amount", amount));
        throw;
    }
}

} } // mintex::chain
