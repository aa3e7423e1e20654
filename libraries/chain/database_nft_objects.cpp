#include <mintex/chain/database.hpp>
#include <mintex/protocol/exceptions.hpp>
#include <mintex/protocol/market_events.hpp>

#include <fc/log/logger.hpp>

namespace mintex { namespace chain {

using namespace mintex::protocol;

const nft_collection_object& database::get_nft_collection(collection_id_type collection_id) const {
    try {
        return get<nft_collection_object, by_collection_id>(collection_id);
    } catch(const std::out_of_range& e) {
        MINTEX_THROW_MISSING_OBJECT("nft_collection", collection_id);
    } FC_CAPTURE_AND_RETHROW((collection_id))
}

const nft_collection_object* database::find_nft_collection(collection_id_type collection_id) const {
    return find<nft_collection_object, by_collection_id>(collection_id);
}

const nft_collection_object* database::find_nft_collection_by_name(const std::string& name) const {
    return find<nft_collection_object, by_name>(name);
}

void database::throw_if_exists_nft_collection(const std::string& name) const {
    if (find_nft_collection_by_name(name)) {
        MINTEX_THROW_OBJECT_ALREADY_EXIST("nft_collection", name);
    }
}

const nft_object& database::get_nft(token_id_type token_id) const {
    try {
        return get<nft_object, by_token_id>(token_id);
    } catch(const std::out_of_range& e) {
        MINTEX_THROW_MISSING_OBJECT("nft", token_id);
    } FC_CAPTURE_AND_RETHROW((token_id))
}

const nft_object* database::find_nft(token_id_type token_id) const {
    return find<nft_object, by_token_id>(token_id);
}

bool database::nft_exists(token_id_type token_id) const {
    return find_nft(token_id) != nullptr;
}

id_seed database::make_seed(const account_name_type& caller, id_space space) const {
    const auto& gpo = get_dynamic_global_properties();

    id_seed seed;
    seed.caller = caller;
    seed.counter = gpo.entropy_counter;
    seed.time = gpo.time;
    seed.space = static_cast<uint8_t>(space);
    return seed;
}

void database::advance_entropy_counter() {
    modify(get_dynamic_global_properties(), [&](auto& gpo) {
        ++gpo.entropy_counter;
    });
}

collection_id_type database::allocate_collection_id(const account_name_type& caller) {
    id_generator generator(get_entropy_source());

    auto id = generator.allocate(make_seed(caller, id_space::collection),
        id_range{MINTEX_COLLECTION_ID_MIN, MINTEX_COLLECTION_ID_MAX},
        [&](uint64_t candidate) {
            return find_nft_collection(static_cast<collection_id_type>(candidate)) != nullptr;
        });

    advance_entropy_counter();
    return static_cast<collection_id_type>(id);
}

token_id_type database::allocate_token_id(const account_name_type& caller) {
    id_generator generator(get_entropy_source());

    auto id = generator.allocate(make_seed(caller, id_space::token),
        id_range{MINTEX_TOKEN_ID_MIN, MINTEX_TOKEN_ID_MAX},
        [&](uint64_t candidate) {
            return nft_exists(static_cast<token_id_type>(candidate));
        });

    advance_entropy_counter();
    return static_cast<token_id_type>(id);
}

bool database::is_authorized(const account_name_type& caller, grant_capability capability) const {
    return find<transfer_grant_object, by_caller_capability>(std::make_tuple(caller, capability)) != nullptr;
}

void database::set_authorized(const account_name_type& caller, bool enabled, grant_capability capability) {
    const auto* grant = find<transfer_grant_object, by_caller_capability>(std::make_tuple(caller, capability));

    if (enabled) {
        if (grant) {
            return;
        }
        const auto& gpo = get_dynamic_global_properties();
        create<transfer_grant_object>([&](auto& tgo) {
            tgo.caller = caller;
            tgo.capability = capability;
            tgo.granted_by = gpo.admin;
            tgo.granted = gpo.time;
        });
        ilog("Granted ${cap} to ${caller}", ("cap", capability)("caller", caller));
    } else if (grant) {
        remove(*grant);
        ilog("Revoked ${cap} from ${caller}", ("cap", capability)("caller", caller));
    }
}

void database::transfer_nft(const account_name_type& invoker, token_id_type token_id, const account_name_type& new_owner) {
    MINTEX_CHECK_AUTHORITY(is_authorized(invoker, grant_capability::transfer_ownership),
        "${invoker} is not authorized to transfer ownership", ("invoker", invoker));

    const auto& no = get_nft(token_id);
    auto old_owner = no.owner;

    modify(no, [&](auto& no) {
        no.owner = new_owner;
        no.last_update = head_block_time();
    });

    push_event(ownership_transferred_operation(token_id, old_owner, new_owner));
}

const nft_listing_object& database::get_nft_listing(token_id_type token_id) const {
    try {
        return get<nft_listing_object, by_token_id>(token_id);
    } catch(const std::out_of_range& e) {
        MINTEX_THROW_MISSING_OBJECT("nft_listing", token_id);
    } FC_CAPTURE_AND_RETHROW((token_id))
}

const nft_listing_object* database::find_nft_listing(token_id_type token_id) const {
    return find<nft_listing_object, by_token_id>(token_id);
}

void database::throw_if_exists_nft_listing(token_id_type token_id) const {
    if (find_nft_listing(token_id)) {
        MINTEX_THROW_OBJECT_ALREADY_EXIST("nft_listing", token_id);
    }
}

const nft_auction_object& database::get_nft_auction(token_id_type token_id) const {
    try {
        return get<nft_auction_object, by_token_id>(token_id);
    } catch(const std::out_of_range& e) {
        MINTEX_THROW_MISSING_OBJECT("nft_auction", token_id);
    } FC_CAPTURE_AND_RETHROW((token_id))
}

const nft_auction_object* database::find_nft_auction(token_id_type token_id) const {
    return find<nft_auction_object, by_token_id>(token_id);
}

void database::throw_if_exists_nft_auction(token_id_type token_id) const {
    if (find_nft_auction(token_id)) {
        MINTEX_THROW_OBJECT_ALREADY_EXIST("nft_auction", token_id);
    }
}

void database::settle_auction(const nft_auction_object& auction) {
    const auto& no = get_nft(auction.token_id);
    MINTEX_CHECK_LOGIC(auction.highest_bid >= no.mint_price, mintex::below_reserve,
        "Highest bid ${bid} is below mint price ${price}",
        ("bid", auction.highest_bid)("price", no.mint_price));

    const auto token_id = auction.token_id;
    const auto creator = auction.creator;
    const auto bidder = auction.highest_bidder;
    const auto price = auction.highest_bid;
    const bool sold = auction.has_bidder();

    if (sold) {
        MINTEX_CHECK_AUTHORITY(no.owner == creator,
            "Auction creator ${creator} no longer owns token ${t}", ("creator", creator)("t", token_id));
    }

    // record goes first, a payment handler must not see a live auction
    remove(auction);

    if (!sold) {
        ilog("Auction for token ${t} expired without bids", ("t", token_id));
        push_event(nft_auction_ended_operation(creator, token_id, auction_end_reason::expired_without_bids));
        return;
    }

    transfer_nft(MINTEX_EXCHANGE_ACCOUNT, token_id, bidder);
    pay(creator, price);

    ilog("Auction for token ${t} settled: ${bidder} pays ${price} to ${creator}",
        ("t", token_id)("bidder", bidder)("price", price)("creator", creator));
    push_event(nft_sold_operation(creator, bidder, token_id, price, sale_kind::auction));
}

void database::settle_expired_auction_on_bid(const nft_auction_object& auction, const account_name_type& late_bidder) {
    MINTEX_CHECK_LOGIC(auction.has_bidder(), mintex::auction_expired_no_bids,
        "Auction for token ${t} expired without bids", ("t", auction.token_id));

    // the late payment is never collected, so the bidder keeps it
    dlog("Bid of ${b} on token ${t} arrived after auction end", ("b", late_bidder)("t", auction.token_id));
    settle_auction(auction);
}

} } // mintex::chain
