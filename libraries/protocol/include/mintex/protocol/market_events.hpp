#pragma once

#include <mintex/protocol/base.hpp>

namespace mintex { namespace protocol {

struct collection_created_operation : public virtual_operation {
    collection_created_operation() {
    }

    collection_created_operation(const account_name_type& c, collection_id_type cid, const std::string& n) :
        creator(c), collection_id(cid), name(n) {
    }

    account_name_type creator;
    collection_id_type collection_id = 0;
    std::string name;
};

struct nft_minted_operation : public virtual_operation {
    nft_minted_operation() {
    }

    nft_minted_operation(const account_name_type& m, collection_id_type cid, token_id_type tid,
        const std::string& n, share_type p) :
        minter(m), collection_id(cid), token_id(tid), name(n), mint_price(p) {
    }

    account_name_type minter;
    collection_id_type collection_id = 0;
    token_id_type token_id = 0;
    std::string name;
    share_type mint_price;
};

struct ownership_transferred_operation : public virtual_operation {
    ownership_transferred_operation() {
    }

    ownership_transferred_operation(token_id_type tid, const account_name_type& f, const account_name_type& t) :
        token_id(tid), from(f), to(t) {
    }

    token_id_type token_id = 0;
    account_name_type from;
    account_name_type to;
};

struct nft_listed_operation : public virtual_operation {
    nft_listed_operation() {
    }

    nft_listed_operation(const account_name_type& s, token_id_type tid, share_type p) :
        seller(s), token_id(tid), price(p) {
    }

    account_name_type seller;
    token_id_type token_id = 0;
    share_type price;
};

struct nft_listing_cancelled_operation : public virtual_operation {
    nft_listing_cancelled_operation() {
    }

    nft_listing_cancelled_operation(const account_name_type& s, token_id_type tid) :
        seller(s), token_id(tid) {
    }

    account_name_type seller;
    token_id_type token_id = 0;
};

struct nft_auction_created_operation : public virtual_operation {
    nft_auction_created_operation() {
    }

    nft_auction_created_operation(const account_name_type& c, token_id_type tid, share_type sb, time_point_sec e) :
        creator(c), token_id(tid), starting_bid(sb), end_time(e) {
    }

    account_name_type creator;
    token_id_type token_id = 0;
    share_type starting_bid;
    time_point_sec end_time;
};

struct nft_bid_placed_operation : public virtual_operation {
    nft_bid_placed_operation() {
    }

    nft_bid_placed_operation(const account_name_type& b, token_id_type tid, share_type a) :
        bidder(b), token_id(tid), amount(a) {
    }

    account_name_type bidder;
    token_id_type token_id = 0;
    share_type amount;
};

enum class auction_end_reason : uint8_t {
    cancelled,
    expired_without_bids
};

struct nft_auction_ended_operation : public virtual_operation {
    nft_auction_ended_operation() {
    }

    nft_auction_ended_operation(const account_name_type& c, token_id_type tid, auction_end_reason r) :
        creator(c), token_id(tid), reason(r) {
    }

    account_name_type creator;
    token_id_type token_id = 0;
    auction_end_reason reason = auction_end_reason::cancelled;
    share_type refunded; // escrowed bid returned to the highest bidder
};

enum class sale_kind : uint8_t {
    listing,
    auction
};

struct nft_sold_operation : public virtual_operation {
    nft_sold_operation() {
    }

    nft_sold_operation(const account_name_type& s, const account_name_type& b, token_id_type tid,
        share_type p, sale_kind k) :
        seller(s), buyer(b), token_id(tid), price(p), kind(k) {
    }

    account_name_type seller;
    account_name_type buyer;
    token_id_type token_id = 0;
    share_type price;
    sale_kind kind = sale_kind::listing;
};

} } // mintex::protocol

FC_REFLECT((mintex::protocol::collection_created_operation),
    (creator)(collection_id)(name)
)

FC_REFLECT((mintex::protocol::nft_minted_operation),
    (minter)(collection_id)(token_id)(name)(mint_price)
)

FC_REFLECT((mintex::protocol::ownership_transferred_operation),
    (token_id)(from)(to)
)

FC_REFLECT((mintex::protocol::nft_listed_operation),
    (seller)(token_id)(price)
)

FC_REFLECT((mintex::protocol::nft_listing_cancelled_operation),
    (seller)(token_id)
)

FC_REFLECT((mintex::protocol::nft_auction_created_operation),
    (creator)(token_id)(starting_bid)(end_time)
)

FC_REFLECT((mintex::protocol::nft_bid_placed_operation),
    (bidder)(token_id)(amount)
)

FC_REFLECT_ENUM(mintex::protocol::auction_end_reason,
    (cancelled)(expired_without_bids)
)

FC_REFLECT((mintex::protocol::nft_auction_ended_operation),
    (creator)(token_id)(reason)(refunded)
)

FC_REFLECT_ENUM(mintex::protocol::sale_kind,
    (listing)(auction)
)

FC_REFLECT((mintex::protocol::nft_sold_operation),
    (seller)(buyer)(token_id)(price)(kind)
)
