#include <mintex/chain/database.hpp>
#include <mintex/chain/nft_evaluators.hpp>
#include <mintex/chain/nft_objects.hpp>

#include <fc/log/logger.hpp>

#include <limits>

namespace mintex { namespace chain {

    void nft_list_evaluator::do_apply(const nft_list_operation& op) {
        const auto& no = _db.get_nft(op.token_id);
        MINTEX_CHECK_AUTHORITY(no.owner == op.seller, "Cannot sell not your token.");

        MINTEX_CHECK_VALUE(op.price >= no.mint_price,
            "Price ${price} is below mint price ${mint_price}",
            ("price", op.price)("mint_price", no.mint_price));

        MINTEX_CHECK_OBJECT_MISSING(_db, nft_listing, op.token_id);
        MINTEX_CHECK_OBJECT_MISSING(_db, nft_auction, op.token_id);

        _db.create<nft_listing_object>([&](auto& nlo) {
            nlo.token_id = op.token_id;
            nlo.seller = op.seller;
            nlo.price = op.price;
            nlo.created = _db.head_block_time();
        });

        _db.push_event(nft_listed_operation(op.seller, op.token_id, op.price));
    }

    void nft_cancel_listing_evaluator::do_apply(const nft_cancel_listing_operation& op) {
        const auto& no = _db.get_nft(op.token_id);
        MINTEX_CHECK_AUTHORITY(no.owner == op.seller, "Cannot cancel listing of not your token.");

        const auto& nlo = _db.get_nft_listing(op.token_id);
        _db.remove(nlo);

        _db.push_event(nft_listing_cancelled_operation(op.seller, op.token_id));
    }

    void nft_buy_evaluator::do_apply(const nft_buy_operation& op) {
        const auto& nlo = _db.get_nft_listing(op.token_id);

        MINTEX_ASSERT(op.payment >= nlo.price, mintex::insufficient_payment,
            "Payment ${payment} is less than price ${price}", ("payment", op.payment)("price", nlo.price));

        const auto& no = _db.get_nft(op.token_id);
        MINTEX_CHECK_AUTHORITY(no.owner == nlo.seller,
            "Seller ${seller} no longer owns token ${t}", ("seller", nlo.seller)("t", op.token_id));
        MINTEX_CHECK_VALUE(op.buyer != nlo.seller, "Cannot buy your own token");

        const auto seller = nlo.seller;
        const auto price = nlo.price;
        const auto excess = op.payment - price;

        _db.collect_payment(op.buyer, op.payment);

        // bookkeeping first, payments last: a payment handler can re-enter
        _db.remove(nlo);
        _db.transfer_nft(MINTEX_EXCHANGE_ACCOUNT, op.token_id, op.buyer);

        if (excess > 0) {
            _db.pay(op.buyer, excess);
        }
        _db.pay(seller, price);

        ilog("Token ${t} sold by ${seller} to ${buyer} for ${price}",
            ("t", op.token_id)("seller", seller)("buyer", op.buyer)("price", price));

        _db.push_event(nft_sold_operation(seller, op.buyer, op.token_id, price, sale_kind::listing));
    }

    void nft_auction_create_evaluator::do_apply(const nft_auction_create_operation& op) {
        const auto& no = _db.get_nft(op.token_id);
        MINTEX_CHECK_AUTHORITY(no.owner == op.creator, "Cannot sell not your token.");

        MINTEX_CHECK_VALUE(op.starting_bid >= no.mint_price,
            "Starting bid ${bid} is below mint price ${mint_price}",
            ("bid", op.starting_bid)("mint_price", no.mint_price));

        auto now = _db.head_block_time();
        MINTEX_CHECK_VALUE(op.duration <= int64_t(std::numeric_limits<uint32_t>::max() - now.sec_since_epoch()),
            "Auction duration ${d} is too long", ("d", op.duration));

        MINTEX_CHECK_OBJECT_MISSING(_db, nft_auction, op.token_id);
        MINTEX_CHECK_OBJECT_MISSING(_db, nft_listing, op.token_id);

        auto end_time = now + uint32_t(op.duration);

        _db.create<nft_auction_object>([&](auto& nao) {
            nao.token_id = op.token_id;
            nao.creator = op.creator;
            nao.highest_bid = op.starting_bid;
            nao.highest_bidder = account_name_type();
            nao.created = now;
            nao.end_time = end_time;
        });

        _db.push_event(nft_auction_created_operation(op.creator, op.token_id, op.starting_bid, end_time));
    }

    void nft_bid_evaluator::do_apply(const nft_bid_operation& op) {
        const auto& nao = _db.get_nft_auction(op.token_id);

        if (_db.head_block_time() >= nao.end_time) {
            _db.settle_expired_auction_on_bid(nao, op.bidder);
            return;
        }

        const auto& no = _db.get_nft(op.token_id);
        MINTEX_CHECK_AUTHORITY(no.owner == nao.creator,
            "Auction creator ${creator} no longer owns token ${t}", ("creator", nao.creator)("t", op.token_id));
        MINTEX_CHECK_VALUE(op.payment >= no.mint_price,
            "Bid ${bid} is below mint price ${mint_price}", ("bid", op.payment)("mint_price", no.mint_price));
        MINTEX_CHECK_LOGIC(op.payment > nao.highest_bid, mintex::bid_too_low,
            "Bid ${bid} should be greater than ${highest}", ("bid", op.payment)("highest", nao.highest_bid));

        const auto prev_bidder = nao.highest_bidder;
        const auto prev_bid = nao.highest_bid;
        const bool had_bidder = nao.has_bidder();

        _db.collect_payment(op.bidder, op.payment);

        _db.modify(nao, [&](auto& nao) {
            nao.highest_bid = op.payment;
            nao.highest_bidder = op.bidder;
        });

        if (had_bidder) {
            _db.pay(prev_bidder, prev_bid);
        }

        _db.push_event(nft_bid_placed_operation(op.bidder, op.token_id, op.payment));
    }

    void nft_auction_end_evaluator::do_apply(const nft_auction_end_operation& op) {
        const auto& nao = _db.get_nft_auction(op.token_id);
        MINTEX_CHECK_AUTHORITY(nao.creator == op.creator, "Only auction creator can end the auction.");

        const auto bidder = nao.highest_bidder;
        const auto bid = nao.highest_bid;
        const bool had_bidder = nao.has_bidder();

        _db.remove(nao);

        nft_auction_ended_operation event(op.creator, op.token_id, auction_end_reason::cancelled);
        if (had_bidder) {
            _db.pay(bidder, bid);
            event.refunded = bid;
            ilog("Auction for token ${t} ended by creator, ${bid} refunded to ${bidder}",
                ("t", op.token_id)("bid", bid)("bidder", bidder));
        }

        _db.push_event(event);
    }

    void nft_auction_finalize_evaluator::do_apply(const nft_auction_finalize_operation& op) {
        const auto& nao = _db.get_nft_auction(op.token_id);
        MINTEX_CHECK_LOGIC(_db.head_block_time() >= nao.end_time, mintex::auction_not_expired,
            "Auction for token ${t} ends at ${end}", ("t", op.token_id)("end", nao.end_time));

        _db.settle_auction(nao);
    }

} } // mintex::chain
