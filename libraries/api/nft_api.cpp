#include <mintex/api/nft_api.hpp>

namespace mintex { namespace api {

    using mintex::chain::nft_index;
    using mintex::chain::nft_collection_index;
    using mintex::chain::by_owner;
    using mintex::chain::by_creator;

    nft_api_object get_item(const database& _db, token_id_type token_id) {
        return nft_api_object(_db.get_nft(token_id), _db);
    }

    bool item_exists(const database& _db, token_id_type token_id) {
        return _db.nft_exists(token_id);
    }

    std::vector<nft_api_object> get_items_by_owner(const database& _db, const account_name_type& owner) {
        std::vector<nft_api_object> result;

        const auto& idx = _db.get_index<nft_index, by_owner>();
        for (auto itr = idx.lower_bound(owner); itr != idx.end() && itr->owner == owner; ++itr) {
            result.emplace_back(*itr, _db);
        }
        return result;
    }

    std::vector<nft_api_object> get_items_by_collection(const database& _db, const account_name_type& creator) {
        std::vector<nft_api_object> result;

        const auto& idx = _db.get_index<nft_index, by_creator>();
        for (auto itr = idx.lower_bound(creator); itr != idx.end() && itr->creator == creator; ++itr) {
            result.emplace_back(*itr, _db);
        }
        return result;
    }

    std::vector<nft_collection_api_object> get_collections_by_creator(const database& _db, const account_name_type& creator) {
        std::vector<nft_collection_api_object> result;

        const auto& idx = _db.get_index<nft_collection_index, by_creator>();
        for (auto itr = idx.lower_bound(creator); itr != idx.end() && itr->creator == creator; ++itr) {
            result.emplace_back(*itr);
        }
        return result;
    }

    fc::optional<nft_listing_api_object> find_listing(const database& _db, token_id_type token_id) {
        fc::optional<nft_listing_api_object> result;
        const auto* nlo = _db.find_nft_listing(token_id);
        if (nlo) {
            result = nft_listing_api_object(*nlo);
        }
        return result;
    }

    fc::optional<nft_auction_api_object> find_auction(const database& _db, token_id_type token_id) {
        fc::optional<nft_auction_api_object> result;
        const auto* nao = _db.find_nft_auction(token_id);
        if (nao) {
            result = nft_auction_api_object(*nao);
        }
        return result;
    }

    auction_status_api_object get_auction_status(const database& _db, token_id_type token_id) {
        auction_status_api_object status;

        const auto* nao = _db.find_nft_auction(token_id);
        if (!nao) {
            return status;
        }

        const auto now = _db.head_block_time();
        status.active = now < nao->end_time;
        status.highest_bid = nao->highest_bid;
        if (nao->has_bidder()) {
            status.highest_bidder = nao->highest_bidder;
        }
        if (status.active) {
            status.time_remaining = nao->end_time.sec_since_epoch() - now.sec_since_epoch();
        }
        return status;
    }

} } // mintex::api
