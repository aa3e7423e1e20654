#include <mintex/api/nft_api_objects.hpp>

namespace mintex { namespace api {

    nft_collection_api_object::nft_collection_api_object(const nft_collection_object& nco)
        : collection_id(nco.collection_id), creator(nco.creator), name(to_string(nco.name)),
        created(nco.created), token_count(nco.token_count), last_token_id(nco.last_token_id) {
    }

    nft_api_object::nft_api_object(const nft_object& no, const database& _db)
        : token_id(no.token_id), name(to_string(no.name)), collection_id(no.collection_id),
        creator(no.creator), owner(no.owner), mint_price(no.mint_price),
        minted(no.minted), last_update(no.last_update) {
        const auto* nco = _db.find_nft_collection(no.collection_id);
        if (nco) {
            collection_name = nco->name_str();
        }
    }

    nft_listing_api_object::nft_listing_api_object(const nft_listing_object& nlo)
        : token_id(nlo.token_id), seller(nlo.seller), price(nlo.price), created(nlo.created) {
    }

    nft_auction_api_object::nft_auction_api_object(const nft_auction_object& nao)
        : token_id(nao.token_id), creator(nao.creator), highest_bid(nao.highest_bid),
        created(nao.created), end_time(nao.end_time) {
        if (nao.has_bidder()) {
            highest_bidder = nao.highest_bidder;
        }
    }

} } // mintex::api
