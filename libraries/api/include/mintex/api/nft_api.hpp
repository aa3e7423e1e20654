#pragma once

#include <mintex/api/nft_api_objects.hpp>

#include <vector>

namespace mintex { namespace api {

    nft_api_object get_item(const database& _db, token_id_type token_id);

    bool item_exists(const database& _db, token_id_type token_id);

    /// Order of the result follows the index and is not part of the contract.
    std::vector<nft_api_object> get_items_by_owner(const database& _db, const account_name_type& owner);

    /// Items minted into any collection of @p creator.
    std::vector<nft_api_object> get_items_by_collection(const database& _db, const account_name_type& creator);

    std::vector<nft_collection_api_object> get_collections_by_creator(const database& _db, const account_name_type& creator);

    fc::optional<nft_listing_api_object> find_listing(const database& _db, token_id_type token_id);

    fc::optional<nft_auction_api_object> find_auction(const database& _db, token_id_type token_id);

    /**
     * Status of the auction at head time. An auction past its end time
     * reports inactive even though its record waits for finalization.
     * A token without an auction gets an inactive status with zero bid.
     */
    auction_status_api_object get_auction_status(const database& _db, token_id_type token_id);

} } // mintex::api
