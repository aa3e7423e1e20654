#pragma once

#include <mintex/chain/database.hpp>
#include <mintex/chain/nft_objects.hpp>
#include <mintex/protocol/types.hpp>

#include <fc/optional.hpp>

namespace mintex { namespace api {

    using mintex::chain::database;
    using mintex::chain::nft_collection_object;
    using mintex::chain::nft_object;
    using mintex::chain::nft_listing_object;
    using mintex::chain::nft_auction_object;
    using mintex::chain::to_string;
    using mintex::protocol::account_name_type;
    using mintex::protocol::collection_id_type;
    using mintex::protocol::token_id_type;
    using mintex::protocol::share_type;
    using mintex::protocol::time_point_sec;

    struct nft_collection_api_object {
        nft_collection_api_object(const nft_collection_object& nco);

        nft_collection_api_object() {}

        collection_id_type collection_id = 0;
        account_name_type creator;
        std::string name;

        time_point_sec created;
        uint32_t token_count = 0;
        token_id_type last_token_id = 0;
    };

    /**
     * Item record as seen by a client: the stored item plus the name of the
     * collection it was minted in.
     */
    struct nft_api_object {
        nft_api_object(const nft_object& no, const database& _db);

        nft_api_object() {}

        token_id_type token_id = 0;
        std::string name;

        collection_id_type collection_id = 0;
        std::string collection_name;
        account_name_type creator;

        account_name_type owner;
        share_type mint_price;

        time_point_sec minted;
        time_point_sec last_update;
    };

    struct nft_listing_api_object {
        nft_listing_api_object(const nft_listing_object& nlo);

        nft_listing_api_object() {}

        token_id_type token_id = 0;
        account_name_type seller;
        share_type price;
        time_point_sec created;
    };

    struct nft_auction_api_object {
        nft_auction_api_object(const nft_auction_object& nao);

        nft_auction_api_object() {}

        token_id_type token_id = 0;
        account_name_type creator;
        share_type highest_bid;
        fc::optional<account_name_type> highest_bidder;
        time_point_sec created;
        time_point_sec end_time;
    };

    struct auction_status_api_object {
        bool active = false;
        share_type highest_bid;
        fc::optional<account_name_type> highest_bidder;
        uint32_t time_remaining = 0; ///< seconds, zero once the auction is over
    };

} } // mintex::api

FC_REFLECT((mintex::api::nft_collection_api_object),
    (collection_id)(creator)(name)(created)(token_count)(last_token_id)
)

FC_REFLECT((mintex::api::nft_api_object),
    (token_id)(name)(collection_id)(collection_name)(creator)(owner)(mint_price)(minted)(last_update)
)

FC_REFLECT((mintex::api::nft_listing_api_object),
    (token_id)(seller)(price)(created)
)

FC_REFLECT((mintex::api::nft_auction_api_object),
    (token_id)(creator)(highest_bid)(highest_bidder)(created)(end_time)
)

FC_REFLECT((mintex::api::auction_status_api_object),
    (active)(highest_bid)(highest_bidder)(time_remaining)
)
