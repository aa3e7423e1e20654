#pragma once

#include <mintex/chain/object_types.hpp>

namespace mintex { namespace chain {

    class nft_collection_object : public object<nft_collection_object_type, nft_collection_object> {
    public:
        template <typename Constructor, typename Allocator>
        nft_collection_object(Constructor&& c, allocator <Allocator> a) : name(a) {
            c(*this);
        };

        id_type id;

        collection_id_type collection_id = 0;
        account_name_type creator;
        shared_string name;

        time_point_sec created;
        uint32_t token_count = 0;
        token_id_type last_token_id = 0;

        std::string name_str() const {
            return to_string(name);
        }
    };

    class nft_object : public object<nft_object_type, nft_object> {
    public:
        template <typename Constructor, typename Allocator>
        nft_object(Constructor&& c, allocator <Allocator> a) : name(a) {
            c(*this);
        };

        id_type id;

        token_id_type token_id = 0;
        collection_id_type collection_id = 0;
        account_name_type creator; // creator of the collection, not the minter

        account_name_type owner;
        shared_string name;
        share_type mint_price;

        time_point_sec minted;
        time_point_sec last_update;
    };

    class nft_listing_object : public object<nft_listing_object_type, nft_listing_object> {
    public:
        nft_listing_object() {
        }

        template <typename Constructor, typename Allocator>
        nft_listing_object(Constructor&& c, allocator <Allocator> a) {
            c(*this);
        };

        id_type id;

        token_id_type token_id = 0;
        account_name_type seller;
        share_type price;

        time_point_sec created;
    };

    class nft_auction_object : public object<nft_auction_object_type, nft_auction_object> {
    public:
        nft_auction_object() {
        }

        template <typename Constructor, typename Allocator>
        nft_auction_object(Constructor&& c, allocator <Allocator> a) {
            c(*this);
        };

        id_type id;

        token_id_type token_id = 0;
        account_name_type creator;

        share_type highest_bid;
        account_name_type highest_bidder; // empty until the first accepted bid

        time_point_sec created;
        time_point_sec end_time;

        bool has_bidder() const {
            return highest_bidder != account_name_type();
        }
    };

    struct by_collection_id;
    struct by_name;
    struct by_creator;

    using nft_collection_index = multi_index_container<
        nft_collection_object,
        indexed_by<
            ordered_unique<
                tag<by_id>,
                member<nft_collection_object, nft_collection_object_id_type, &nft_collection_object::id>
            >,
            ordered_unique<
                tag<by_collection_id>,
                member<nft_collection_object, collection_id_type, &nft_collection_object::collection_id>
            >,
            ordered_unique<
                tag<by_name>,
                member<nft_collection_object, shared_string, &nft_collection_object::name>,
                strcmp_less
            >,
            ordered_unique<
                tag<by_creator>,
                composite_key<
                    nft_collection_object,
                    member<nft_collection_object, account_name_type, &nft_collection_object::creator>,
                    member<nft_collection_object, collection_id_type, &nft_collection_object::collection_id>
                >
            >
        >,
        allocator<nft_collection_object>
    >;

    struct by_token_id;
    struct by_owner;

    using nft_index = multi_index_container<
        nft_object,
        indexed_by<
            ordered_unique<
                tag<by_id>,
                member<nft_object, nft_object_id_type, &nft_object::id>
            >,
            ordered_unique<
                tag<by_token_id>,
                member<nft_object, token_id_type, &nft_object::token_id>
            >,
            ordered_unique<
                tag<by_owner>,
                composite_key<
                    nft_object,
                    member<nft_object, account_name_type, &nft_object::owner>,
                    member<nft_object, token_id_type, &nft_object::token_id>
                >
            >,
            ordered_unique<
                tag<by_creator>,
                composite_key<
                    nft_object,
                    member<nft_object, account_name_type, &nft_object::creator>,
                    member<nft_object, token_id_type, &nft_object::token_id>
                >
            >
        >,
        allocator<nft_object>
    >;

    using nft_listing_index = multi_index_container<
        nft_listing_object,
        indexed_by<
            ordered_unique<
                tag<by_id>,
                member<nft_listing_object, nft_listing_object_id_type, &nft_listing_object::id>
            >,
            ordered_unique<
                tag<by_token_id>,
                member<nft_listing_object, token_id_type, &nft_listing_object::token_id>
            >
        >,
        allocator<nft_listing_object>
    >;

    using nft_auction_index = multi_index_container<
        nft_auction_object,
        indexed_by<
            ordered_unique<
                tag<by_id>,
                member<nft_auction_object, nft_auction_object_id_type, &nft_auction_object::id>
            >,
            ordered_unique<
                tag<by_token_id>,
                member<nft_auction_object, token_id_type, &nft_auction_object::token_id>
            >
        >,
        allocator<nft_auction_object>
    >;
} } // mintex::chain

CHAINBASE_SET_INDEX_TYPE(
    mintex::chain::nft_collection_object,
    mintex::chain::nft_collection_index);

CHAINBASE_SET_INDEX_TYPE(
    mintex::chain::nft_object,
    mintex::chain::nft_index);

CHAINBASE_SET_INDEX_TYPE(
    mintex::chain::nft_listing_object,
    mintex::chain::nft_listing_index);

CHAINBASE_SET_INDEX_TYPE(
    mintex::chain::nft_auction_object,
    mintex::chain::nft_auction_index);
