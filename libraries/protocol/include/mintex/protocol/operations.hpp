#pragma once

#include <mintex/protocol/nft_operations.hpp>
#include <mintex/protocol/market_events.hpp>

namespace mintex { namespace protocol {

    /**
     * Caller operations come first, notifications (virtual operations)
     * follow. Tags are stable: new members go to the end of their group.
     */
    typedef fc::static_variant<
        collection_create_operation,
        nft_mint_operation,
        nft_transfer_operation,
        set_authorized_operation,
        nft_list_operation,
        nft_cancel_listing_operation,
        nft_buy_operation,
        nft_auction_create_operation,
        nft_bid_operation,
        nft_auction_end_operation,
        nft_auction_finalize_operation,

        /// virtual operations below this point
        collection_created_operation,
        nft_minted_operation,
        ownership_transferred_operation,
        nft_listed_operation,
        nft_listing_cancelled_operation,
        nft_auction_created_operation,
        nft_bid_placed_operation,
        nft_auction_ended_operation,
        nft_sold_operation
    > operation;

    bool is_virtual_operation(const operation& op);

    void operation_validate(const operation& op);

    void operation_get_required_authorities(const operation& op, flat_set<account_name_type>& auths);

    std::string operation_name(const operation& op);

} } // mintex::protocol

namespace fc {

    /// Operations are represented as ["nft_mint", {...}] pairs
    void to_variant(const mintex::protocol::operation& op, fc::variant& var);

    void from_variant(const fc::variant& var, mintex::protocol::operation& op);

} // fc
