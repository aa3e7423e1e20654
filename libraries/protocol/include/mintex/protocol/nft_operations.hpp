#pragma once

#include <mintex/protocol/base.hpp>

namespace mintex { namespace protocol {

    void validate_nft_name(const std::string& name);

    struct collection_create_operation : public base_operation {
        account_name_type creator;
        std::string name;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(creator);
        }
    };

    struct nft_mint_operation : public base_operation {
        account_name_type minter;
        collection_id_type collection_id = 0;
        std::string name;
        share_type mint_price;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(minter);
        }
    };

    // Gated ownership change, allowed only for granted callers
    struct nft_transfer_operation : public base_operation {
        account_name_type invoker;
        token_id_type token_id = 0;
        account_name_type new_owner;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(invoker);
        }
    };

    struct set_authorized_operation : public base_operation {
        account_name_type admin;
        account_name_type caller;
        bool enabled = true;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(admin);
        }
    };

    struct nft_list_operation : public base_operation {
        account_name_type seller;
        token_id_type token_id = 0;
        share_type price;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(seller);
        }
    };

    struct nft_cancel_listing_operation : public base_operation {
        account_name_type seller;
        token_id_type token_id = 0;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(seller);
        }
    };

    struct nft_buy_operation : public base_operation {
        account_name_type buyer;
        token_id_type token_id = 0;
        share_type payment;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(buyer);
        }
    };

    struct nft_auction_create_operation : public base_operation {
        account_name_type creator;
        token_id_type token_id = 0;
        share_type starting_bid;
        int64_t duration = 0; // seconds

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(creator);
        }
    };

    struct nft_bid_operation : public base_operation {
        account_name_type bidder;
        token_id_type token_id = 0;
        share_type payment;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(bidder);
        }
    };

    struct nft_auction_end_operation : public base_operation {
        account_name_type creator;
        token_id_type token_id = 0;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(creator);
        }
    };

    struct nft_auction_finalize_operation : public base_operation {
        account_name_type finalizer;
        token_id_type token_id = 0;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(finalizer);
        }
    };

} } // mintex::protocol

FC_REFLECT(
    (mintex::protocol::collection_create_operation),
    (creator)(name)
)

FC_REFLECT(
    (mintex::protocol::nft_mint_operation),
    (minter)(collection_id)(name)(mint_price)
)

FC_REFLECT(
    (mintex::protocol::nft_transfer_operation),
    (invoker)(token_id)(new_owner)
)

FC_REFLECT(
    (mintex::protocol::set_authorized_operation),
    (admin)(caller)(enabled)
)

FC_REFLECT(
    (mintex::protocol::nft_list_operation),
    (seller)(token_id)(price)
)

FC_REFLECT(
    (mintex::protocol::nft_cancel_listing_operation),
    (seller)(token_id)
)

FC_REFLECT(
    (mintex::protocol::nft_buy_operation),
    (buyer)(token_id)(payment)
)

FC_REFLECT(
    (mintex::protocol::nft_auction_create_operation),
    (creator)(token_id)(starting_bid)(duration)
)

FC_REFLECT(
    (mintex::protocol::nft_bid_operation),
    (bidder)(token_id)(payment)
)

FC_REFLECT(
    (mintex::protocol::nft_auction_end_operation),
    (creator)(token_id)
)

FC_REFLECT(
    (mintex::protocol::nft_auction_finalize_operation),
    (finalizer)(token_id)
)
