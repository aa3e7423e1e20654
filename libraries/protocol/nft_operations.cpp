#include <mintex/protocol/nft_operations.hpp>
#include <mintex/protocol/exceptions.hpp>
#include <mintex/protocol/config.hpp>

#include <fc/utf8.hpp>

namespace mintex { namespace protocol {

    void validate_nft_name(const std::string& name) {
        MINTEX_CHECK_VALUE(name.size(), "Name should not be empty");
        MINTEX_CHECK_VALUE(name.size() <= MINTEX_MAX_NAME_LENGTH,
            "Name should not be longer than ${max} units", ("max", MINTEX_MAX_NAME_LENGTH));
        MINTEX_CHECK_VALUE(fc::is_utf8(name), "Name is not UTF8");
    }

    void collection_create_operation::validate() const {
        MINTEX_CHECK_PARAM_CALLER(creator);
        MINTEX_CHECK_PARAM(name, {
            validate_nft_name(name);
        });
    }

    void nft_mint_operation::validate() const {
        MINTEX_CHECK_PARAM_CALLER(minter);
        MINTEX_CHECK_PARAM(name, {
            validate_nft_name(name);
        });
        MINTEX_CHECK_PARAM(mint_price, {
            MINTEX_CHECK_VALUE(mint_price > 0, "Mint price should be > 0");
        });
    }

    void nft_transfer_operation::validate() const {
        MINTEX_CHECK_PARAM_CALLER(invoker);
        MINTEX_CHECK_PARAM_CALLER(new_owner);
    }

    void set_authorized_operation::validate() const {
        MINTEX_CHECK_PARAM_CALLER(admin);
        MINTEX_CHECK_PARAM_ACCOUNT(caller);
    }

    void nft_list_operation::validate() const {
        MINTEX_CHECK_PARAM_CALLER(seller);
        MINTEX_CHECK_PARAM(price, {
            MINTEX_CHECK_VALUE(price > 0, "Listing price should be > 0");
        });
    }

    void nft_cancel_listing_operation::validate() const {
        MINTEX_CHECK_PARAM_CALLER(seller);
    }

    void nft_buy_operation::validate() const {
        MINTEX_CHECK_PARAM_CALLER(buyer);
        MINTEX_CHECK_PARAM(payment, {
            MINTEX_CHECK_VALUE(payment > 0, "Payment should be > 0");
        });
    }

    void nft_auction_create_operation::validate() const {
        MINTEX_CHECK_PARAM_CALLER(creator);
        MINTEX_CHECK_PARAM(starting_bid, {
            MINTEX_CHECK_VALUE(starting_bid > 0, "Starting bid should be > 0");
        });
        MINTEX_CHECK_PARAM(duration, {
            MINTEX_CHECK_VALUE(duration > 0, "Auction duration should be > 0");
        });
    }

    void nft_bid_operation::validate() const {
        MINTEX_CHECK_PARAM_CALLER(bidder);
        // zero is allowed here: a late call still finalizes an expired auction
        MINTEX_CHECK_PARAM(payment, {
            MINTEX_CHECK_VALUE(payment >= 0, "Payment cannot be negative");
        });
    }

    void nft_auction_end_operation::validate() const {
        MINTEX_CHECK_PARAM_CALLER(creator);
    }

    void nft_auction_finalize_operation::validate() const {
        MINTEX_CHECK_PARAM_CALLER(finalizer);
    }

} } // mintex::protocol
