#include <boost/test/unit_test.hpp>

#include "helpers.hpp"

#include <mintex/protocol/operations.hpp>
#include <mintex/protocol/config.hpp>

#include <fc/io/json.hpp>

using namespace mintex;
using namespace mintex::protocol;

typedef flat_set<account_name_type> account_name_set;

BOOST_AUTO_TEST_SUITE(operation_validation_tests)

BOOST_AUTO_TEST_CASE(collection_create_validate) {
    BOOST_TEST_MESSAGE("Testing: collection_create_validate");

    collection_create_operation op;
    op.creator = "alice";
    op.name = "Art";
    CHECK_OP_VALID(op);
    CHECK_OP_AUTHS(op, account_name_set({"alice"}));

    BOOST_TEST_MESSAGE("-- Incorrect account");

    CHECK_PARAM_INVALID(op, creator, "");
    CHECK_PARAM_INVALID(op, creator, "Alice");
    CHECK_PARAM_INVALID(op, creator, "1alice");

    BOOST_TEST_MESSAGE("-- Name length");

    CHECK_PARAM_INVALID(op, name, "");
    CHECK_PARAM_INVALID(op, name, std::string(MINTEX_MAX_NAME_LENGTH + 1, 'a'));
    CHECK_PARAM_VALID(op, name, std::string(MINTEX_MAX_NAME_LENGTH, 'a'));
    CHECK_PARAM_VALID(op, name, "a");

    BOOST_TEST_MESSAGE("-- Name encoding");

    CHECK_PARAM_VALID(op, name, "\xd0\x98\xd1\x81\xd0\xba\xd1\x83\xd1\x81\xd1\x81\xd1\x82\xd0\xb2\xd0\xbe");
    CHECK_PARAM_INVALID(op, name, "\xff\xfe");
}

BOOST_AUTO_TEST_CASE(nft_mint_validate) {
    BOOST_TEST_MESSAGE("Testing: nft_mint_validate");

    nft_mint_operation op;
    op.minter = "alice";
    op.collection_id = 1;
    op.name = "Piece1";
    op.mint_price = 100;
    CHECK_OP_VALID(op);
    CHECK_OP_AUTHS(op, account_name_set({"alice"}));

    CHECK_PARAM_INVALID(op, name, "");
    CHECK_PARAM_INVALID(op, name, std::string(MINTEX_MAX_NAME_LENGTH + 1, 'x'));

    BOOST_TEST_MESSAGE("-- Mint price");

    CHECK_PARAM_INVALID(op, mint_price, 0);
    CHECK_PARAM_INVALID(op, mint_price, -1);
    CHECK_PARAM_VALID(op, mint_price, 1);
}

BOOST_AUTO_TEST_CASE(transfer_and_grant_validate) {
    BOOST_TEST_MESSAGE("Testing: transfer_and_grant_validate");

    nft_transfer_operation op;
    op.invoker = "market";
    op.token_id = 0;
    op.new_owner = "bob";
    CHECK_OP_VALID(op);
    CHECK_OP_AUTHS(op, account_name_set({"market"}));
    CHECK_PARAM_INVALID(op, new_owner, "");
    CHECK_PARAM_INVALID(op, invoker, "a");

    set_authorized_operation sa;
    sa.admin = "admin";
    sa.caller = "market";
    sa.enabled = false;
    CHECK_OP_VALID(sa);
    CHECK_OP_AUTHS(sa, account_name_set({"admin"}));
    CHECK_PARAM_INVALID(sa, caller, "");
}

BOOST_AUTO_TEST_CASE(listing_validate) {
    BOOST_TEST_MESSAGE("Testing: listing_validate");

    nft_list_operation op;
    op.seller = "alice";
    op.token_id = 5;
    op.price = 150;
    CHECK_OP_VALID(op);
    CHECK_PARAM_INVALID(op, price, 0);
    CHECK_PARAM_INVALID(op, price, -150);

    nft_buy_operation buy;
    buy.buyer = "bob";
    buy.token_id = 5;
    buy.payment = 200;
    CHECK_OP_VALID(buy);
    CHECK_OP_AUTHS(buy, account_name_set({"bob"}));
    CHECK_PARAM_INVALID(buy, payment, 0);

    nft_cancel_listing_operation cancel;
    cancel.seller = "alice";
    cancel.token_id = 5;
    CHECK_OP_VALID(cancel);
    CHECK_PARAM_INVALID(cancel, seller, "");
}

BOOST_AUTO_TEST_CASE(auction_validate) {
    BOOST_TEST_MESSAGE("Testing: auction_validate");

    nft_auction_create_operation op;
    op.creator = "alice";
    op.token_id = 5;
    op.starting_bid = 100;
    op.duration = 3600;
    CHECK_OP_VALID(op);

    CHECK_PARAM_INVALID(op, starting_bid, 0);
    CHECK_PARAM_INVALID(op, duration, 0);
    CHECK_PARAM_INVALID(op, duration, -3600);

    nft_bid_operation bid;
    bid.bidder = "bob";
    bid.token_id = 5;
    bid.payment = 150;
    CHECK_OP_VALID(bid);
    CHECK_PARAM_INVALID(bid, payment, -1);
    CHECK_PARAM_VALID(bid, payment, 0);

    nft_auction_end_operation end;
    end.creator = "alice";
    end.token_id = 5;
    CHECK_OP_VALID(end);

    nft_auction_finalize_operation fin;
    fin.finalizer = "carol";
    fin.token_id = 5;
    CHECK_OP_VALID(fin);
    CHECK_OP_AUTHS(fin, account_name_set({"carol"}));
}

BOOST_AUTO_TEST_CASE(escrow_account_cannot_act) {
    BOOST_TEST_MESSAGE("Testing: escrow_account_cannot_act");

    nft_buy_operation buy;
    buy.buyer = "bob";
    buy.token_id = 5;
    buy.payment = 150;
    CHECK_PARAM_INVALID(buy, buyer, MINTEX_EXCHANGE_ACCOUNT);

    nft_bid_operation bid;
    bid.bidder = "bob";
    bid.token_id = 5;
    bid.payment = 150;
    CHECK_PARAM_INVALID(bid, bidder, MINTEX_EXCHANGE_ACCOUNT);

    nft_transfer_operation tr;
    tr.invoker = "market";
    tr.token_id = 5;
    tr.new_owner = "bob";
    CHECK_PARAM_INVALID(tr, invoker, MINTEX_EXCHANGE_ACCOUNT);
    CHECK_PARAM_INVALID(tr, new_owner, MINTEX_EXCHANGE_ACCOUNT);

    nft_list_operation list;
    list.seller = "alice";
    list.token_id = 5;
    list.price = 150;
    CHECK_PARAM_INVALID(list, seller, MINTEX_EXCHANGE_ACCOUNT);

    nft_auction_finalize_operation fin;
    fin.finalizer = "carol";
    fin.token_id = 5;
    CHECK_PARAM_INVALID(fin, finalizer, MINTEX_EXCHANGE_ACCOUNT);

    BOOST_TEST_MESSAGE("-- The escrow account can still be granted");

    set_authorized_operation sa;
    sa.admin = "admin";
    sa.caller = "market";
    sa.enabled = true;
    CHECK_PARAM_VALID(sa, caller, MINTEX_EXCHANGE_ACCOUNT);
    CHECK_PARAM_INVALID(sa, admin, MINTEX_EXCHANGE_ACCOUNT);
}

BOOST_AUTO_TEST_CASE(virtual_operations_are_not_applicable) {
    BOOST_TEST_MESSAGE("Testing: virtual_operations_are_not_applicable");

    operation op = nft_sold_operation("alice", "bob", 5, 150, sale_kind::listing);
    BOOST_CHECK(is_virtual_operation(op));
    BOOST_CHECK_THROW(operation_validate(op), fc::assert_exception);

    operation list = nft_list_operation();
    BOOST_CHECK(!is_virtual_operation(list));
    BOOST_CHECK_EQUAL(operation_name(list), "nft_list_operation");
}

BOOST_AUTO_TEST_CASE(operation_from_json) {
    BOOST_TEST_MESSAGE("Testing: operation_from_json");

    auto var = fc::json::from_string(
        R"(["nft_mint", {"minter": "alice", "collection_id": 7, "name": "Piece1", "mint_price": 100}])");

    operation op;
    fc::from_variant(var, op);
    BOOST_REQUIRE(op.which() == operation::tag<nft_mint_operation>::value);

    const auto& mint = op.get<nft_mint_operation>();
    BOOST_CHECK_EQUAL(std::string(mint.minter), "alice");
    BOOST_CHECK_EQUAL(mint.collection_id, 7u);
    BOOST_CHECK_EQUAL(mint.name, "Piece1");
    BOOST_CHECK_EQUAL(mint.mint_price.value, 100);

    fc::variant back;
    fc::to_variant(op, back);
    BOOST_CHECK_EQUAL(back.get_array()[0].as_string(), "nft_mint");

    BOOST_CHECK_THROW(fc::from_variant(fc::json::from_string(R"(["no_such_op", {}])"), op), fc::assert_exception);
}

BOOST_AUTO_TEST_SUITE_END()
