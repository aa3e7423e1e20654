#include <boost/test/unit_test.hpp>

#include "database_fixture.hpp"
#include "helpers.hpp"

#include <boost/signals2/connection.hpp>

#include <stdexcept>

using namespace mintex;
using namespace mintex::chain;
using namespace mintex::protocol;

struct settlement_fixture : public database_fixture {
    settlement_fixture(bool authorize_exchange = true) : database_fixture(authorize_exchange) {
        art = create_collection("alice", "Art");
        token = mint("alice", art, "Piece1", 100);
        fund("bob", 1000);
        fund("carol", 1000);
    }

    void check_untouched_listing() {
        BOOST_CHECK(db.find_nft_listing(token) != nullptr);
        BOOST_CHECK_EQUAL(std::string(owner_of(token)), "alice");
        BOOST_CHECK_EQUAL(db.get_balance("alice").value, 0);
        BOOST_CHECK_EQUAL(db.get_balance("bob").value, 1000);
        BOOST_CHECK_EQUAL(db.get_balance(MINTEX_EXCHANGE_ACCOUNT).value, 0);
    }

    collection_id_type art = 0;
    token_id_type token = 0;
};

struct ungranted_exchange_fixture : public settlement_fixture {
    ungranted_exchange_fixture() : settlement_fixture(false) {
    }
};

BOOST_FIXTURE_TEST_SUITE(settlement_tests, settlement_fixture)

BOOST_AUTO_TEST_CASE(refused_payment_rolls_back_buy) {
    BOOST_TEST_MESSAGE("Testing: refused_payment_rolls_back_buy");

    list("alice", token, 150);

    boost::signals2::scoped_connection conn(db.on_payment.connect([&](const payment_notification& note) {
        if (note.recipient == "alice") {
            FC_THROW_EXCEPTION(mintex::payment_refused, "alice refuses");
        }
    }));

    nft_buy_operation op;
    op.buyer = "bob";
    op.token_id = token;
    op.payment = 200;
    MINTEX_CHECK_ERROR(db.apply_operation(op), mintex::payment_refused);

    check_untouched_listing();
}

BOOST_AUTO_TEST_CASE(refused_refund_rolls_back_bid) {
    BOOST_TEST_MESSAGE("Testing: refused_refund_rolls_back_bid");

    create_auction("alice", token, 100, 3600);
    bid("bob", token, 150);

    boost::signals2::scoped_connection conn(db.on_payment.connect([&](const payment_notification& note) {
        if (note.recipient == "bob") {
            FC_THROW_EXCEPTION(mintex::payment_refused, "bob refuses");
        }
    }));

    nft_bid_operation op;
    op.bidder = "carol";
    op.token_id = token;
    op.payment = 200;
    MINTEX_CHECK_ERROR(db.apply_operation(op), mintex::payment_refused);

    BOOST_CHECK_EQUAL(std::string(db.get_nft_auction(token).highest_bidder), "bob");
    BOOST_CHECK_EQUAL(db.get_nft_auction(token).highest_bid.value, 150);
    BOOST_CHECK_EQUAL(db.get_balance("carol").value, 1000);
    BOOST_CHECK_EQUAL(db.get_balance(MINTEX_EXCHANGE_ACCOUNT).value, 150);
}

BOOST_AUTO_TEST_CASE(reentrant_buy_sees_settled_state) {
    BOOST_TEST_MESSAGE("Testing: reentrant_buy_sees_settled_state");

    list("alice", token, 150);
    const auto events_before = events.size();

    bool reentered = false;
    bool listing_seen = true;
    std::string owner_seen;
    size_t events_seen = 0;

    boost::signals2::scoped_connection conn(db.on_payment.connect([&](const payment_notification& note) {
        if (note.recipient != "alice" || reentered) {
            return;
        }
        reentered = true;
        listing_seen = db.find_nft_listing(token) != nullptr;
        owner_seen = std::string(owner_of(token));
        events_seen = events.size();

        nft_buy_operation again;
        again.buyer = "carol";
        again.token_id = token;
        again.payment = 150;
        BOOST_CHECK_THROW(db.apply_operation(again), mintex::missing_object);
    }));

    buy("bob", token, 150);

    BOOST_CHECK(reentered);
    BOOST_CHECK(!listing_seen);
    BOOST_CHECK_EQUAL(owner_seen, "bob");
    BOOST_CHECK_EQUAL(events_seen, events_before);

    BOOST_CHECK_EQUAL(std::string(owner_of(token)), "bob");
    BOOST_CHECK_EQUAL(db.get_balance("alice").value, 150);
    BOOST_CHECK_EQUAL(db.get_balance("bob").value, 850);
    BOOST_CHECK_EQUAL(db.get_balance("carol").value, 1000);
    BOOST_CHECK_EQUAL(events_of<nft_sold_operation>().size(), 1u);
}

BOOST_AUTO_TEST_CASE(reentrant_bid_from_refund) {
    BOOST_TEST_MESSAGE("Testing: reentrant_bid_from_refund");

    create_auction("alice", token, 100, 3600);
    bid("bob", token, 150);

    bool reentered = false;
    boost::signals2::scoped_connection conn(db.on_payment.connect([&](const payment_notification& note) {
        if (note.recipient != "bob" || reentered) {
            return;
        }
        reentered = true;
        bid("bob", token, 250);
    }));

    bid("carol", token, 200);

    BOOST_CHECK(reentered);

    const auto& nao = db.get_nft_auction(token);
    BOOST_CHECK_EQUAL(std::string(nao.highest_bidder), "bob");
    BOOST_CHECK_EQUAL(nao.highest_bid.value, 250);
    BOOST_CHECK_EQUAL(db.get_balance("bob").value, 750);
    BOOST_CHECK_EQUAL(db.get_balance("carol").value, 1000);
    BOOST_CHECK_EQUAL(db.get_balance(MINTEX_EXCHANGE_ACCOUNT).value, 250);
    BOOST_CHECK_EQUAL(events_of<nft_bid_placed_operation>().size(), 3u);
}

BOOST_AUTO_TEST_CASE(failed_reentrant_call_fails_outer) {
    BOOST_TEST_MESSAGE("Testing: failed_reentrant_call_fails_outer");

    list("alice", token, 150);

    boost::signals2::scoped_connection conn(db.on_payment.connect([&](const payment_notification& note) {
        if (note.recipient == "alice") {
            collection_create_operation op;
            op.creator = "alice";
            op.name = "Art";
            db.apply_operation(op);
        }
    }));

    nft_buy_operation op;
    op.buyer = "bob";
    op.token_id = token;
    op.payment = 150;
    MINTEX_CHECK_ERROR(db.apply_operation(op), mintex::object_already_exist);

    check_untouched_listing();
}

BOOST_AUTO_TEST_CASE(escrow_identity_is_rejected) {
    BOOST_TEST_MESSAGE("Testing: escrow_identity_is_rejected");

    auto other = mint("alice", art, "Piece2", 100);
    create_auction("alice", other, 100, 3600);
    bid("bob", other, 150);
    list("alice", token, 150);
    BOOST_CHECK_EQUAL(db.get_balance(MINTEX_EXCHANGE_ACCOUNT).value, 150);

    BOOST_TEST_MESSAGE("-- Buying as the escrow account");

    nft_buy_operation op;
    op.buyer = MINTEX_EXCHANGE_ACCOUNT;
    op.token_id = token;
    op.payment = 150;
    MINTEX_CHECK_ERROR(db.apply_operation(op), mintex::invalid_parameter);
    BOOST_CHECK(db.find_nft_listing(token) != nullptr);
    BOOST_CHECK_EQUAL(db.get_balance("alice").value, 0);

    BOOST_TEST_MESSAGE("-- Bidding as the escrow account");

    nft_bid_operation bop;
    bop.bidder = MINTEX_EXCHANGE_ACCOUNT;
    bop.token_id = other;
    bop.payment = 200;
    MINTEX_CHECK_ERROR(db.apply_operation(bop), mintex::invalid_parameter);
    BOOST_CHECK_EQUAL(std::string(db.get_nft_auction(other).highest_bidder), "bob");

    BOOST_TEST_MESSAGE("-- Transferring as the escrow account");

    nft_transfer_operation tr;
    tr.invoker = MINTEX_EXCHANGE_ACCOUNT;
    tr.token_id = token;
    tr.new_owner = "carol";
    MINTEX_CHECK_ERROR(db.apply_operation(tr), mintex::invalid_parameter);
    BOOST_CHECK_EQUAL(std::string(owner_of(token)), "alice");

    BOOST_CHECK_EQUAL(db.get_balance(MINTEX_EXCHANGE_ACCOUNT).value, 150);

    BOOST_TEST_MESSAGE("-- Outbidding still refunds from escrow");

    bid("carol", other, 200);
    BOOST_CHECK_EQUAL(db.get_balance("bob").value, 1000);
    BOOST_CHECK_EQUAL(db.get_balance(MINTEX_EXCHANGE_ACCOUNT).value, 200);
}

BOOST_AUTO_TEST_CASE(throwing_subscriber_does_not_fail_operation) {
    BOOST_TEST_MESSAGE("Testing: throwing_subscriber_does_not_fail_operation");

    list("alice", token, 150);

    boost::signals2::scoped_connection conn(db.on_event.connect([&](const operation_notification&) {
        throw std::runtime_error("subscriber failure");
    }));

    auto before = events.size();
    BOOST_CHECK_NO_THROW(buy("bob", token, 150));

    BOOST_CHECK_EQUAL(std::string(owner_of(token)), "bob");
    BOOST_CHECK(db.find_nft_listing(token) == nullptr);
    BOOST_CHECK_EQUAL(db.get_balance("alice").value, 150);

    BOOST_TEST_MESSAGE("-- Every notification of the batch is still delivered");

    BOOST_CHECK_EQUAL(events.size(), before + 2);
    BOOST_CHECK_EQUAL(events_of<ownership_transferred_operation>().size(), 1u);
    BOOST_CHECK_EQUAL(events_of<nft_sold_operation>().size(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ungranted_exchange_tests, ungranted_exchange_fixture)

BOOST_AUTO_TEST_CASE(buy_needs_granted_exchange) {
    BOOST_TEST_MESSAGE("Testing: buy_needs_granted_exchange");

    list("alice", token, 150);

    nft_buy_operation op;
    op.buyer = "bob";
    op.token_id = token;
    op.payment = 200;
    MINTEX_CHECK_ERROR(db.apply_operation(op), mintex::unauthorized);

    check_untouched_listing();
    BOOST_CHECK(payments.empty());

    BOOST_TEST_MESSAGE("-- Works once granted");

    authorize(MINTEX_EXCHANGE_ACCOUNT);
    db.apply_operation(op);
    BOOST_CHECK_EQUAL(std::string(owner_of(token)), "bob");
}

BOOST_AUTO_TEST_CASE(finalize_needs_granted_exchange) {
    BOOST_TEST_MESSAGE("Testing: finalize_needs_granted_exchange");

    create_auction("alice", token, 100, 3600);
    bid("bob", token, 150);
    advance_time(3600);

    nft_auction_finalize_operation op;
    op.finalizer = "carol";
    op.token_id = token;
    MINTEX_CHECK_ERROR(db.apply_operation(op), mintex::unauthorized);

    BOOST_CHECK(db.find_nft_auction(token) != nullptr);
    BOOST_CHECK_EQUAL(std::string(owner_of(token)), "alice");
    BOOST_CHECK_EQUAL(db.get_balance("bob").value, 850);
    BOOST_CHECK_EQUAL(db.get_balance(MINTEX_EXCHANGE_ACCOUNT).value, 150);
    BOOST_CHECK_EQUAL(db.get_balance("alice").value, 0);
}

BOOST_AUTO_TEST_SUITE_END()
