#pragma once

#include <mintex/chain/evaluator.hpp>
#include <mintex/protocol/nft_operations.hpp>

namespace mintex { namespace chain {

    using namespace mintex::protocol;

    // Asset registry and transfer authority
    DEFINE_EVALUATOR(collection_create)
    DEFINE_EVALUATOR(nft_mint)
    DEFINE_EVALUATOR(nft_transfer)
    DEFINE_EVALUATOR(set_authorized)

    // Exchange engine
    DEFINE_EVALUATOR(nft_list)
    DEFINE_EVALUATOR(nft_cancel_listing)
    DEFINE_EVALUATOR(nft_buy)
    DEFINE_EVALUATOR(nft_auction_create)
    DEFINE_EVALUATOR(nft_bid)
    DEFINE_EVALUATOR(nft_auction_end)
    DEFINE_EVALUATOR(nft_auction_finalize)

} } // mintex::chain
