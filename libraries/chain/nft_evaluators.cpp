#include <mintex/chain/database.hpp>
#include <mintex/chain/nft_evaluators.hpp>
#include <mintex/chain/nft_objects.hpp>

namespace mintex { namespace chain {

    void collection_create_evaluator::do_apply(const collection_create_operation& op) {
        MINTEX_CHECK_OBJECT_MISSING(_db, nft_collection, op.name);

        auto collection_id = _db.allocate_collection_id(op.creator);

        _db.create<nft_collection_object>([&](auto& nco) {
            nco.collection_id = collection_id;
            nco.creator = op.creator;
            from_string(nco.name, op.name);
            nco.created = _db.head_block_time();
        });

        _db.modify(_db.get_dynamic_global_properties(), [&](auto& gpo) {
            ++gpo.collection_count;
        });

        _db.push_event(collection_created_operation(op.creator, collection_id, op.name));
    }

    void nft_mint_evaluator::do_apply(const nft_mint_operation& op) {
        const auto& nco = _db.get_nft_collection(op.collection_id);

        auto token_id = _db.allocate_token_id(op.minter);
        auto now = _db.head_block_time();

        _db.modify(nco, [&](auto& nco) {
            ++nco.token_count;
            nco.last_token_id = token_id;
        });

        _db.create<nft_object>([&](auto& no) {
            no.token_id = token_id;
            no.collection_id = nco.collection_id;
            no.creator = nco.creator;

            no.owner = op.minter;
            from_string(no.name, op.name);
            no.mint_price = op.mint_price;

            no.minted = now;
            no.last_update = now;
        });

        _db.modify(_db.get_dynamic_global_properties(), [&](auto& gpo) {
            ++gpo.token_count;
        });

        _db.push_event(nft_minted_operation(op.minter, op.collection_id, token_id, op.name, op.mint_price));
    }

    void nft_transfer_evaluator::do_apply(const nft_transfer_operation& op) {
        _db.transfer_nft(op.invoker, op.token_id, op.new_owner);
    }

    void set_authorized_evaluator::do_apply(const set_authorized_operation& op) {
        const auto& gpo = _db.get_dynamic_global_properties();
        MINTEX_CHECK_AUTHORITY(op.admin == gpo.admin,
            "Only administrator ${admin} can change authorizations", ("admin", gpo.admin));

        _db.set_authorized(op.caller, op.enabled);
    }

} } // mintex::chain
