#pragma once

#include <mintex/chain/object_types.hpp>

namespace mintex { namespace chain {

    class account_balance_object : public object<account_balance_object_type, account_balance_object> {
    public:
        template<typename Constructor, typename Allocator>
        account_balance_object(Constructor&& c, allocator<Allocator> a) {
            c(*this);
        }

        account_balance_object() {
        }

        id_type id;

        account_name_type account;
        share_type balance;
    };

    enum class grant_capability : uint8_t {
        transfer_ownership = 1
    };

    /**
     * Capability granted by the administrator to a caller. A caller without
     * the record cannot use the capability.
     */
    class transfer_grant_object : public object<transfer_grant_object_type, transfer_grant_object> {
    public:
        template<typename Constructor, typename Allocator>
        transfer_grant_object(Constructor&& c, allocator<Allocator> a) {
            c(*this);
        }

        transfer_grant_object() {
        }

        id_type id;

        account_name_type caller;
        grant_capability capability = grant_capability::transfer_ownership;
        account_name_type granted_by;
        time_point_sec granted;
    };

    struct by_account;
    struct by_caller_capability;

    using account_balance_index = multi_index_container<
        account_balance_object,
        indexed_by<
            ordered_unique<
                tag<by_id>,
                member<account_balance_object, account_balance_id_type, &account_balance_object::id>
            >,
            ordered_unique<
                tag<by_account>,
                member<account_balance_object, account_name_type, &account_balance_object::account>
            >
        >,
        allocator<account_balance_object>
    >;

    using transfer_grant_index = multi_index_container<
        transfer_grant_object,
        indexed_by<
            ordered_unique<
                tag<by_id>,
                member<transfer_grant_object, transfer_grant_id_type, &transfer_grant_object::id>
            >,
            ordered_unique<
                tag<by_caller_capability>,
                composite_key<
                    transfer_grant_object,
                    member<transfer_grant_object, account_name_type, &transfer_grant_object::caller>,
                    member<transfer_grant_object, grant_capability, &transfer_grant_object::capability>
                >
            >
        >,
        allocator<transfer_grant_object>
    >;

} } // mintex::chain

FC_REFLECT_ENUM(mintex::chain::grant_capability,
    (transfer_ownership)
)

FC_REFLECT((mintex::chain::account_balance_object),
    (id)(account)(balance)
)

FC_REFLECT((mintex::chain::transfer_grant_object),
    (id)(caller)(capability)(granted_by)(granted)
)

CHAINBASE_SET_INDEX_TYPE(
    mintex::chain::account_balance_object,
    mintex::chain::account_balance_index);

CHAINBASE_SET_INDEX_TYPE(
    mintex::chain::transfer_grant_object,
    mintex::chain::transfer_grant_index);
