#pragma once

#include <mintex/chain/object_types.hpp>

namespace mintex { namespace chain {

    /**
     * Singleton with the environment-driven state: the clock, the
     * administrator identity and the identifier entropy counter.
     */
    class dynamic_global_property_object
            : public object<dynamic_global_property_object_type, dynamic_global_property_object> {
    public:
        template<typename Constructor, typename Allocator>
        dynamic_global_property_object(Constructor&& c, allocator<Allocator> a) {
            c(*this);
        }

        dynamic_global_property_object() {
        }

        id_type id;

        time_point_sec time;
        account_name_type admin;

        uint64_t entropy_counter = 0;
        uint32_t collection_count = 0;
        uint32_t token_count = 0;
    };

    using dynamic_global_property_index = multi_index_container<
        dynamic_global_property_object,
        indexed_by<
            ordered_unique<
                tag<by_id>,
                member<dynamic_global_property_object, dynamic_global_property_id_type, &dynamic_global_property_object::id>
            >
        >,
        allocator<dynamic_global_property_object>
    >;

} } // mintex::chain

FC_REFLECT((mintex::chain::dynamic_global_property_object),
    (id)(time)(admin)(entropy_counter)(collection_count)(token_count)
)

CHAINBASE_SET_INDEX_TYPE(
    mintex::chain::dynamic_global_property_object,
    mintex::chain::dynamic_global_property_index);
