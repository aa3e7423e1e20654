#pragma once

#include <mintex/protocol/types.hpp>

#include <fc/exception/exception.hpp>

namespace mintex { namespace protocol {

    struct base_operation {
        void get_required_authorities(flat_set<account_name_type>&) const {
        }

        bool is_virtual() const {
            return false;
        }

        void validate() const {
        }
    };

    /**
     * Virtual operations are notifications raised by the engine itself,
     * they cannot be submitted by a caller.
     */
    struct virtual_operation : public base_operation {
        bool is_virtual() const {
            return true;
        }

        void validate() const {
            FC_ASSERT(false, "This is a virtual operation");
        }
    };

} } // mintex::protocol
