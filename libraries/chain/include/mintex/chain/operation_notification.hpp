#pragma once

#include <mintex/protocol/operations.hpp>

namespace mintex { namespace chain {

    using mintex::protocol::account_name_type;
    using mintex::protocol::operation;
    using mintex::protocol::share_type;
    using mintex::protocol::time_point_sec;

    struct operation_notification {
        operation_notification(const operation& o)
                : op(o) {
        }

        uint64_t sequence = 0;
        time_point_sec timestamp;
        const operation& op;
    };

    struct payment_notification {
        payment_notification(const account_name_type& r, share_type a)
                : recipient(r), amount(a) {
        }

        account_name_type recipient;
        share_type amount;
    };

} } // mintex::chain
