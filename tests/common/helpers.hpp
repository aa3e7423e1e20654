#pragma once

#include <boost/test/unit_test.hpp>

#include <mintex/protocol/exceptions.hpp>

#define CHECK_OP_VALID(OP) \
    BOOST_CHECK_NO_THROW(OP.validate())

#define CHECK_PARAM_INVALID(OP, FIELD, VALUE) \
    { \
        auto _backup = OP.FIELD; \
        OP.FIELD = VALUE; \
        BOOST_CHECK_THROW(OP.validate(), mintex::invalid_parameter); \
        OP.FIELD = _backup; \
    }

#define CHECK_PARAM_VALID(OP, FIELD, VALUE) \
    { \
        auto _backup = OP.FIELD; \
        OP.FIELD = VALUE; \
        BOOST_CHECK_NO_THROW(OP.validate()); \
        OP.FIELD = _backup; \
    }

#define CHECK_OP_AUTHS(OP, AUTHS) \
    { \
        mintex::protocol::flat_set<mintex::protocol::account_name_type> _auths; \
        OP.get_required_authorities(_auths); \
        BOOST_CHECK(_auths == AUTHS); \
    }

// A failed operation delivers no notifications
#define MINTEX_CHECK_ERROR(EXPR, EXCEPTION_TYPE) \
    { \
        auto _events = events.size(); \
        BOOST_CHECK_THROW(EXPR, EXCEPTION_TYPE); \
        BOOST_CHECK_EQUAL(events.size(), _events); \
    }
