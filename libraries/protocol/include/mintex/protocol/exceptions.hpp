#pragma once

#include <fc/exception/exception.hpp>
#include <fc/variant_object.hpp>

#define MINTEX_ASSERT(expr, exception_type, exception_msg, ...) \
    FC_MULTILINE_MACRO_BEGIN \
        if (!(expr)) { \
            FC_THROW_EXCEPTION(exception_type, exception_msg, ##__VA_ARGS__); \
        } \
    FC_MULTILINE_MACRO_END

#define MINTEX_CHECK_VALUE(expr, MSG, ...) \
    MINTEX_ASSERT((expr), mintex::invalid_value, MSG, ##__VA_ARGS__)

#define MINTEX_CHECK_PARAM(PARAM, ...) \
    FC_MULTILINE_MACRO_BEGIN \
        try { \
            __VA_ARGS__ \
        } catch (const mintex::invalid_value& e) { \
            FC_THROW_EXCEPTION(mintex::invalid_parameter, \
                "Invalid value \"${value}\" for operation parameter \"${param}\": ${errmsg}", \
                ("param", FC_STRINGIZE(PARAM))("value", PARAM)("errmsg", e.to_string())); \
        } \
    FC_MULTILINE_MACRO_END

#define MINTEX_CHECK_PARAM_ACCOUNT(NAME) \
    MINTEX_CHECK_PARAM(NAME, { \
        MINTEX_CHECK_VALUE(mintex::protocol::is_valid_account_name(NAME), \
            "Account name ${name} is invalid", ("name", NAME)); \
    })

#define MINTEX_CHECK_PARAM_CALLER(NAME) \
    MINTEX_CHECK_PARAM(NAME, { \
        MINTEX_CHECK_VALUE(mintex::protocol::is_valid_account_name(NAME), \
            "Account name ${name} is invalid", ("name", NAME)); \
        MINTEX_CHECK_VALUE(!mintex::protocol::is_reserved_account_name(NAME), \
            "Account ${name} is reserved", ("name", NAME)); \
    })

#define MINTEX_CHECK_AUTHORITY(expr, MSG, ...) \
    MINTEX_ASSERT((expr), mintex::unauthorized, MSG, ##__VA_ARGS__)

#define MINTEX_CHECK_LOGIC(expr, exception_type, MSG, ...) \
    MINTEX_ASSERT((expr), exception_type, MSG, ##__VA_ARGS__)

#define MINTEX_THROW_MISSING_OBJECT(type, id) \
    FC_THROW_EXCEPTION(mintex::missing_object, "Missing ${type} with id \"${id}\"", \
        ("type", type)("id", id))

#define MINTEX_THROW_OBJECT_ALREADY_EXIST(type, id) \
    FC_THROW_EXCEPTION(mintex::object_already_exist, "Object ${type} with id \"${id}\" already exists", \
        ("type", type)("id", id))

#define MINTEX_CHECK_OBJECT_MISSING(DATABASE, OBJECT, ...) \
    DATABASE.throw_if_exists_##OBJECT(__VA_ARGS__)

namespace mintex {

    FC_DECLARE_EXCEPTION(mintex_exception, 7000000, "mintex exception");

    FC_DECLARE_DERIVED_EXCEPTION(invalid_value, mintex_exception,
        7010000, "invalid value");

    FC_DECLARE_DERIVED_EXCEPTION(invalid_parameter, invalid_value,
        7010001, "invalid operation parameter");

    FC_DECLARE_DERIVED_EXCEPTION(missing_object, mintex_exception,
        7020000, "missing required object");

    FC_DECLARE_DERIVED_EXCEPTION(unauthorized, mintex_exception,
        7030000, "caller is not authorized");

    FC_DECLARE_DERIVED_EXCEPTION(object_already_exist, mintex_exception,
        7040000, "object already exists");

    FC_DECLARE_DERIVED_EXCEPTION(identity_exhausted, mintex_exception,
        7050000, "identifier allocation exhausted");

    FC_DECLARE_DERIVED_EXCEPTION(payment_exception, mintex_exception,
        7060000, "payment failed");

    FC_DECLARE_DERIVED_EXCEPTION(insufficient_payment, payment_exception,
        7060001, "payment is less than price");

    FC_DECLARE_DERIVED_EXCEPTION(insufficient_funds, payment_exception,
        7060002, "account does not have sufficient funds");

    FC_DECLARE_DERIVED_EXCEPTION(payment_refused, payment_exception,
        7060003, "recipient refused payment");

    FC_DECLARE_DERIVED_EXCEPTION(auction_exception, mintex_exception,
        7070000, "auction state error");

    FC_DECLARE_DERIVED_EXCEPTION(bid_too_low, auction_exception,
        7070001, "bid does not exceed highest bid");

    FC_DECLARE_DERIVED_EXCEPTION(auction_expired_no_bids, auction_exception,
        7070002, "auction expired without bids");

    FC_DECLARE_DERIVED_EXCEPTION(below_reserve, auction_exception,
        7070003, "highest bid is below reserve price");

    FC_DECLARE_DERIVED_EXCEPTION(auction_not_expired, auction_exception,
        7070004, "auction has not expired yet");

} // mintex
