#pragma once

#include <fc/container/flat.hpp>
#include <fc/fixed_string.hpp>
#include <fc/io/varint.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/safe.hpp>
#include <fc/static_variant.hpp>
#include <fc/time.hpp>

#include <cstdint>
#include <string>

namespace mintex { namespace protocol {

    using fc::flat_set;
    using fc::safe;
    using fc::time_point_sec;

    typedef fc::fixed_string<> account_name_type;
    typedef safe<int64_t> share_type;

    typedef uint32_t collection_id_type;
    typedef uint32_t token_id_type;

    bool is_valid_account_name(const std::string& name);

    /// Escrow account, never acts as a caller
    bool is_reserved_account_name(const std::string& name);

    bool is_valid_nft_name(const std::string& name);

} } // mintex::protocol
