#pragma once

#include <chainbase/chainbase.hpp>

#include <mintex/protocol/types.hpp>
#include <mintex/protocol/operations.hpp>

#include <boost/interprocess/containers/string.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

#include <cstring>

namespace mintex { namespace chain {

    namespace bip = boost::interprocess;

    using namespace boost::multi_index;

    using boost::multi_index_container;

    using chainbase::object;
    using chainbase::oid;
    using chainbase::allocator;

    using mintex::protocol::account_name_type;
    using mintex::protocol::share_type;
    using mintex::protocol::collection_id_type;
    using mintex::protocol::token_id_type;
    using mintex::protocol::time_point_sec;

    typedef bip::basic_string<char, std::char_traits<char>, allocator<char>> shared_string;

    inline std::string to_string(const shared_string& str) {
        return std::string(str.begin(), str.end());
    }

    inline void from_string(shared_string& out, const std::string& in) {
        out.assign(in.begin(), in.end());
    }

    struct strcmp_less {
        bool operator()(const shared_string& a, const shared_string& b) const {
            return less(a.c_str(), b.c_str());
        }

        bool operator()(const shared_string& a, const std::string& b) const {
            return less(a.c_str(), b.c_str());
        }

        bool operator()(const std::string& a, const shared_string& b) const {
            return less(a.c_str(), b.c_str());
        }

    private:
        inline bool less(const char* a, const char* b) const {
            return std::strcmp(a, b) < 0;
        }
    };

    enum object_type {
        dynamic_global_property_object_type,
        account_balance_object_type,
        transfer_grant_object_type,
        nft_collection_object_type,
        nft_object_type,
        nft_listing_object_type,
        nft_auction_object_type
    };

    class dynamic_global_property_object;
    class account_balance_object;
    class transfer_grant_object;
    class nft_collection_object;
    class nft_object;
    class nft_listing_object;
    class nft_auction_object;

    typedef oid<dynamic_global_property_object> dynamic_global_property_id_type;
    typedef oid<account_balance_object> account_balance_id_type;
    typedef oid<transfer_grant_object> transfer_grant_id_type;
    typedef oid<nft_collection_object> nft_collection_object_id_type;
    typedef oid<nft_object> nft_object_id_type;
    typedef oid<nft_listing_object> nft_listing_object_id_type;
    typedef oid<nft_auction_object> nft_auction_object_id_type;

    struct by_id;

} } // mintex::chain

namespace fc {

    template<typename T>
    void to_variant(const chainbase::oid<T>& var, variant& vo) {
        vo = var._id;
    }

    template<typename T>
    void from_variant(const variant& vo, chainbase::oid<T>& var) {
        var._id = vo.as_int64();
    }

} // fc

FC_REFLECT_ENUM(mintex::chain::object_type,
    (dynamic_global_property_object_type)
    (account_balance_object_type)
    (transfer_grant_object_type)
    (nft_collection_object_type)
    (nft_object_type)
    (nft_listing_object_type)
    (nft_auction_object_type)
)
