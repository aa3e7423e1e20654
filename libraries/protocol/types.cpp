#include <mintex/protocol/types.hpp>
#include <mintex/protocol/config.hpp>

#include <fc/utf8.hpp>

namespace mintex { namespace protocol {

    bool is_valid_account_name(const std::string& name) {
        const auto len = name.size();
        if (len < MINTEX_MIN_ACCOUNT_NAME_LENGTH || len > MINTEX_MAX_ACCOUNT_NAME_LENGTH) {
            return false;
        }
        if (name.front() < 'a' || name.front() > 'z') {
            return false;
        }
        for (const auto& c : name) {
            if (!((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '.')) {
                return false;
            }
        }
        return true;
    }

    bool is_reserved_account_name(const std::string& name) {
        return name == MINTEX_EXCHANGE_ACCOUNT;
    }

    bool is_valid_nft_name(const std::string& name) {
        return !name.empty() && name.size() <= MINTEX_MAX_NAME_LENGTH && fc::is_utf8(name);
    }

} } // mintex::protocol
