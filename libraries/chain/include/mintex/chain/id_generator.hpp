#pragma once

#include <mintex/protocol/config.hpp>
#include <mintex/protocol/exceptions.hpp>
#include <mintex/protocol/types.hpp>

#include <fc/log/logger.hpp>

namespace mintex { namespace chain {

    using mintex::protocol::account_name_type;
    using mintex::protocol::time_point_sec;

    enum class id_space : uint8_t {
        collection = 1,
        token = 2
    };

    /**
     * Inputs of one candidate draw. The caller and the time are observable
     * by anyone, so a draw guarantees uniqueness only, never unpredictability.
     */
    struct id_seed {
        account_name_type caller;
        uint64_t counter = 0;
        time_point_sec time;
        uint32_t attempt = 0;
        uint8_t space = 0;
    };

    /// Half-open range [min, max)
    struct id_range {
        uint64_t min = 0;
        uint64_t max = 0;

        uint64_t reduce(uint64_t value) const {
            return min + value % (max - min);
        }
    };

    class entropy_source {
    public:
        virtual ~entropy_source() = default;

        virtual uint64_t draw(const id_seed& seed) const = 0;
    };

    class sha256_entropy_source final : public entropy_source {
    public:
        uint64_t draw(const id_seed& seed) const override;
    };

    class id_generator final {
    public:
        explicit id_generator(const entropy_source& source) : _source(source) {
        }

        /**
         * Draws candidates until one is not used, at most
         * MINTEX_ID_ALLOCATION_ATTEMPTS times. Each retry mutates the seed
         * by its attempt number. Nothing is modified on failure.
         */
        template<typename IsUsed>
        uint64_t allocate(id_seed seed, const id_range& range, IsUsed&& is_used) const {
            FC_ASSERT(range.max > range.min, "Empty identifier range");

            for (seed.attempt = 0; seed.attempt < MINTEX_ID_ALLOCATION_ATTEMPTS; ++seed.attempt) {
                auto candidate = range.reduce(_source.draw(seed));
                if (!is_used(candidate)) {
                    return candidate;
                }
                dlog("Identifier ${id} collides, attempt ${n}", ("id", candidate)("n", seed.attempt + 1));
            }

            FC_THROW_EXCEPTION(mintex::identity_exhausted,
                "Cannot allocate identifier for ${caller} after ${n} attempts",
                ("caller", seed.caller)("n", MINTEX_ID_ALLOCATION_ATTEMPTS));
        }

    private:
        const entropy_source& _source;
    };

} } // mintex::chain

FC_REFLECT_ENUM(mintex::chain::id_space,
    (collection)(token)
)

FC_REFLECT((mintex::chain::id_seed),
    (caller)(counter)(time)(attempt)(space)
)
