#include <mintex/chain/id_generator.hpp>

#include <fc/crypto/sha256.hpp>
#include <fc/io/raw.hpp>

namespace mintex { namespace chain {

    uint64_t sha256_entropy_source::draw(const id_seed& seed) const {
        auto packed = fc::raw::pack(seed);
        auto digest = fc::sha256::hash(packed.data(), packed.size());
        return digest._hash[0];
    }

} } // mintex::chain
