#pragma once

#include <fc/crypto/ripemd160.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/optional.hpp>
#include <fc/time.hpp>
#include <fc/variant.hpp>
#include <fc/variant_object.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace fortune { namespace engine {

    typedef uint64_t                    wheel_id_type;
    typedef uint32_t                    asset_id_type;
    typedef int64_t                     share_type;
    typedef uint32_t                    prize_index_type;

    using std::string;
    using std::map;
    using std::set;
    using std::vector;
    using std::pair;
    using std::unique_ptr;
    using std::shared_ptr;
    using fc::variant;
    using fc::variant_object;
    using fc::mutable_variant_object;
    using fc::optional;
    using fc::sha256;
    using fc::time_point;
    using fc::microseconds;

} } // fortune::engine
