#include <fortune/engine/address.hpp>
#include <fortune/engine/config.hpp>

#include <fc/array.hpp>
#include <fc/crypto/base58.hpp>
#include <fc/crypto/elliptic.hpp>
#include <fc/crypto/sha512.hpp>
#include <fc/variant.hpp>

#include <cstring>

namespace fortune { namespace engine {

   address::address( const fc::ecc::public_key& owner )
   {
      const fc::ecc::public_key_data key = owner.serialize();
      addr = fc::ripemd160::hash( fc::sha512::hash( key.data, sizeof( key ) ) );
   }

   address::operator std::string()const
   {
      const fc::ripemd160 checksum = fc::ripemd160::hash( (const char*)addr._hash, sizeof( addr ) );

      fc::array<char,24> bin;
      memcpy( bin.data, (const char*)addr._hash, sizeof( addr ) );
      memcpy( bin.data + sizeof( addr ), (const char*)checksum._hash, 4 );
      return FORTUNE_ADDRESS_PREFIX + fc::to_base58( bin.data, sizeof( bin ) );
   }

} } // fortune::engine

namespace fc
{
   void to_variant( const fortune::engine::address& a, variant& v )
   {
      v = std::string( a );
   }
}
