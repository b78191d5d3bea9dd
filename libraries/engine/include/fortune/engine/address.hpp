#pragma once

#include <fc/crypto/ripemd160.hpp>

#include <string>

namespace fc { namespace ecc { class public_key; } }

namespace fortune { namespace engine {

   /**
    *  Identifies an organizer or a participant: ripemd160( sha512( compressed public key ) ).
    *
    *  Printed as FORTUNE_ADDRESS_PREFIX followed by the base58 form of the
    *  hash with the first 4 bytes of ripemd160( hash ) appended as checksum.
    */
   class address
   {
      public:
         address(){}
         explicit address( const fc::ecc::public_key& owner );

         operator std::string()const;

         fc::ripemd160 addr;
   };

   inline bool operator == ( const address& a, const address& b ) { return a.addr == b.addr; }
   inline bool operator != ( const address& a, const address& b ) { return a.addr != b.addr; }
   inline bool operator <  ( const address& a, const address& b ) { return a.addr <  b.addr; }

} } // fortune::engine

namespace fc
{
   class variant;
   void to_variant( const fortune::engine::address& a, fc::variant& v );
}

#include <fc/reflect/reflect.hpp>
FC_REFLECT( fortune::engine::address, (addr) )
