#include <fortune/engine/asset.hpp>
#include <fortune/engine/exceptions.hpp>

#include <fc/reflect/variant.hpp>

#include <cstdint>

namespace fortune { namespace engine {

  share_type add_shares( share_type a, share_type b )
  {
     if( ((b > 0) && (a > (INT64_MAX - b))) ||
         ((b < 0) && (a < (INT64_MIN - b))) )
     {
        FC_THROW_EXCEPTION( addition_overflow, "share addition overflow  ${a} + ${b}",
                            ("a", a)("b", b) );
     }
     return a + b;
  }

  asset& asset::operator += ( const asset& o )
  { try {
     if( this->asset_id != o.asset_id )
        FC_CAPTURE_AND_THROW( asset_type_mismatch, (*this)(o) );

     if (((o.amount > 0) && (amount > (INT64_MAX - o.amount))) ||
         ((o.amount < 0) && (amount < (INT64_MIN - o.amount))))
     {
       FC_THROW_EXCEPTION( addition_overflow, "asset addition overflow  ${a} + ${b}",
                            ("a", *this)("b",o) );
     }

     amount += o.amount;
     return *this;
  } FC_CAPTURE_AND_RETHROW( (*this)(o) ) }

  asset& asset::operator -= ( const asset& o )
  {
     if( asset_id != o.asset_id )
        FC_CAPTURE_AND_THROW( asset_type_mismatch, (*this)(o) );

     if ((o.amount > 0 && amount < INT64_MIN + o.amount) ||
         (o.amount < 0 && amount > INT64_MAX + o.amount))
     {
        FC_THROW_EXCEPTION( subtraction_overflow, "asset subtraction underflow  ${a} - ${b}",
                            ("a", *this)("b",o) );
     }

     amount -= o.amount;
     return *this;
  }

} } // fortune::engine
