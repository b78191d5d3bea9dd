#pragma once

#include <fortune/engine/types.hpp>
#include <fc/exception/exception.hpp>

#include <tuple>

namespace fortune { namespace engine {

  /**
   *  An asset is a 64-bit amount of shares, and an
   *  asset_id specifying the currency the shares are in.
   *  A wheel holds its custody pool in exactly one asset_id.
   */
  struct asset
  {
      asset():amount(0),asset_id(0){}
      explicit asset( share_type a, asset_id_type u = 0 )
      :amount(a),asset_id(u){}

      asset& operator += ( const asset& o );
      asset& operator -= ( const asset& o );

      share_type     amount;
      asset_id_type  asset_id;
  };

  inline bool operator == ( const asset& l, const asset& r )
  {
      return std::tie( l.amount, l.asset_id ) == std::tie( r.amount, r.asset_id );
  }
  inline bool operator != ( const asset& l, const asset& r )
  {
      return !( l == r );
  }
  inline bool operator < ( const asset& l, const asset& r )
  {
      FC_ASSERT( l.asset_id == r.asset_id );
      return l.amount < r.amount;
  }
  inline bool operator > ( const asset& l, const asset& r )
  {
      FC_ASSERT( l.asset_id == r.asset_id );
      return l.amount > r.amount;
  }

  /** checked addition of two share amounts */
  share_type add_shares( share_type a, share_type b );

} } // fortune::engine

#include <fc/reflect/reflect.hpp>
FC_REFLECT( fortune::engine::asset, (amount)(asset_id) );
