#pragma once

#include <fortune/engine/address.hpp>
#include <fortune/engine/asset.hpp>
#include <fortune/engine/types.hpp>

namespace fortune { namespace engine {

   /** one completed draw: winners[i] is entitled to prize_amounts[i] */
   struct winner_record
   {
      winner_record():prize_index(0),claimed(false){}
      winner_record( const address& w, prize_index_type idx )
      :winner(w),prize_index(idx),claimed(false){}

      address            winner;
      prize_index_type   prize_index;
      bool               claimed;
   };

   /**
    *  The prize schedule and the custody pool backing it.
    *
    *  Conservation: the pool only grows by donation and only shrinks by a
    *  settled claim (exactly the claimed prize) or by handing the whole
    *  remainder back to the organizer.
    */
   struct prize_ledger
   {
      prize_ledger(){}
      explicit prize_ledger( asset_id_type pool_asset_id )
      :pool( 0, pool_asset_id ){}

      /** throws invalid_prize_count for an empty schedule and invalid_prize_amount for a non-positive amount */
      static void        validate_prizes( const vector<share_type>& amounts );

      share_type         total_prizes()const;

      /** sum of the prizes that have not been paid out yet */
      share_type         outstanding_total( const vector<winner_record>& winners )const;

      /** throws insufficient_funds unless the pool covers the whole prize schedule */
      void               check_sufficiency()const;

      /** adds to the pool without checking sufficiency, so funding may precede configuration */
      void               donate( const asset& amount );

      /**
       *  Pays prize_amounts[idx] out of the pool and marks the winner claimed.
       *  Throws not_a_winner if caller did not win idx and no_unclaimed_prize if
       *  it was already claimed.
       */
      asset              settle_claim( prize_index_type idx, const address& caller, vector<winner_record>& winners );

      /** empties the pool, throws nothing_to_reclaim if it is already empty */
      asset              reclaim_remainder();

      /**
       *  Installs a new schedule.  Winners and spin times are reset since their
       *  indexes refer to the old schedule, then sufficiency is checked against
       *  the current pool.
       */
      void               replace_prizes( const vector<share_type>& new_amounts,
                                         vector<winner_record>& winners,
                                         vector<fc::time_point>& spin_times );

      asset              prize_asset( prize_index_type idx )const;
      size_t             prize_count()const { return prize_amounts.size(); }

      vector<share_type> prize_amounts;
      asset              pool;
   };

} } // fortune::engine

FC_REFLECT( fortune::engine::winner_record, (winner)(prize_index)(claimed) )
FC_REFLECT( fortune::engine::prize_ledger, (prize_amounts)(pool) )
