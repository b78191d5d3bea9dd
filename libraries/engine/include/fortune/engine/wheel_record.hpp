#pragma once

#include <fortune/engine/entry_pool.hpp>
#include <fortune/engine/prize_ledger.hpp>

namespace fortune { namespace engine {

   enum wheel_phase
   {
      created_phase   = 0, ///< no draws yet, still configurable
      active_phase    = 1, ///< some but not all prizes drawn
      exhausted_phase = 2, ///< every prize drawn, only claim and reclaim remain
      cancelled_phase = 3  ///< terminal, pool returned to the organizer
   };

   /**
    *  The authoritative state of one raffle.
    *
    *  len(winners) == len(spin_times) == spun_count <= len(prize_amounts)
    *  holds after every committed operation.
    */
   struct wheel_record
   {
      wheel_record()
      :id(0),spun_count(0),delay_ms(0),claim_window_ms(0),is_cancelled(false){}

      wheel_phase                 phase()const;
      bool                        is_exhausted()const;
      uint64_t                    draws_remaining()const;

      const vector<address>&      remaining_entries()const { return entries.entries; }
      const vector<share_type>&   prize_amounts()const     { return ledger.prize_amounts; }
      const asset&                pool_value()const        { return ledger.pool; }
      asset_id_type               pool_asset_id()const     { return ledger.pool.asset_id; }

      bool                        is_claimed( prize_index_type idx )const;
      vector<prize_index_type>    prize_indexes_won_by( const address& a )const;
      vector<prize_index_type>    unclaimed_prize_indexes( const address& a )const;
      share_type                  outstanding_prize_total()const;

      /** time of the latest draw, throws if nothing was drawn */
      fc::time_point              max_spin_time()const;

      /** JSON form for auditing */
      fc::variant                 to_variant()const;

      wheel_id_type               id;
      address                     organizer;
      entry_pool                  entries;
      vector<winner_record>       winners;
      prize_ledger                ledger;
      uint64_t                    spun_count;
      vector<fc::time_point>      spin_times;
      uint64_t                    delay_ms;
      uint64_t                    claim_window_ms;
      bool                        is_cancelled;
   };
   typedef optional<wheel_record> owheel_record;

} } // fortune::engine

FC_REFLECT_ENUM( fortune::engine::wheel_phase, (created_phase)(active_phase)(exhausted_phase)(cancelled_phase) )
FC_REFLECT( fortune::engine::wheel_record,
            (id)
            (organizer)
            (entries)
            (winners)
            (ledger)
            (spun_count)
            (spin_times)
            (delay_ms)
            (claim_window_ms)
            (is_cancelled)
            )
