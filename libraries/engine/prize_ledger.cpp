#include <fortune/engine/exceptions.hpp>
#include <fortune/engine/prize_ledger.hpp>

#include <fc/reflect/variant.hpp>

namespace fortune { namespace engine {

   void prize_ledger::validate_prizes( const vector<share_type>& amounts )
   {
      const uint64_t prize_count = amounts.size();
      if( prize_count == 0 )
         FC_CAPTURE_AND_THROW( invalid_prize_count, (prize_count) );

      share_type total = 0;
      for( uint32_t i = 0; i < amounts.size(); ++i )
      {
         const share_type amount = amounts[i];
         if( amount <= 0 )
            FC_CAPTURE_AND_THROW( invalid_prize_amount, (i)(amount) );
         total = add_shares( total, amount );
      }
   }

   share_type prize_ledger::total_prizes()const
   {
      share_type total = 0;
      for( const auto amount : prize_amounts )
         total = add_shares( total, amount );
      return total;
   }

   share_type prize_ledger::outstanding_total( const vector<winner_record>& winners )const
   {
      share_type outstanding = total_prizes();
      for( const auto& w : winners )
      {
         if( w.claimed )
            outstanding -= prize_amounts.at( w.prize_index );
      }
      return outstanding;
   }

   void prize_ledger::check_sufficiency()const
   {
      const share_type required = total_prizes();
      if( required > pool.amount )
         FC_CAPTURE_AND_THROW( insufficient_funds, (required)(pool) );
   }

   void prize_ledger::donate( const asset& amount )
   {
      if( amount.amount <= 0 )
         FC_CAPTURE_AND_THROW( invalid_amount, (amount) );
      pool += amount;
   }

   asset prize_ledger::prize_asset( prize_index_type idx )const
   {
      FC_ASSERT( idx < prize_amounts.size(), "unknown prize index", ("idx",idx) );
      return asset( prize_amounts[idx], pool.asset_id );
   }

   asset prize_ledger::settle_claim( prize_index_type idx, const address& caller, vector<winner_record>& winners )
   {
      FC_ASSERT( idx < winners.size(), "prize has not been drawn", ("idx",idx) );
      winner_record& entitlement = winners[idx];
      if( entitlement.winner != caller )
         FC_CAPTURE_AND_THROW( not_a_winner, (caller)(idx) );
      if( entitlement.claimed )
         FC_CAPTURE_AND_THROW( no_unclaimed_prize, (caller)(idx) );

      const asset payout = prize_asset( entitlement.prize_index );
      if( payout > pool )
         FC_CAPTURE_AND_THROW( insufficient_funds, (payout)(pool) );

      pool -= payout;
      entitlement.claimed = true;
      return payout;
   }

   asset prize_ledger::reclaim_remainder()
   {
      if( pool.amount == 0 )
         FC_CAPTURE_AND_THROW( nothing_to_reclaim, (pool) );

      const asset remainder = pool;
      pool.amount = 0;
      return remainder;
   }

   void prize_ledger::replace_prizes( const vector<share_type>& new_amounts,
                                      vector<winner_record>& winners,
                                      vector<fc::time_point>& spin_times )
   {
      validate_prizes( new_amounts );
      prize_amounts = new_amounts;
      winners.clear();
      spin_times.clear();
      check_sufficiency();
   }

} } // fortune::engine
