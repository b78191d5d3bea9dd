#include <fortune/engine/exceptions.hpp>
#include <fortune/engine/wheel_record.hpp>

#include <fc/reflect/variant.hpp>

#include <algorithm>

namespace fortune { namespace engine {

   wheel_phase wheel_record::phase()const
   {
      if( is_cancelled )    return cancelled_phase;
      if( spun_count == 0 ) return created_phase;
      if( is_exhausted() )  return exhausted_phase;
      return active_phase;
   }

   bool wheel_record::is_exhausted()const
   {
      return spun_count >= ledger.prize_count();
   }

   uint64_t wheel_record::draws_remaining()const
   {
      if( is_exhausted() ) return 0;
      return ledger.prize_count() - spun_count;
   }

   bool wheel_record::is_claimed( prize_index_type idx )const
   {
      FC_ASSERT( idx < winners.size(), "prize has not been drawn", ("idx",idx)("spun_count",spun_count) );
      return winners[idx].claimed;
   }

   vector<prize_index_type> wheel_record::prize_indexes_won_by( const address& a )const
   {
      vector<prize_index_type> result;
      for( const auto& w : winners )
      {
         if( w.winner == a )
            result.push_back( w.prize_index );
      }
      return result;
   }

   vector<prize_index_type> wheel_record::unclaimed_prize_indexes( const address& a )const
   {
      vector<prize_index_type> result;
      for( const auto& w : winners )
      {
         if( w.winner == a && !w.claimed )
            result.push_back( w.prize_index );
      }
      return result;
   }

   share_type wheel_record::outstanding_prize_total()const
   {
      return ledger.outstanding_total( winners );
   }

   fc::time_point wheel_record::max_spin_time()const
   {
      FC_ASSERT( !spin_times.empty(), "wheel has not been spun", ("id",id) );
      return *std::max_element( spin_times.begin(), spin_times.end() );
   }

   fc::variant wheel_record::to_variant()const
   {
      fc::mutable_variant_object obj( *this );
      obj( "phase", phase() );
      obj( "outstanding_prize_total", outstanding_prize_total() );
      return fc::variant( obj );
   }

} } // fortune::engine
