#include <fortune/engine/claim_window.hpp>
#include <fortune/engine/config.hpp>
#include <fortune/engine/exceptions.hpp>

namespace fortune { namespace engine {

   fc::time_point claim_window_policy::claim_opens_at( const fc::time_point spin_time, uint64_t delay_ms )
   {
      return spin_time + fc::milliseconds( int64_t( delay_ms ) );
   }

   fc::time_point claim_window_policy::claim_closes_at( const fc::time_point spin_time, uint64_t delay_ms, uint64_t window_ms )
   {
      return claim_opens_at( spin_time, delay_ms ) + fc::milliseconds( int64_t( window_ms ) );
   }

   bool claim_window_policy::can_claim( const fc::time_point now, const fc::time_point spin_time,
                                        uint64_t delay_ms, uint64_t window_ms )
   {
      return now >= claim_opens_at( spin_time, delay_ms )
          && now <  claim_closes_at( spin_time, delay_ms, window_ms );
   }

   void claim_window_policy::check_claim( const fc::time_point now, const fc::time_point spin_time,
                                          uint64_t delay_ms, uint64_t window_ms )
   {
      const fc::time_point opens_at = claim_opens_at( spin_time, delay_ms );
      if( now < opens_at )
         FC_CAPTURE_AND_THROW( claim_too_early, (now)(opens_at) );

      const fc::time_point closes_at = claim_closes_at( spin_time, delay_ms, window_ms );
      if( now >= closes_at )
         FC_CAPTURE_AND_THROW( claim_window_passed, (now)(closes_at) );
   }

   bool claim_window_policy::can_reclaim( const fc::time_point now, const fc::time_point max_spin_time,
                                          uint64_t delay_ms, uint64_t window_ms )
   {
      return now >= claim_closes_at( max_spin_time, delay_ms, window_ms );
   }

   void claim_window_policy::check_reclaim( const fc::time_point now, const fc::time_point max_spin_time,
                                            uint64_t delay_ms, uint64_t window_ms )
   {
      const fc::time_point reclaimable_at = claim_closes_at( max_spin_time, delay_ms, window_ms );
      if( now < reclaimable_at )
         FC_CAPTURE_AND_THROW( reclaim_too_early, (now)(reclaimable_at) );
   }

   uint64_t claim_window_policy::normalize_claim_window( uint64_t requested_ms )
   {
      if( requested_ms > FORTUNE_MAX_TIMING_MS )
         FC_CAPTURE_AND_THROW( invalid_timing, (requested_ms) );

      if( requested_ms == 0 )
         return FORTUNE_DEFAULT_CLAIM_WINDOW_MS;
      if( requested_ms < FORTUNE_MIN_CLAIM_WINDOW_MS )
         return FORTUNE_MIN_CLAIM_WINDOW_MS;
      return requested_ms;
   }

   void claim_window_policy::validate_delay( uint64_t delay_ms )
   {
      if( delay_ms > FORTUNE_MAX_TIMING_MS )
         FC_CAPTURE_AND_THROW( invalid_timing, (delay_ms) );
   }

} } // fortune::engine
