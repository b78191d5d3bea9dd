#pragma once

#include <fortune/engine/types.hpp>

namespace fortune { namespace engine {

   /**
    *  Pure time arithmetic deciding when a prize may be claimed and when the
    *  organizer may take back what is left.  All durations are milliseconds.
    *
    *  A prize drawn at spin_time is claimable on [spin_time + delay,
    *  spin_time + delay + window).
    */
   class claim_window_policy
   {
      public:
         static fc::time_point claim_opens_at( const fc::time_point spin_time, uint64_t delay_ms );
         static fc::time_point claim_closes_at( const fc::time_point spin_time, uint64_t delay_ms, uint64_t window_ms );

         static bool can_claim( const fc::time_point now, const fc::time_point spin_time,
                                uint64_t delay_ms, uint64_t window_ms );

         /** throws claim_too_early or claim_window_passed */
         static void check_claim( const fc::time_point now, const fc::time_point spin_time,
                                  uint64_t delay_ms, uint64_t window_ms );

         static bool can_reclaim( const fc::time_point now, const fc::time_point max_spin_time,
                                  uint64_t delay_ms, uint64_t window_ms );

         /** throws reclaim_too_early */
         static void check_reclaim( const fc::time_point now, const fc::time_point max_spin_time,
                                    uint64_t delay_ms, uint64_t window_ms );

         /**
          *  0 selects FORTUNE_DEFAULT_CLAIM_WINDOW_MS, anything below
          *  FORTUNE_MIN_CLAIM_WINDOW_MS is raised to it.
          */
         static uint64_t normalize_claim_window( uint64_t requested_ms );

         static void     validate_delay( uint64_t delay_ms );
   };

} } // fortune::engine
