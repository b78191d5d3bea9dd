#pragma once

#include <fc/time.hpp>
#include <memory>

namespace fortune { namespace engine {

   /**
    *  Source of wall-clock time.  Every operation that needs the time reads
    *  it exactly once and uses that value for the whole operation.
    */
   class clock_interface
   {
      public:
         virtual ~clock_interface(){}

         virtual fc::time_point now()const = 0;
   };

   class system_clock : public clock_interface
   {
      public:
         virtual fc::time_point now()const override;
   };

   /**
    *  A clock that only moves when told to, used by tests and the
    *  simulator to reproduce claim window boundaries exactly.
    */
   class simulated_clock : public clock_interface
   {
      public:
         explicit simulated_clock( const fc::time_point start = fc::time_point() );

         virtual fc::time_point now()const override;

         void set_time( const fc::time_point t );
         void advance_time( const fc::microseconds delta );
         void advance_ms( int64_t delta_ms );

      private:
         fc::time_point _now;
   };

   fc::time_point     time_point_from_ms( uint64_t ms_since_epoch );
   uint64_t           to_ms( const fc::time_point t );

} } // fortune::engine
