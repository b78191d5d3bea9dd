#include <fortune/engine/time.hpp>

#include <fc/exception/exception.hpp>

namespace fortune { namespace engine {

fc::time_point system_clock::now()const
{
   return fc::time_point::now();
}

simulated_clock::simulated_clock( const fc::time_point start )
:_now( start )
{
}

fc::time_point simulated_clock::now()const
{
   return _now;
}

void simulated_clock::set_time( const fc::time_point t )
{
   _now = t;
}

void simulated_clock::advance_time( const fc::microseconds delta )
{
   FC_ASSERT( delta.count() >= 0, "simulated time cannot run backwards", ("delta",delta) );
   _now += delta;
}

void simulated_clock::advance_ms( int64_t delta_ms )
{
   advance_time( fc::milliseconds( delta_ms ) );
}

fc::time_point time_point_from_ms( uint64_t ms_since_epoch )
{
   return fc::time_point( fc::milliseconds( int64_t( ms_since_epoch ) ) );
}

uint64_t to_ms( const fc::time_point t )
{
   return uint64_t( t.time_since_epoch().count() / 1000 );
}

} } // fortune::engine
