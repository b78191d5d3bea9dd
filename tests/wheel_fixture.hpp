#pragma once

#include <fortune/engine/exceptions.hpp>
#include <fortune/engine/wheel_engine.hpp>

#include <fc/crypto/elliptic.hpp>
#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

using namespace fortune::engine;

#define WHEEL_TEST_START_MS   uint64_t(86400000)

/** values replayed by a fixed_random_oracle */
typedef vector<uint64_t> draws;

inline address make_address( const std::string& name )
{
   return address( fc::ecc::private_key::regenerate( fc::sha256::hash( name ) ).get_public_key() );
}

/** a fresh engine, event log and simulated clock, plus a few named participants */
struct wheel_fixture
{
   wheel_fixture()
   :db( std::make_shared<wheel_database>() ),
    log( std::make_shared<memory_event_log>() ),
    engine( db, log ),
    clock( time_point_from_ms( WHEEL_TEST_START_MS ) ),
    organizer( make_address( "organizer" ) ),
    alice( make_address( "alice" ) ),
    bob( make_address( "bob" ) ),
    carol( make_address( "carol" ) ),
    mallory( make_address( "mallory" ) )
   {
   }

   wheel_id_type create_wheel( const vector<address>& entries,
                               const vector<share_type>& prizes,
                               uint64_t delay_ms = 0,
                               uint64_t claim_window_ms = 0 )
   {
      return engine.create_wheel( organizer, entries, prizes, delay_ms, claim_window_ms );
   }

   /** creates a wheel and funds it with exactly the prize total */
   wheel_id_type create_funded_wheel( const vector<address>& entries,
                                      const vector<share_type>& prizes,
                                      uint64_t delay_ms = 0,
                                      uint64_t claim_window_ms = 0 )
   {
      const wheel_id_type id = create_wheel( entries, prizes, delay_ms, claim_window_ms );
      share_type total = 0;
      for( const auto p : prizes ) total += p;
      engine.donate( id, organizer, asset( total ) );
      return id;
   }

   wheel_record wheel( wheel_id_type id )const { return engine.get_wheel( id ); }

   wheel_database_ptr     db;
   memory_event_log_ptr   log;
   wheel_engine           engine;
   simulated_clock        clock;

   address                organizer;
   address                alice;
   address                bob;
   address                carol;
   address                mallory;
};
