#define BOOST_TEST_MODULE SpinEngineTests

#include <boost/test/unit_test.hpp>

#include "wheel_fixture.hpp"

#include <fortune/engine/entry_pool.hpp>
#include <fortune/engine/random_oracle.hpp>
#include <fortune/engine/spin_engine.hpp>

struct spin_fixture
{
   spin_fixture()
   :a( make_address( "a" ) ),
    b( make_address( "b" ) ),
    c( make_address( "c" ) )
   {
   }

   entry_pool pool_of( const vector<address>& entries )const
   {
      entry_pool pool;
      pool.entries = entries;
      return pool;
   }

   address a;
   address b;
   address c;
};

BOOST_FIXTURE_TEST_CASE( entry_validation, spin_fixture )
{ try {
   entry_pool::validate( { a, b }, 2 );
   entry_pool::validate( { a, a, b }, 2 );

   BOOST_CHECK_THROW( entry_pool::validate( { a }, 1 ), invalid_entry_count );
   BOOST_CHECK_THROW( entry_pool::validate( vector<address>( FORTUNE_MAX_ENTRIES + 1, a ), 1 ), invalid_entry_count );
   entry_pool::validate( vector<address>( FORTUNE_MAX_ENTRIES, a ), 1 );

   BOOST_CHECK_THROW( entry_pool::validate( { a, a, b }, 3 ), insufficient_unique_entries );
   BOOST_CHECK_THROW( entry_pool::validate( { a, a }, 2 ), validation_error );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( failed_replace_keeps_entries, spin_fixture )
{ try {
   entry_pool pool = pool_of( { a, b, c } );
   BOOST_CHECK_THROW( pool.replace( { a, a }, 2 ), insufficient_unique_entries );
   BOOST_REQUIRE_EQUAL( pool.size(), 3u );
   BOOST_CHECK( pool.at( 2 ) == c );

   pool.replace( { c, b }, 2 );
   BOOST_REQUIRE_EQUAL( pool.size(), 2u );
   BOOST_CHECK( pool.at( 0 ) == c );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( remove_by_value_takes_every_occurrence, spin_fixture )
{ try {
   entry_pool pool = pool_of( { a, b, a, c, a } );
   const vector<uint32_t> removed = pool.remove_by_value( a );

   BOOST_REQUIRE_EQUAL( removed.size(), 3u );
   BOOST_CHECK_EQUAL( removed[0], 0u );
   BOOST_CHECK_EQUAL( removed[1], 2u );
   BOOST_CHECK_EQUAL( removed[2], 4u );

   BOOST_REQUIRE_EQUAL( pool.size(), 2u );
   BOOST_CHECK( pool.at( 0 ) == b );
   BOOST_CHECK( pool.at( 1 ) == c );
   BOOST_CHECK_EQUAL( pool.count( a ), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( remove_by_position_takes_one_occurrence, spin_fixture )
{ try {
   entry_pool pool = pool_of( { a, b, a, c } );
   BOOST_CHECK( pool.remove_by_position( 2 ) == a );

   BOOST_REQUIRE_EQUAL( pool.size(), 3u );
   BOOST_CHECK_EQUAL( pool.count( a ), 1u );
   BOOST_CHECK( pool.at( 2 ) == c );

   BOOST_CHECK_THROW( pool.remove_by_position( 3 ), fc::exception );
   BOOST_CHECK_EQUAL( pool.size(), 3u );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( singleton_detection, spin_fixture )
{ try {
   BOOST_CHECK( !pool_of( {} ).singleton().valid() );
   BOOST_CHECK( !pool_of( { a, b } ).singleton().valid() );

   entry_pool pool = pool_of( { b, b, b } );
   BOOST_REQUIRE( pool.singleton().valid() );
   BOOST_CHECK( *pool.singleton() == b );

   const optional<address> popped = pool.auto_pop_if_singleton();
   BOOST_REQUIRE( popped.valid() );
   BOOST_CHECK( *popped == b );
   BOOST_CHECK( pool.empty() );

   entry_pool mixed = pool_of( { a, b } );
   BOOST_CHECK( !mixed.auto_pop_if_singleton().valid() );
   BOOST_CHECK_EQUAL( mixed.size(), 2u );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( random_selection_removes_winner_by_value, spin_fixture )
{ try {
   entry_pool pool = pool_of( { a, b, a, c } );
   fixed_random_oracle oracle( draws{ 2 } );

   const spin_result result = spin_engine::select_random( pool, oracle );
   BOOST_CHECK( result.winner == a );
   BOOST_CHECK_EQUAL( result.position, 2u );
   BOOST_CHECK( !result.auto_assigned );
   BOOST_CHECK_EQUAL( result.removed_positions.size(), 2u );
   BOOST_CHECK_EQUAL( oracle.values_drawn(), 1u );

   BOOST_REQUIRE_EQUAL( pool.size(), 2u );
   BOOST_CHECK( pool.at( 0 ) == b );
   BOOST_CHECK( pool.at( 1 ) == c );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( ordered_selection_removes_only_drawn_position, spin_fixture )
{ try {
   entry_pool pool = pool_of( { a, a, b, c } );
   fixed_random_oracle oracle( draws{ 1 } );

   // draw 1 maps through the permutation to position 0
   const spin_result result = spin_engine::select_with_order( pool, { 3, 0, 2, 1 }, oracle );
   BOOST_CHECK( result.winner == a );
   BOOST_CHECK_EQUAL( result.position, 0u );
   BOOST_REQUIRE_EQUAL( result.removed_positions.size(), 1u );
   BOOST_CHECK_EQUAL( result.removed_positions[0], 0u );

   BOOST_REQUIRE_EQUAL( pool.size(), 3u );
   BOOST_CHECK_EQUAL( pool.count( a ), 1u );
   BOOST_CHECK( pool.at( 0 ) == a );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( single_entry_consumes_no_randomness, spin_fixture )
{ try {
   fixed_random_oracle oracle( draws{} );

   entry_pool pool = pool_of( { c } );
   const spin_result random_result = spin_engine::select_random( pool, oracle );
   BOOST_CHECK( random_result.winner == c );
   BOOST_CHECK( random_result.auto_assigned );
   BOOST_CHECK( pool.empty() );

   entry_pool ordered = pool_of( { b } );
   const spin_result ordered_result = spin_engine::select_with_order( ordered, { 0 }, oracle );
   BOOST_CHECK( ordered_result.winner == b );
   BOOST_CHECK( ordered_result.auto_assigned );
   BOOST_CHECK( ordered.empty() );

   BOOST_CHECK_EQUAL( oracle.values_drawn(), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( selection_from_empty_pool_fails, spin_fixture )
{ try {
   fixed_random_oracle oracle( draws{ 0 } );
   entry_pool pool;
   BOOST_CHECK_THROW( spin_engine::select_random( pool, oracle ), no_entries_remaining );
   BOOST_CHECK_THROW( spin_engine::select_with_order( pool, {}, oracle ), no_entries_remaining );
   BOOST_CHECK_EQUAL( oracle.remaining(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( malformed_permutations_are_rejected, spin_fixture )
{ try {
   const entry_pool pool = pool_of( { a, b, c } );

   BOOST_CHECK_THROW( spin_engine::validate_permutation( pool, { 0, 1 } ), invalid_permutation );
   BOOST_CHECK_THROW( spin_engine::validate_permutation( pool, { 0, 1, 2, 0 } ), invalid_permutation );
   BOOST_CHECK_THROW( spin_engine::validate_permutation( pool, { 0, 1, 3 } ), invalid_permutation );
   spin_engine::validate_permutation( pool, { 2, 1, 0 } );

   entry_pool working = pool;
   fixed_random_oracle oracle( draws{ 0 } );
   BOOST_CHECK_THROW( spin_engine::select_with_order( working, { 0, 1, 7 }, oracle ), invalid_permutation );
   BOOST_CHECK_EQUAL( working.size(), 3u );
   BOOST_CHECK_EQUAL( oracle.values_drawn(), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( sha256_oracle_is_deterministic_and_bounded )
{ try {
   sha256_random_oracle first( fc::sha256::hash( std::string( "seed" ) ) );
   sha256_random_oracle second( fc::sha256::hash( std::string( "seed" ) ) );
   sha256_random_oracle other( fc::sha256::hash( std::string( "other seed" ) ) );

   bool diverged = false;
   for( uint64_t bound = 1; bound <= 64; ++bound )
   {
      const uint64_t x = first.next_index( bound );
      BOOST_CHECK_EQUAL( x, second.next_index( bound ) );
      BOOST_CHECK_LT( x, bound );
      if( other.next_index( bound ) != x ) diverged = true;
   }
   BOOST_CHECK( diverged );
   BOOST_CHECK_EQUAL( first.values_drawn(), 64u );

   BOOST_CHECK_THROW( first.next_index( 0 ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( fixed_oracle_replays_values )
{ try {
   fixed_random_oracle oracle( draws{ 4, 0 } );
   BOOST_CHECK_EQUAL( oracle.next_index( 5 ), 4u );
   BOOST_CHECK_EQUAL( oracle.remaining(), 1u );

   // out of range for the bound
   fixed_random_oracle bad( draws{ 9 } );
   BOOST_CHECK_THROW( bad.next_index( 3 ), fc::exception );
   BOOST_CHECK_EQUAL( bad.values_drawn(), 0u );

   BOOST_CHECK_EQUAL( oracle.next_index( 1 ), 0u );
   BOOST_CHECK_THROW( oracle.next_index( 2 ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( addresses_print_with_prefix, spin_fixture )
{ try {
   const std::string text( a );
   BOOST_CHECK_EQUAL( text.substr( 0, std::string( FORTUNE_ADDRESS_PREFIX ).size() ), FORTUNE_ADDRESS_PREFIX );
   BOOST_CHECK( text != std::string( b ) );
   BOOST_CHECK( make_address( "a" ) == a );

   const fc::variant v( a );
   BOOST_CHECK_EQUAL( v.as_string(), text );
} FC_LOG_AND_RETHROW() }
