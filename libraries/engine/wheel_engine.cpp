#include <fortune/engine/claim_window.hpp>
#include <fortune/engine/exceptions.hpp>
#include <fortune/engine/wheel_engine.hpp>
#include <fortune/engine/wheel_evaluation_state.hpp>

#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>

namespace fortune { namespace engine {

wheel_engine::wheel_engine( const wheel_database_ptr& db,
                            const event_log_ptr& log,
                            const version_gate& gate )
:_db(db),_log(log),_gate(gate)
{
   FC_ASSERT( _db, "wheel engine requires a database" );
}

wheel_engine::~wheel_engine()
{
}

void wheel_engine::check_version()const
{
   const uint32_t version = _gate.version;
   const uint32_t current_version = FORTUNE_ENGINE_VERSION;
   if( version != current_version )
      FC_CAPTURE_AND_THROW( outdated_version, (version)(current_version) );
}

void wheel_engine::check_organizer( const wheel_record& rec, const address& caller )const
{
   if( caller != rec.organizer )
      FC_CAPTURE_AND_THROW( not_organizer, (caller)(rec.organizer) );
}

void wheel_engine::check_not_cancelled( const wheel_record& rec )const
{
   if( rec.is_cancelled )
      FC_CAPTURE_AND_THROW( wheel_cancelled, (rec.id) );
}

void wheel_engine::check_configurable( const wheel_record& rec )const
{
   check_not_cancelled( rec );
   if( rec.spun_count != 0 )
      FC_CAPTURE_AND_THROW( draws_started, (rec.id)(rec.spun_count) );
}

void wheel_engine::check_drawable( const wheel_record& rec )const
{
   check_not_cancelled( rec );
   if( rec.is_exhausted() )
      FC_CAPTURE_AND_THROW( wheel_exhausted, (rec.id)(rec.spun_count) );
   if( rec.entries.empty() )
      FC_CAPTURE_AND_THROW( no_entries_remaining, (rec.id)(rec.spun_count) );
   rec.ledger.check_sufficiency();
}

void wheel_engine::record_draw( wheel_evaluation_state& state, const spin_result& result,
                                const fc::time_point now )const
{
   wheel_record& rec = state.wheel();
   const prize_index_type prize_index = prize_index_type( rec.spun_count );

   rec.winners.push_back( winner_record( result.winner, prize_index ) );
   rec.spin_times.push_back( now );
   ++rec.spun_count;

   wheel_drawn_event drawn;
   drawn.wheel_id    = rec.id;
   drawn.winner      = result.winner;
   drawn.prize_index = prize_index;
   state.emit( drawn );
}

bool wheel_engine::can_auto_assign( const wheel_record& rec )const
{
   return !rec.is_cancelled
       && rec.draws_remaining() == 1
       && rec.entries.singleton().valid();
}

address wheel_engine::assign_last( wheel_evaluation_state& state, const fc::time_point now )const
{
   wheel_record& rec = state.wheel();
   check_not_cancelled( rec );

   const uint64_t draws_remaining = rec.draws_remaining();
   if( draws_remaining != 1 )
      FC_CAPTURE_AND_THROW( auto_assign_unavailable, (rec.id)(draws_remaining) );
   if( rec.entries.empty() )
      FC_CAPTURE_AND_THROW( no_entries_remaining, (rec.id) );
   const uint64_t unique_entries = rec.entries.unique_count();
   if( unique_entries != 1 )
      FC_CAPTURE_AND_THROW( auto_assign_unavailable, (rec.id)(unique_entries) );
   rec.ledger.check_sufficiency();

   spin_result result;
   result.position = 0;
   result.auto_assigned = true;
   for( uint32_t i = 0; i < rec.entries.size(); ++i )
      result.removed_positions.push_back( i );
   result.winner = *rec.entries.auto_pop_if_singleton();

   record_draw( state, result, now );
   return result.winner;
}

wheel_id_type wheel_engine::create_wheel( const address& organizer,
                                          const vector<address>& entries,
                                          const vector<share_type>& prize_amounts,
                                          uint64_t delay_ms,
                                          uint64_t claim_window_ms,
                                          asset_id_type pool_asset_id )
{ try {
   check_version();

   prize_ledger::validate_prizes( prize_amounts );
   claim_window_policy::validate_delay( delay_ms );

   wheel_record rec;
   rec.organizer = organizer;
   rec.entries.replace( entries, prize_amounts.size() );
   rec.ledger = prize_ledger( pool_asset_id );
   rec.ledger.prize_amounts = prize_amounts;
   rec.delay_ms = delay_ms;
   rec.claim_window_ms = claim_window_policy::normalize_claim_window( claim_window_ms );

   const wheel_id_type id = _db->insert_wheel( rec );

   wheel_created_event created;
   created.wheel_id  = id;
   created.organizer = organizer;
   if( _log ) _log->append( created );

   ilog( "created wheel ${id} for ${o} with ${e} entries and ${p} prizes",
         ("id",id)("o",organizer)("e",uint64_t(entries.size()))("p",uint64_t(prize_amounts.size())) );
   return id;
} FC_CAPTURE_AND_RETHROW( (organizer)(entries)(prize_amounts)(delay_ms)(claim_window_ms)(pool_asset_id) ) }

void wheel_engine::donate( wheel_id_type id, const address& caller, const asset& amount )
{ try {
   check_version();
   wheel_evaluation_state state( *_db, id );
   wheel_record& rec = state.wheel();

   check_organizer( rec, caller );
   check_not_cancelled( rec );

   if( amount.asset_id != rec.pool_asset_id() )
      FC_CAPTURE_AND_THROW( asset_type_mismatch, (amount)(rec.ledger.pool) );
   rec.ledger.donate( amount );

   state.apply_changes( _log.get() );
   ilog( "wheel ${id} received ${a}, pool is ${p}", ("id",id)("a",amount)("p",rec.ledger.pool) );
} FC_CAPTURE_AND_RETHROW( (id)(caller)(amount) ) }

void wheel_engine::update_entries( wheel_id_type id, const address& caller, const vector<address>& entries )
{ try {
   check_version();
   wheel_evaluation_state state( *_db, id );
   wheel_record& rec = state.wheel();

   check_organizer( rec, caller );
   check_configurable( rec );

   rec.entries.replace( entries, rec.draws_remaining() );

   state.apply_changes( _log.get() );
   ilog( "wheel ${id} entries replaced, ${n} entries", ("id",id)("n",uint64_t(entries.size())) );
} FC_CAPTURE_AND_RETHROW( (id)(caller)(entries) ) }

void wheel_engine::update_prizes( wheel_id_type id, const address& caller, const vector<share_type>& prize_amounts )
{ try {
   check_version();
   wheel_evaluation_state state( *_db, id );
   wheel_record& rec = state.wheel();

   check_organizer( rec, caller );
   check_configurable( rec );

   prize_ledger::validate_prizes( prize_amounts );
   const uint64_t unique_count = rec.entries.unique_count();
   const uint64_t prize_count = prize_amounts.size();
   if( unique_count < prize_count )
      FC_CAPTURE_AND_THROW( insufficient_unique_entries, (unique_count)(prize_count) );

   rec.ledger.replace_prizes( prize_amounts, rec.winners, rec.spin_times );

   state.apply_changes( _log.get() );
   ilog( "wheel ${id} prizes replaced, total ${t}", ("id",id)("t",rec.ledger.total_prizes()) );
} FC_CAPTURE_AND_RETHROW( (id)(caller)(prize_amounts) ) }

void wheel_engine::update_delay( wheel_id_type id, const address& caller, uint64_t delay_ms )
{ try {
   check_version();
   wheel_evaluation_state state( *_db, id );
   wheel_record& rec = state.wheel();

   check_organizer( rec, caller );
   check_configurable( rec );
   claim_window_policy::validate_delay( delay_ms );

   rec.delay_ms = delay_ms;

   state.apply_changes( _log.get() );
   ilog( "wheel ${id} delay set to ${d}ms", ("id",id)("d",delay_ms) );
} FC_CAPTURE_AND_RETHROW( (id)(caller)(delay_ms) ) }

void wheel_engine::update_claim_window( wheel_id_type id, const address& caller, uint64_t claim_window_ms )
{ try {
   check_version();
   wheel_evaluation_state state( *_db, id );
   wheel_record& rec = state.wheel();

   check_organizer( rec, caller );
   check_configurable( rec );

   rec.claim_window_ms = claim_window_policy::normalize_claim_window( claim_window_ms );

   state.apply_changes( _log.get() );
   ilog( "wheel ${id} claim window set to ${w}ms", ("id",id)("w",rec.claim_window_ms) );
} FC_CAPTURE_AND_RETHROW( (id)(caller)(claim_window_ms) ) }

address wheel_engine::draw( wheel_id_type id, const address& caller,
                            random_oracle& oracle, const clock_interface& clock )
{ try {
   check_version();
   wheel_evaluation_state state( *_db, id );
   wheel_record& rec = state.wheel();

   check_organizer( rec, caller );
   check_drawable( rec );

   const spin_result result = spin_engine::select_random( rec.entries, oracle );
   record_draw( state, result, clock.now() );

   state.apply_changes( _log.get() );
   ilog( "wheel ${id} prize ${i} drawn for ${w}", ("id",id)("i",rec.spun_count - 1)("w",result.winner) );
   return result.winner;
} FC_CAPTURE_AND_RETHROW( (id)(caller) ) }

address wheel_engine::draw_with_order( wheel_id_type id, const address& caller,
                                       const vector<uint32_t>& permutation,
                                       random_oracle& oracle, const clock_interface& clock )
{ try {
   check_version();
   wheel_evaluation_state state( *_db, id );
   wheel_record& rec = state.wheel();

   check_organizer( rec, caller );
   check_drawable( rec );

   const spin_result result = spin_engine::select_with_order( rec.entries, permutation, oracle );
   record_draw( state, result, clock.now() );

   state.apply_changes( _log.get() );
   ilog( "wheel ${id} prize ${i} drawn in order for ${w}", ("id",id)("i",rec.spun_count - 1)("w",result.winner) );
   return result.winner;
} FC_CAPTURE_AND_RETHROW( (id)(caller)(permutation) ) }

address wheel_engine::auto_assign_last( wheel_id_type id, const address& caller, const clock_interface& clock )
{ try {
   check_version();
   wheel_evaluation_state state( *_db, id );
   wheel_record& rec = state.wheel();

   check_organizer( rec, caller );
   const address winner = assign_last( state, clock.now() );

   state.apply_changes( _log.get() );
   ilog( "wheel ${id} last prize assigned to ${w}", ("id",id)("w",winner) );
   return winner;
} FC_CAPTURE_AND_RETHROW( (id)(caller) ) }

vector<address> wheel_engine::draw_and_auto_assign( wheel_id_type id, const address& caller,
                                                    random_oracle& oracle, const clock_interface& clock )
{ try {
   check_version();
   wheel_evaluation_state state( *_db, id );
   wheel_record& rec = state.wheel();

   check_organizer( rec, caller );
   check_drawable( rec );

   const fc::time_point now = clock.now();
   vector<address> winners;

   const spin_result result = spin_engine::select_random( rec.entries, oracle );
   record_draw( state, result, now );
   winners.push_back( result.winner );

   if( can_auto_assign( rec ) )
      winners.push_back( assign_last( state, now ) );

   state.apply_changes( _log.get() );
   ilog( "wheel ${id} drew ${w}, ${n} prizes drawn", ("id",id)("w",winners)("n",rec.spun_count) );
   return winners;
} FC_CAPTURE_AND_RETHROW( (id)(caller) ) }

vector<address> wheel_engine::draw_with_order_and_auto_assign( wheel_id_type id, const address& caller,
                                                               const vector<uint32_t>& permutation,
                                                               random_oracle& oracle, const clock_interface& clock )
{ try {
   check_version();
   wheel_evaluation_state state( *_db, id );
   wheel_record& rec = state.wheel();

   check_organizer( rec, caller );
   check_drawable( rec );

   const fc::time_point now = clock.now();
   vector<address> winners;

   const spin_result result = spin_engine::select_with_order( rec.entries, permutation, oracle );
   record_draw( state, result, now );
   winners.push_back( result.winner );

   if( can_auto_assign( rec ) )
      winners.push_back( assign_last( state, now ) );

   state.apply_changes( _log.get() );
   ilog( "wheel ${id} drew ${w} in order, ${n} prizes drawn", ("id",id)("w",winners)("n",rec.spun_count) );
   return winners;
} FC_CAPTURE_AND_RETHROW( (id)(caller)(permutation) ) }

asset wheel_engine::claim( wheel_id_type id, const address& caller, const clock_interface& clock )
{ try {
   check_version();
   wheel_evaluation_state state( *_db, id );
   wheel_record& rec = state.wheel();

   check_not_cancelled( rec );

   if( rec.prize_indexes_won_by( caller ).empty() )
      FC_CAPTURE_AND_THROW( not_a_winner, (id)(caller) );

   const vector<prize_index_type> unclaimed = rec.unclaimed_prize_indexes( caller );
   if( unclaimed.empty() )
      FC_CAPTURE_AND_THROW( no_unclaimed_prize, (id)(caller) );

   const fc::time_point now = clock.now();
   optional<prize_index_type> claimable;
   for( const auto idx : unclaimed )
   {
      if( claim_window_policy::can_claim( now, rec.spin_times[idx], rec.delay_ms, rec.claim_window_ms ) )
      {
         claimable = idx;
         break;
      }
   }
   if( !claimable.valid() )
   {
      claim_window_policy::check_claim( now, rec.spin_times[unclaimed.front()], rec.delay_ms, rec.claim_window_ms );
      FC_ASSERT( false, "claim window check accepted a prize outside its window" );
   }

   const asset payout = rec.ledger.settle_claim( *claimable, caller, rec.winners );

   prize_claimed_event claimed;
   claimed.wheel_id = id;
   claimed.winner   = caller;
   claimed.amount   = payout;
   state.emit( claimed );

   state.apply_changes( _log.get() );
   ilog( "wheel ${id} prize ${i} of ${a} claimed by ${w}", ("id",id)("i",*claimable)("a",payout)("w",caller) );
   return payout;
} FC_CAPTURE_AND_RETHROW( (id)(caller) ) }

asset wheel_engine::reclaim( wheel_id_type id, const address& caller, const clock_interface& clock )
{ try {
   check_version();
   wheel_evaluation_state state( *_db, id );
   wheel_record& rec = state.wheel();

   check_organizer( rec, caller );
   check_not_cancelled( rec );
   if( !rec.is_exhausted() )
      FC_CAPTURE_AND_THROW( wheel_not_exhausted, (id)(rec.spun_count)(rec.ledger.prize_count()) );

   claim_window_policy::check_reclaim( clock.now(), rec.max_spin_time(), rec.delay_ms, rec.claim_window_ms );
   const asset remainder = rec.ledger.reclaim_remainder();

   pool_reclaimed_event reclaimed;
   reclaimed.wheel_id = id;
   reclaimed.amount   = remainder;
   state.emit( reclaimed );

   state.apply_changes( _log.get() );
   ilog( "wheel ${id} organizer reclaimed ${a}", ("id",id)("a",remainder) );
   return remainder;
} FC_CAPTURE_AND_RETHROW( (id)(caller) ) }

optional<asset> wheel_engine::cancel_and_reclaim( wheel_id_type id, const address& caller )
{ try {
   check_version();
   wheel_evaluation_state state( *_db, id );
   wheel_record& rec = state.wheel();

   check_organizer( rec, caller );
   check_configurable( rec );

   rec.is_cancelled = true;

   optional<asset> returned;
   if( rec.ledger.pool.amount > 0 )
   {
      returned = rec.ledger.reclaim_remainder();

      pool_reclaimed_event reclaimed;
      reclaimed.wheel_id = id;
      reclaimed.amount   = *returned;
      state.emit( reclaimed );
   }

   state.apply_changes( _log.get() );
   ilog( "wheel ${id} cancelled, returned ${a}", ("id",id)("a",returned) );
   return returned;
} FC_CAPTURE_AND_RETHROW( (id)(caller) ) }

wheel_record wheel_engine::get_wheel( wheel_id_type id )const
{
   return _db->get_wheel( id );
}

} } // fortune::engine
