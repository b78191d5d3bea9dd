#include <fortune/engine/wheel_evaluation_state.hpp>

#include <fc/exception/exception.hpp>

namespace fortune { namespace engine {

   wheel_evaluation_state::wheel_evaluation_state( wheel_database& db, wheel_id_type id )
   :_db(db),_wheel( db.get_wheel( id ) ),_applied(false)
   {
   }

   void wheel_evaluation_state::emit( const wheel_event& e )
   {
      _pending_events.push_back( e );
   }

   void wheel_evaluation_state::apply_changes( event_log* log )
   {
      FC_ASSERT( !_applied, "changes already applied", ("id",_wheel.id) );
      FC_ASSERT( _wheel.winners.size() == _wheel.spun_count );
      FC_ASSERT( _wheel.spin_times.size() == _wheel.spun_count );
      FC_ASSERT( _wheel.spun_count <= _wheel.ledger.prize_count() );

      _db.store_wheel( _wheel );
      _applied = true;

      if( log != nullptr )
      {
         for( const auto& e : _pending_events )
            log->append( e );
      }
      _pending_events.clear();
   }

} } // fortune::engine
