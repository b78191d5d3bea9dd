#pragma once

#include <fortune/engine/events.hpp>
#include <fortune/engine/wheel_database.hpp>

namespace fortune { namespace engine {

/**
*  While evaluating an operation every change is made to a private copy of
*  the wheel record and every event is held back.  Only apply_changes()
*  writes the copy to the database and publishes the events, so an
*  operation that throws leaves no trace.
*/
class wheel_evaluation_state
{
    public:
        wheel_evaluation_state( wheel_database& db, wheel_id_type id );

        wheel_record&                  wheel()       { return _wheel; }
        const wheel_record&            wheel()const  { return _wheel; }

        void                           emit( const wheel_event& e );

        void                           apply_changes( event_log* log );

    private:
        wheel_database&                _db;
        wheel_record                   _wheel;
        vector<wheel_event>            _pending_events;
        bool                           _applied;
};

} } // fortune::engine
