#pragma once

#include <fortune/engine/wheel_record.hpp>

namespace fortune { namespace engine {

/**
 *  In-process home of every wheel record.  The host is expected to serialize
 *  operations against a wheel; nothing here locks.
 */
class wheel_database
{
    public:
        wheel_database();
        ~wheel_database();

        /** assigns the next id to rec and stores it */
        wheel_id_type               insert_wheel( wheel_record rec );
        void                        store_wheel( const wheel_record& rec );

        /** throws unknown_wheel */
        wheel_record                get_wheel( wheel_id_type id )const;
        owheel_record               lookup_wheel( wheel_id_type id )const;
        bool                        has_wheel( wheel_id_type id )const;

        vector<wheel_id_type>       wheels_organized_by( const address& organizer )const;
        size_t                      size()const { return _wheels.size(); }

        fc::variant                 to_variant()const;

    private:
        wheel_id_type                        _next_wheel_id;
        map<wheel_id_type, wheel_record>     _wheels;
};

typedef std::shared_ptr<wheel_database> wheel_database_ptr;

} } // fortune::engine
