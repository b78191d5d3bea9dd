#include <fortune/engine/exceptions.hpp>
#include <fortune/engine/wheel_database.hpp>

#include <fc/reflect/variant.hpp>

namespace fortune { namespace engine {

wheel_database::wheel_database()
:_next_wheel_id(1)
{
}

wheel_database::~wheel_database()
{
}

wheel_id_type wheel_database::insert_wheel( wheel_record rec )
{
    rec.id = _next_wheel_id++;
    _wheels[rec.id] = rec;
    return rec.id;
}

void wheel_database::store_wheel( const wheel_record& rec )
{
    FC_ASSERT( has_wheel( rec.id ), "wheel must be inserted before it is stored", ("id",rec.id) );
    _wheels[rec.id] = rec;
}

wheel_record wheel_database::get_wheel( wheel_id_type id )const
{
    const owheel_record rec = lookup_wheel( id );
    if( !rec.valid() )
        FC_CAPTURE_AND_THROW( unknown_wheel, (id) );
    return *rec;
}

owheel_record wheel_database::lookup_wheel( wheel_id_type id )const
{
    auto itr = _wheels.find( id );
    if( itr == _wheels.end() )
        return owheel_record();
    return itr->second;
}

bool wheel_database::has_wheel( wheel_id_type id )const
{
    return _wheels.find( id ) != _wheels.end();
}

vector<wheel_id_type> wheel_database::wheels_organized_by( const address& organizer )const
{
    vector<wheel_id_type> result;
    for( const auto& item : _wheels )
    {
        if( item.second.organizer == organizer )
            result.push_back( item.first );
    }
    return result;
}

fc::variant wheel_database::to_variant()const
{
    vector<fc::variant> result;
    result.reserve( _wheels.size() );
    for( const auto& item : _wheels )
        result.push_back( item.second.to_variant() );
    return fc::variant( result );
}

} } // fortune::engine
