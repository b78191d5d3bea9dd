#pragma once

#include <fortune/engine/address.hpp>
#include <fortune/engine/asset.hpp>
#include <fortune/engine/types.hpp>

#include <fc/io/enum_type.hpp>
#include <fc/io/raw.hpp>
#include <fc/reflect/reflect.hpp>

namespace fortune { namespace engine {

// NOTE: values are part of the event log format, do not renumber
enum event_type_enum
{
    null_event_type                     = 0,
    wheel_created_event_type            = 1,
    wheel_drawn_event_type              = 2,
    prize_claimed_event_type            = 3,
    pool_reclaimed_event_type           = 4
};

struct wheel_created_event
{
    static const event_type_enum type;

    wheel_id_type   wheel_id = 0;
    address         organizer;
};

struct wheel_drawn_event
{
    static const event_type_enum type;

    wheel_id_type     wheel_id = 0;
    address           winner;
    prize_index_type  prize_index = 0;
};

struct prize_claimed_event
{
    static const event_type_enum type;

    wheel_id_type   wheel_id = 0;
    address         winner;
    asset           amount;
};

struct pool_reclaimed_event
{
    static const event_type_enum type;

    wheel_id_type   wheel_id = 0;
    asset           amount;
};

/**
*  An informational record published after an operation commits.  The
*  payload is the packed form of one of the event structs above.
*/
struct wheel_event
{
    wheel_event():type(null_event_type){}

    template<typename EventType>
    wheel_event( const EventType& e )
    {
        type = EventType::type;
        data = fc::raw::pack( e );
    }

    template<typename EventType>
    EventType as()const
    {
        FC_ASSERT( (event_type_enum)type == EventType::type, "", ("type",type)("EventType",EventType::type) );
        return fc::raw::unpack<EventType>(data);
    }

    fc::variant to_variant()const;

    fc::enum_type<uint8_t,event_type_enum> type;
    std::vector<char> data;
};

/**
*  Append-only sink for wheel events.  Only events of committed
*  operations are ever appended.
*/
class event_log
{
    public:
        virtual ~event_log(){}

        virtual void append( const wheel_event& e ) = 0;
};
typedef std::shared_ptr<event_log> event_log_ptr;

class memory_event_log : public event_log
{
    public:
        virtual void append( const wheel_event& e ) override;

        const vector<wheel_event>& events()const { return _events; }
        vector<wheel_event>        events_of_type( event_type_enum t )const;

        fc::variant                to_variant()const;

    private:
        vector<wheel_event> _events;
};
typedef std::shared_ptr<memory_event_log> memory_event_log_ptr;

} } // fortune::engine

FC_REFLECT_ENUM( fortune::engine::event_type_enum,
                 (null_event_type)
                 (wheel_created_event_type)
                 (wheel_drawn_event_type)
                 (prize_claimed_event_type)
                 (pool_reclaimed_event_type)
                 )

FC_REFLECT( fortune::engine::wheel_created_event, (wheel_id)(organizer) )
FC_REFLECT( fortune::engine::wheel_drawn_event, (wheel_id)(winner)(prize_index) )
FC_REFLECT( fortune::engine::prize_claimed_event, (wheel_id)(winner)(amount) )
FC_REFLECT( fortune::engine::pool_reclaimed_event, (wheel_id)(amount) )
FC_REFLECT( fortune::engine::wheel_event, (type)(data) )
