#include <fortune/engine/events.hpp>

#include <fc/reflect/variant.hpp>

namespace fortune { namespace engine {

   const event_type_enum wheel_created_event::type      = wheel_created_event_type;
   const event_type_enum wheel_drawn_event::type        = wheel_drawn_event_type;
   const event_type_enum prize_claimed_event::type      = prize_claimed_event_type;
   const event_type_enum pool_reclaimed_event::type     = pool_reclaimed_event_type;

   fc::variant wheel_event::to_variant()const
   {
      fc::mutable_variant_object obj;
      obj( "type", (event_type_enum)type );
      switch( (event_type_enum)type )
      {
         case wheel_created_event_type:
            obj( "data", as<wheel_created_event>() );
            break;
         case wheel_drawn_event_type:
            obj( "data", as<wheel_drawn_event>() );
            break;
         case prize_claimed_event_type:
            obj( "data", as<prize_claimed_event>() );
            break;
         case pool_reclaimed_event_type:
            obj( "data", as<pool_reclaimed_event>() );
            break;
         default:
            obj( "data", data );
      }
      return fc::variant( obj );
   }

   void memory_event_log::append( const wheel_event& e )
   {
      _events.push_back( e );
   }

   vector<wheel_event> memory_event_log::events_of_type( event_type_enum t )const
   {
      vector<wheel_event> result;
      for( const auto& e : _events )
      {
         if( (event_type_enum)e.type == t )
            result.push_back( e );
      }
      return result;
   }

   fc::variant memory_event_log::to_variant()const
   {
      vector<fc::variant> result;
      result.reserve( _events.size() );
      for( const auto& e : _events )
         result.push_back( e.to_variant() );
      return fc::variant( result );
   }

} } // fortune::engine
