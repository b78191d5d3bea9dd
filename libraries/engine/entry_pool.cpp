#include <fortune/engine/config.hpp>
#include <fortune/engine/entry_pool.hpp>
#include <fortune/engine/exceptions.hpp>

#include <fc/reflect/variant.hpp>

#include <algorithm>

namespace fortune { namespace engine {

   void entry_pool::validate( const vector<address>& new_entries, uint64_t prizes_to_draw )
   {
      const uint64_t entry_count = new_entries.size();
      if( entry_count < FORTUNE_MIN_ENTRIES || entry_count > FORTUNE_MAX_ENTRIES )
         FC_CAPTURE_AND_THROW( invalid_entry_count, (entry_count) );

      const uint64_t unique_count = set<address>( new_entries.begin(), new_entries.end() ).size();
      if( unique_count < prizes_to_draw )
         FC_CAPTURE_AND_THROW( insufficient_unique_entries, (unique_count)(prizes_to_draw) );
   }

   void entry_pool::replace( const vector<address>& new_entries, uint64_t prizes_to_draw )
   {
      validate( new_entries, prizes_to_draw );
      entries = new_entries;
   }

   vector<uint32_t> entry_pool::remove_by_value( const address& a )
   {
      vector<uint32_t> removed;
      for( uint32_t i = 0; i < entries.size(); ++i )
      {
         if( entries[i] == a )
            removed.push_back( i );
      }
      entries.erase( std::remove( entries.begin(), entries.end(), a ), entries.end() );
      return removed;
   }

   address entry_pool::remove_by_position( uint32_t idx )
   {
      const address removed = at( idx );
      entries.erase( entries.begin() + idx );
      return removed;
   }

   optional<address> entry_pool::singleton()const
   {
      if( entries.empty() )
         return optional<address>();
      const address& first = entries.front();
      for( const auto& a : entries )
      {
         if( a != first )
            return optional<address>();
      }
      return first;
   }

   optional<address> entry_pool::auto_pop_if_singleton()
   {
      const optional<address> only = singleton();
      if( only.valid() )
         entries.clear();
      return only;
   }

   const address& entry_pool::at( uint32_t idx )const
   {
      FC_ASSERT( idx < entries.size(), "entry position out of range", ("idx",idx)("size",uint64_t(entries.size())) );
      return entries[idx];
   }

   size_t entry_pool::unique_count()const
   {
      return set<address>( entries.begin(), entries.end() ).size();
   }

   size_t entry_pool::count( const address& a )const
   {
      return std::count( entries.begin(), entries.end(), a );
   }

} } // fortune::engine
