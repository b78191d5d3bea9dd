#pragma once

#include <fortune/engine/address.hpp>
#include <fortune/engine/types.hpp>

namespace fortune { namespace engine {

   /**
    *  The ordered sequence of participant addresses still eligible to win.
    *  An address may appear more than once; each occurrence is one chance.
    */
   struct entry_pool
   {
      entry_pool(){}

      /**
       *  Throws invalid_entry_count unless the size is within
       *  [FORTUNE_MIN_ENTRIES, FORTUNE_MAX_ENTRIES] and
       *  insufficient_unique_entries unless there are at least
       *  prizes_to_draw distinct addresses.
       */
      static void         validate( const vector<address>& new_entries, uint64_t prizes_to_draw );

      /** validates and then replaces every entry */
      void                replace( const vector<address>& new_entries, uint64_t prizes_to_draw );

      /**
       *  Removes every occurrence of a, so the same address cannot be drawn
       *  again.  @return the positions removed, in ascending order
       */
      vector<uint32_t>    remove_by_value( const address& a );

      /**
       *  Removes exactly the occurrence at idx.  Other occurrences of the same
       *  address stay eligible.
       */
      address             remove_by_position( uint32_t idx );

      /**
       *  When every remaining entry is the same address, removes all of them
       *  and returns that address without consuming randomness.
       */
      optional<address>   auto_pop_if_singleton();

      /** the only address left, if the remaining entries are all the same address */
      optional<address>   singleton()const;

      const address&      at( uint32_t idx )const;
      size_t              size()const          { return entries.size(); }
      bool                empty()const         { return entries.empty(); }
      size_t              unique_count()const;
      size_t              count( const address& a )const;

      vector<address>     entries;
   };

} } // fortune::engine

FC_REFLECT( fortune::engine::entry_pool, (entries) )
