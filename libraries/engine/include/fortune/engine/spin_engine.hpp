#pragma once

#include <fortune/engine/entry_pool.hpp>
#include <fortune/engine/random_oracle.hpp>

namespace fortune { namespace engine {

   struct spin_result
   {
      spin_result():position(0),auto_assigned(false){}

      address           winner;
      /** position in the entry pool the winner was read from */
      uint32_t          position;
      /** positions removed from the entry pool, relative to the pool before the spin */
      vector<uint32_t>  removed_positions;
      /** true when the winner was the only entry and no randomness was consumed */
      bool              auto_assigned;
   };

   /**
    *  Winner selection.  The two strategies differ in what they remove:
    *
    *  select_random removes the winner by value, so an address that won
    *  can never win again.
    *
    *  select_with_order removes only the drawn position, so other
    *  occurrences of the winning address remain eligible.
    *
    *  Each strategy asks the oracle for exactly one value, or none when a
    *  single entry is left.
    */
   class spin_engine
   {
      public:
         static spin_result  select_random( entry_pool& pool, random_oracle& oracle );

         /**
          *  Draws r in [0, size) and selects the entry at permutation[r].  The
          *  permutation lets the caller shuffle the draw order ahead of time
          *  while the entropy is still consumed here.
          */
         static spin_result  select_with_order( entry_pool& pool,
                                                const vector<uint32_t>& permutation,
                                                random_oracle& oracle );

         /**
          *  Throws invalid_permutation unless the permutation has one element per
          *  entry and every element is a valid position.
          */
         static void         validate_permutation( const entry_pool& pool, const vector<uint32_t>& permutation );
   };

} } // fortune::engine

FC_REFLECT( fortune::engine::spin_result, (winner)(position)(removed_positions)(auto_assigned) )
