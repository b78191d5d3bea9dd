#include <fortune/engine/exceptions.hpp>
#include <fortune/engine/spin_engine.hpp>

#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>

namespace fortune { namespace engine {

   spin_result spin_engine::select_random( entry_pool& pool, random_oracle& oracle )
   {
      const uint64_t entry_count = pool.size();
      if( entry_count == 0 )
         FC_CAPTURE_AND_THROW( no_entries_remaining, (entry_count) );

      spin_result result;
      if( entry_count == 1 )
      {
         result.position = 0;
         result.auto_assigned = true;
      }
      else
      {
         result.position = uint32_t( oracle.next_index( entry_count ) );
      }

      result.winner = pool.at( result.position );
      result.removed_positions = pool.remove_by_value( result.winner );

      dlog( "random spin picked ${w} at ${p} of ${n}, removed ${r}",
            ("w",result.winner)("p",result.position)("n",entry_count)("r",result.removed_positions) );
      return result;
   }

   spin_result spin_engine::select_with_order( entry_pool& pool,
                                               const vector<uint32_t>& permutation,
                                               random_oracle& oracle )
   {
      const uint64_t entry_count = pool.size();
      if( entry_count == 0 )
         FC_CAPTURE_AND_THROW( no_entries_remaining, (entry_count) );

      validate_permutation( pool, permutation );

      spin_result result;
      uint64_t draw = 0;
      if( entry_count == 1 )
         result.auto_assigned = true;
      else
         draw = oracle.next_index( entry_count );

      result.position = permutation[draw];
      result.winner = pool.remove_by_position( result.position );
      result.removed_positions.push_back( result.position );

      dlog( "ordered spin drew ${d}, mapped to ${p} of ${n}, picked ${w}",
            ("d",draw)("p",result.position)("n",entry_count)("w",result.winner) );
      return result;
   }

   void spin_engine::validate_permutation( const entry_pool& pool, const vector<uint32_t>& permutation )
   {
      const uint64_t entry_count = pool.size();
      const uint64_t permutation_size = permutation.size();
      if( permutation_size != entry_count )
         FC_CAPTURE_AND_THROW( invalid_permutation, (permutation_size)(entry_count) );

      for( uint32_t i = 0; i < permutation.size(); ++i )
      {
         const uint32_t position = permutation[i];
         if( position >= entry_count )
            FC_CAPTURE_AND_THROW( invalid_permutation, (i)(position)(entry_count) );
      }
   }

} } // fortune::engine
