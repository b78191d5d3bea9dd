#pragma once

#include <fortune/engine/types.hpp>

namespace fortune { namespace engine {

   /**
    *  Supplier of unbiased random integers.  The engine asks for at most one
    *  value per operation and never caches or reuses a value across calls.
    */
   class random_oracle
   {
      public:
         random_oracle():_values_drawn(0){}
         virtual ~random_oracle(){}

         /** @return an integer uniformly distributed in [0, bound), bound > 0 */
         uint64_t next_index( uint64_t bound );

         /** number of values handed out so far */
         uint64_t values_drawn()const { return _values_drawn; }

      protected:
         virtual uint64_t generate( uint64_t bound ) = 0;

      private:
         uint64_t _values_drawn;
   };

   /**
    *  Deterministic oracle: value n is taken from sha256( seed || n ), with
    *  draws that fall in the biased tail of the 64 bit range rejected.
    */
   class sha256_random_oracle : public random_oracle
   {
      public:
         explicit sha256_random_oracle( const fc::sha256& seed );

      protected:
         virtual uint64_t generate( uint64_t bound ) override;

      private:
         uint64_t next_word();

         fc::sha256  _seed;
         uint64_t    _counter;
   };

   /** replays a fixed list of values, for tests */
   class fixed_random_oracle : public random_oracle
   {
      public:
         explicit fixed_random_oracle( const vector<uint64_t>& values );

         size_t remaining()const { return _values.size() - _next; }

      protected:
         virtual uint64_t generate( uint64_t bound ) override;

      private:
         vector<uint64_t> _values;
         size_t           _next;
   };

} } // fortune::engine
