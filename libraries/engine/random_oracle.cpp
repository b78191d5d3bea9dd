#include <fortune/engine/random_oracle.hpp>

#include <fc/exception/exception.hpp>

namespace fortune { namespace engine {

uint64_t random_oracle::next_index( uint64_t bound )
{
   FC_ASSERT( bound > 0, "cannot draw from an empty range" );
   const uint64_t value = generate( bound );
   FC_ASSERT( value < bound, "oracle value out of range", ("value",value)("bound",bound) );
   ++_values_drawn;
   return value;
}

sha256_random_oracle::sha256_random_oracle( const fc::sha256& seed )
:_seed(seed),_counter(0)
{
}

uint64_t sha256_random_oracle::next_word()
{
   fc::sha256::encoder enc;
   enc.write( _seed.data(), _seed.data_size() );
   enc.write( (char*)&_counter, sizeof(_counter) );
   ++_counter;
   return enc.result()._hash[0];
}

uint64_t sha256_random_oracle::generate( uint64_t bound )
{
   // 2^64 mod bound; words below this would favor the low residues
   const uint64_t threshold = (0 - bound) % bound;
   while( true )
   {
      const uint64_t word = next_word();
      if( word >= threshold )
         return word % bound;
   }
}

fixed_random_oracle::fixed_random_oracle( const vector<uint64_t>& values )
:_values(values),_next(0)
{
}

uint64_t fixed_random_oracle::generate( uint64_t bound )
{
   FC_ASSERT( _next < _values.size(), "fixed oracle exhausted" );
   return _values[_next++];
}

} } // fortune::engine
