#include <stdio.h>
#include <string.h>
#include <stdint.h>
#include <rdbscan/rdb_decode.h>

using namespace rdbscan;

/* crc64 jones slice by 8, from crcspeed
 * (https://github.com/mattsta/crcspeed), Copyright (c) 2014 Matt Stancliff,
 * BSD or Apache 2.0 License, see the upstream source for the full text */

namespace {
/* slice by 8 lookup, built once on first use */
struct JonesTab {
  uint64_t tab[ 8 ][ 256 ];
  JonesTab() { this->init(); }
  void init( void );
};
}

void
JonesTab::init( void )
{
  static const uint64_t POLY = 0xad93d23594c935a9ULL;
  uint64_t crc, val;
  uint8_t  n = 0;
  int      k;

  /* generate CRCs for all single byte sequences */
  do {
    crc = 0;
    for ( uint8_t i = 1; i != 0; i <<= 1 ) {
      k = ( crc & 0x8000000000000000ULL ) != 0;
      if ( ( n & i ) != 0 )
        k = ! k;
      crc <<= 1;
      if ( k )
        crc ^= POLY;
    }
    /* reflect */
    val = crc & 1;
    k   = 64;
    while ( --k != 0 )
      val = ( val << 1 ) | ( ( crc >>= 1 ) & 1 );
    this->tab[ 0 ][ n ] = val;
  } while ( n++ != 255 );
  /* nested tables for 8 bytes at a time */
  n = 0;
  do {
    crc = this->tab[ 0 ][ n ];
    for ( k = 1; k < 8; k++ ) {
      crc = this->tab[ 0 ][ crc & 0xff ] ^ ( crc >> 8 );
      this->tab[ k ][ n ] = crc;
    }
  } while ( n++ != 255 );
#ifdef MACH_IS_BIG_ENDIAN
  n = 0;
  do {
    for ( k = 0; k < 8; k++ )
      this->tab[ k ][ n ] = __builtin_bswap64( this->tab[ k ][ n ] );
  } while ( n++ != 255 );
#endif
}

/* non-inverted crc, the redis rdb trailer is jones_crc64( 0, file, len ) */
uint64_t
rdbscan::jones_crc64( uint64_t crc,  const void *buf,  size_t len ) noexcept
{
  static const JonesTab jones; /* initialized once, thread safe */
  const uint64_t (*tab)[ 256 ] = jones.tab;
  const uint8_t * next = (const uint8_t *) buf;
  uint64_t        w;

#ifdef MACH_IS_BIG_ENDIAN
  crc = __builtin_bswap64( crc );
#define FIRST( X ) ( X >> 56 )
#define LAST( X ) ( X << 8 )
#define ORDER( X ) 7-X
#else
#define FIRST( X ) X
#define LAST( X ) ( X >> 8 )
#define ORDER( X ) X
#endif
  /* bytes until 8 byte aligned */
  while ( len != 0 && ( (uintptr_t) next & 7 ) != 0 ) {
    crc = tab[ 0 ][ ( FIRST( crc ) ^ *next++ ) & 0xff ] ^ LAST( crc );
    len--;
  }
  while ( len >= 8 ) {
    ::memcpy( &w, next, 8 );
    crc ^= w;
    crc = tab[ ORDER( 7 ) ][ crc & 0xff ] ^
          tab[ ORDER( 6 ) ][ ( crc >> 8 ) & 0xff ] ^
          tab[ ORDER( 5 ) ][ ( crc >> 16 ) & 0xff ] ^
          tab[ ORDER( 4 ) ][ ( crc >> 24 ) & 0xff ] ^
          tab[ ORDER( 3 ) ][ ( crc >> 32 ) & 0xff ] ^
          tab[ ORDER( 2 ) ][ ( crc >> 40 ) & 0xff ] ^
          tab[ ORDER( 1 ) ][ ( crc >> 48 ) & 0xff ] ^
          tab[ ORDER( 0 ) ][ crc >> 56 ];
    next += 8;
    len  -= 8;
  }
  /* less than 8 left */
  while ( len != 0 ) {
    crc = tab[ 0 ][ ( FIRST( crc ) ^ *next++ ) & 0xff ] ^ LAST( crc );
    len--;
  }
#undef FIRST
#undef LAST
#undef ORDER
#ifdef MACH_IS_BIG_ENDIAN
  return __builtin_bswap64( crc );
#else
  return crc;
#endif
}
