#ifndef __rdbscan__rdb_int_h__
#define __rdbscan__rdb_int_h__

#include <stdint.h>
#include <string.h>

#ifdef _MSC_VER
#define rdb_int_bswap16( x ) _byteswap_ushort( x )
#define rdb_int_bswap32( x ) _byteswap_ulong( x )
#define rdb_int_bswap64( x ) _byteswap_uint64( x )
#else
#define rdb_int_bswap16( x ) __builtin_bswap16( x )
#define rdb_int_bswap32( x ) __builtin_bswap32( x )
#define rdb_int_bswap64( x ) __builtin_bswap64( x )
#endif
#ifdef __cplusplus

namespace rdbscan {

template<bool swp> inline void endian_read( const void *p,  uint16_t &i ) {
  ::memcpy( &i, p, sizeof( uint16_t ) );
  if ( swp ) i = rdb_int_bswap16( i );
}
template<bool swp> inline void endian_read( const void *p,  uint32_t &i ) {
  ::memcpy( &i, p, sizeof( uint32_t ) );
  if ( swp ) i = rdb_int_bswap32( i );
}
template<bool swp> inline void endian_read( const void *p,  uint64_t &i ) {
  ::memcpy( &i, p, sizeof( uint64_t ) );
  if ( swp ) i = rdb_int_bswap64( i );
}
/* le = little endian, the dump trailer, timestamps and packed containers */
template<class Int> inline Int le( const void *p ) {
  Int i;
#ifdef MACH_IS_BIG_ENDIAN
  endian_read<true>( p, i );
#else
  endian_read<false>( p, i );
#endif
  return i;
}
/* be = big endian, the 14/32/64 bit lengths and stream ids */
template<class Int> inline Int be( const void *p ) {
  Int i;
#ifdef MACH_IS_BIG_ENDIAN
  endian_read<false>( p, i );
#else
  endian_read<true>( p, i );
#endif
  return i;
}

/* signed little endian immediates, sign extended to 64 bits */
static inline int64_t s8( const void *p ) {
  return (int64_t) *(const int8_t *) p;
}
static inline int64_t s16( const void *p ) {
  return (int64_t) (int16_t) le<uint16_t>( p );
}
static inline int64_t s24( const void *p ) {
  const uint8_t * b = (const uint8_t *) p;
  int32_t v = (int32_t) ( (uint32_t) b[ 0 ] | ( (uint32_t) b[ 1 ] << 8 ) |
                          ( (uint32_t) b[ 2 ] << 16 ) );
  if ( ( v & 0x800000 ) != 0 ) /* sign bit of 24 */
    v -= 0x1000000;
  return (int64_t) v;
}
static inline int64_t s32( const void *p ) {
  return (int64_t) (int32_t) le<uint32_t>( p );
}
static inline int64_t s64( const void *p ) {
  return (int64_t) le<uint64_t>( p );
}

} // namespace
#endif
#endif
