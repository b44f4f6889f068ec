#ifndef __rdbscan__rdb_pack_h__
#define __rdbscan__rdb_pack_h__

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <rdbscan/rdb_err.h>

#ifdef __cplusplus
namespace rdbscan {

/* one element of a packed list, either a string or an immediate integer
 *
 *         [ next ][ opt data ][ back ]   <- list pack element
 * [ prev ][ next ][ opt data ]           <- zip list element
 *
 * data is null when the element is the integer ival */
struct RdbListValue {
  const uint8_t * data;     /* string bytes, inside the packed blob */
  size_t          data_len; /* string len */
  int64_t         ival;     /* decoded immediate integer */

  RdbListValue() : data( 0 ), data_len( 0 ), ival( 0 ) {}
  bool is_int( void ) const { return this->data == 0; }
  /* a string, an integer as decimal digits */
  void to_str( std::string &s ) const;
  /* a zset score, integers or numeric strings, false if not a number */
  bool to_dbl( double &d ) const;
};

/* zip list structure:
 * hdr:  [ zlbytes * 4 ] [ zltail * 4 ] [ zllen * 2 ]
 * list: [ prev ] [ next ] [ optional data ]
 *       ...
 *       [ 0xff ]
 *
 * prev : < 0xfe 1 byte, 0xfe <32> little endian
 * next : 00pppppp                 6 bit string len
 *        01pppppp qqqqqqqq        14 bit string len (big endian)
 *        10000000 <32>            32 bit string len (big endian)
 *        11000000 <16>            int16
 *        11010000 <32>            int32
 *        11100000 <64>            int64
 *        11110000 <24>            int24
 *        11111110 <8>             int8
 *        1111xxxx                 immediate 0 -> 12, xxxx - 1 */
struct RdbZipList {
  const uint8_t * ptr,   /* the next entry */
                * end;   /* the 0xff terminator */
  uint32_t        zlbytes;
  uint16_t        zllen; /* count of entries, 0xffff if more */

  RdbZipList() : ptr( 0 ), end( 0 ), zlbytes( 0 ), zllen( 0 ) {}
  /* check header and terminator fit in sz */
  bool init( const uint8_t *b,  size_t sz ) noexcept;
  /* RDB_OK with lval, RDB_EOF_MARK at end, RDB_ERR_ENCODING if corrupt */
  RdbErrCode next( RdbListValue &lval ) noexcept;
};

/* list pack structure:
 * hdr:  [ lpbytes * 4 ] [ lplen * 2 ]
 * list: [ next ] [ optional data ] [ back ]
 *       ...
 *       [ 0xff ]
 *
 * the back link encodes the size of next + data, 7 bits per byte */
struct RdbListPack {
  const uint8_t * ptr,   /* the next entry */
                * end;   /* the 0xff terminator */
  uint32_t        lpbytes;
  uint16_t        lplen; /* count of entries, 0xffff if more */

  RdbListPack() : ptr( 0 ), end( 0 ), lpbytes( 0 ), lplen( 0 ) {}
  bool init( const uint8_t *b,  size_t sz ) noexcept;
  RdbErrCode next( RdbListValue &lval ) noexcept;
  /* next, must be an integer */
  RdbErrCode next_ival( int64_t &ival ) noexcept;

  enum ListPackEnc {   /* expanding opcode, ints and strings */
    LP_7BIT_UINT = 0, /* 0.......   7 bits */
    LP_6BIT_STR  = 1, /* 10......   6 bits */
    LP_13BIT_INT = 2, /* 110.....   5 +  8 bits */
    LP_12BIT_STR = 3, /* 1110....   4 +  8 bits */
    LP_32BIT_STR = 4, /* 11110000   x   32 bits */
    LP_16BIT_INT = 5, /* 11110001   x   16 bits */
    LP_24BIT_INT = 6, /* 11110010   x   24 bits */
    LP_32BIT_INT = 7, /* 11110011   x   32 bits */
    LP_64BIT_INT = 8, /* 11110100   x   64 bits */
    LP_END       = 9, /* 11111111 */
    LP_UNUSED    = 10 /* bits 11110101 -> 11111110 not used */
  };
  static ListPackEnc lp_code( uint8_t b ) noexcept;
  /* size of the back link which follows an entry of entry_len */
  static size_t lpback_size( size_t entry_len ) {
    return entry_len < 128 ? 1 : entry_len < 16384 ? 2 :
           entry_len < 2097152 ? 3 : entry_len < 268435456 ? 4 : 5;
  }
};

/* int set structure:
 * [ encoding * 4 ] [ length * 4 ] [ int * length ]
 * encoding is the size of each int, 2, 4, or 8, all little endian */
struct RdbIntSet {
  const uint8_t * ptr;
  uint32_t        enc,
                  len,
                  idx;

  RdbIntSet() : ptr( 0 ), enc( 0 ), len( 0 ), idx( 0 ) {}
  bool init( const uint8_t *b,  size_t sz ) noexcept;
  RdbErrCode next( int64_t &ival ) noexcept;
};

/* zip map structure, the pre 2.6 hash encoding:
 * [ zmlen ] [ len ] [ field ] [ len ] [ free ] [ value ] [ free bytes ] ...
 * [ 0xff ]
 * len : < 254 1 byte, 254 <32> little endian, 255 is the end */
struct RdbZipMap {
  const uint8_t * ptr,
                * end;

  RdbZipMap() : ptr( 0 ), end( 0 ) {}
  bool init( const uint8_t *b,  size_t sz ) noexcept;
  RdbErrCode next( RdbListValue &field,  RdbListValue &val ) noexcept;
  bool zm_len( uint32_t &len ) noexcept;
};

} // namespace
#endif
#endif
