#include <stdio.h>
#include <string.h>
#include <stdint.h>
#include <stdlib.h>
#define __STDC_FORMAT_MACROS
#include <inttypes.h>
extern "C" {
#include <lzf.h>
}
#include <rdbscan/rdb_int.h>
#include <rdbscan/rdb_decode.h>

using namespace rdbscan;

size_t
rdbscan::rdb_lzf_decompress( const void *in,  size_t in_len,  void *out,
                             size_t out_len,  void * ) noexcept
{
  if ( in_len > 0xffffffffU || out_len > 0xffffffffU )
    return 0;
  return lzf_decompress( in, (unsigned int) in_len, out,
                         (unsigned int) out_len );
}

RdbErrCode
RdbLength::decode( RdbCursor &cur ) noexcept
{
  const uint8_t * b;
  uint8_t         c;

  this->off  = cur.offset;
  this->len  = this->zlen = 0;
  this->ival = 0;
  this->kind = RDB_LEN_PLAIN;
  if ( (b = cur.incr( 1 )) == NULL )
    return cur.err;
  c = b[ 0 ];

  switch ( length_encoding( c ) ) {
    case RDB_LEN_6: /* 6 bit number */
      this->len = c & 0x3f;
      return RDB_OK;

    case RDB_LEN_14: /* 14 bit number (big endian) */
      if ( (b = cur.incr( 1 )) == NULL )
        return cur.err;
      this->len = ( (uint64_t) ( c & 0x3f ) << 8 ) | b[ 0 ];
      return RDB_OK;

    case RDB_LEN_32: /* 32 bit */
      if ( (b = cur.incr( 4 )) == NULL )
        return cur.err;
      this->len = be<uint32_t>( b );
      return RDB_OK;

    case RDB_LEN_64: /* 64 bit */
      if ( (b = cur.incr( 8 )) == NULL )
        return cur.err;
      this->len = be<uint64_t>( b );
      return RDB_OK;

    case RDB_LZF: { /* lzf <zlen> <len> */
      RdbLength  sz;
      RdbErrCode err;
      /* both must be lengths, can't be immediate or lzf again */
      if ( (err = sz.decode( cur )) != RDB_OK )
        return err;
      if ( sz.kind != RDB_LEN_PLAIN )
        return cur.fail( RDB_ERR_LEN, sz.off );
      this->zlen = sz.len;
      if ( (err = sz.decode( cur )) != RDB_OK )
        return err;
      if ( sz.kind != RDB_LEN_PLAIN )
        return cur.fail( RDB_ERR_LEN, sz.off );
      this->len  = sz.len;
      this->kind = RDB_LEN_LZF;
      return RDB_OK;
    }
    case RDB_INT8: /* int8 */
      if ( (b = cur.incr( 1 )) == NULL )
        return cur.err;
      this->ival = s8( b );
      this->kind = RDB_LEN_INT;
      return RDB_OK;

    case RDB_INT16: /* int16 */
      if ( (b = cur.incr( 2 )) == NULL )
        return cur.err;
      this->ival = s16( b );
      this->kind = RDB_LEN_INT;
      return RDB_OK;

    case RDB_INT32: /* int32 */
      if ( (b = cur.incr( 4 )) == NULL )
        return cur.err;
      this->ival = s32( b );
      this->kind = RDB_LEN_INT;
      return RDB_OK;

    case RDB_LEN_ERR:
      break;
  }
  return cur.fail( RDB_ERR_LEN, this->off );
}

RdbErrCode
RdbLength::consume( RdbCursor &cur,  const RdbDecompress &dz,
                    std::string &str ) const
{
  const uint8_t * b;

  switch ( this->kind ) {
    case RDB_LEN_INT: { /* integer saved as a string */
      char buf[ 24 ];
      int  n = ::snprintf( buf, sizeof( buf ), "%" PRId64, this->ival );
      str.assign( buf, (size_t) n );
      return RDB_OK;
    }
    case RDB_LEN_LZF: {
      if ( this->zlen > (uint64_t) SIZE_MAX )
        return cur.fail( RDB_ERR_TRUNC, cur.offset );
      if ( (b = cur.incr( (size_t) this->zlen )) == NULL )
        return cur.err;
      /* len > zlen * max_ratio + 64 */
      if ( dz.max_ratio != 0 && this->len > 64 &&
           ( this->len - 65 ) / dz.max_ratio >= this->zlen )
        return cur.fail( RDB_ERR_LZF, this->off );
      str.resize( (size_t) this->len );
      size_t n = dz.fn( b, (size_t) this->zlen, &str[ 0 ], (size_t) this->len,
                        dz.closure );
      if ( n != this->len ) {
        str.clear();
        return cur.fail( RDB_ERR_LZF, this->off );
      }
      return RDB_OK;
    }
    case RDB_LEN_PLAIN:
      break;
  }
  if ( this->len > (uint64_t) SIZE_MAX )
    return cur.fail( RDB_ERR_TRUNC, cur.offset );
  if ( (b = cur.incr( (size_t) this->len )) == NULL )
    return cur.err;
  str.assign( (const char *) b, (size_t) this->len );
  return RDB_OK;
}

const char *
rdbscan::rdb_err_description( RdbErrCode err ) noexcept
{
  switch ( err ) {
    case RDB_OK:           return "ok";
    case RDB_EOF_MARK:     return "eof";
    case RDB_ERR_OUTPUT:   return "Decoder already used";
    case RDB_ERR_TRUNC:    return "Input truncated";
    case RDB_ERR_VERSION:  return "Rdb version not supported";
    case RDB_ERR_CRC:      return "Crc does not match";
    case RDB_ERR_TYPE:     return "Error unknown type";
    case RDB_ERR_HDR:      return "Error parsing header";
    case RDB_ERR_LZF:      return "Bad LZF compression";
    case RDB_ERR_LEN:      return "Bad length encoding";
    case RDB_ERR_META:     return "Key meta data without a key";
    case RDB_ERR_ENCODING: return "Corrupt packed encoding";
    case RDB_ERR_ALLOC:    return "Out of memory";
  }
  return "unknown";
}
