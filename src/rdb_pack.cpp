#include <stdio.h>
#include <string.h>
#include <stdint.h>
#include <stdlib.h>
#define __STDC_FORMAT_MACROS
#include <inttypes.h>
#include <rdbscan/rdb_int.h>
#include <rdbscan/rdb_pack.h>

using namespace rdbscan;

void
RdbListValue::to_str( std::string &s ) const
{
  if ( this->data != NULL ) {
    s.assign( (const char *) this->data, this->data_len );
  }
  else {
    char buf[ 24 ];
    int  n = ::snprintf( buf, sizeof( buf ), "%" PRId64, this->ival );
    s.assign( buf, (size_t) n );
  }
}

bool
RdbListValue::to_dbl( double &d ) const
{
  if ( this->data == NULL ) {
    d = (double) this->ival;
    return true;
  }
  char   buf[ 128 ], * e;
  size_t len = this->data_len;
  if ( len == 0 || len >= sizeof( buf ) )
    return false;
  ::memcpy( buf, this->data, len );
  buf[ len ] = '\0';
  d = ::strtod( buf, &e );
  return e == &buf[ len ];
}

bool
RdbZipList::init( const uint8_t *b,  size_t sz ) noexcept
{
  /* header is [ zlbytes * 4 ][ zltail * 4 ][ zllen * 2 ] */
  if ( sz < 11 )
    return false;
  this->zlbytes = le<uint32_t>( b );
  this->zllen   = le<uint16_t>( &b[ 8 ] );
  if ( this->zlbytes < 11 || this->zlbytes > sz ||
       b[ this->zlbytes - 1 ] != 0xff )
    return false;
  this->ptr = &b[ 10 ];
  this->end = &b[ this->zlbytes - 1 ];
  return true;
}

/* ptr -> [ prev ][ next ][ data ][ prev-2 ] ...
 * if returns RDB_OK, then
 * ptr -> [ prev-2 ] */
RdbErrCode
RdbZipList::next( RdbListValue &lval ) noexcept
{
  const uint8_t * p = this->ptr;
  size_t          avail, hdr, dlen = 0;
  uint8_t         n;

  lval.data     = NULL;
  lval.data_len = 0;
  lval.ival     = 0;
  if ( p >= this->end )
    return RDB_EOF_MARK;
  /* skip over previous length */
  if ( p[ 0 ] == 0xfe )
    p = &p[ 5 ];
  else if ( p[ 0 ] == 0xff )
    return RDB_ERR_ENCODING;
  else
    p = &p[ 1 ];
  if ( p >= this->end )
    return RDB_ERR_ENCODING;
  avail = this->end - p;
  n     = p[ 0 ];

  /* size of the next link */
  switch ( n & 0xc0 ) {
    case 0x00: hdr = 1; break;  /* 00pppppp */
    case 0x40: hdr = 2; break;  /* 01pppppp qqqqqqqq */
    case 0x80:                  /* 10000000 <32> */
      if ( n != 0x80 )
        return RDB_ERR_ENCODING;
      hdr = 5;
      break;
    default:
      switch ( n ) {
        case 0xc0: hdr = 3; break; /* int16 */
        case 0xd0: hdr = 5; break; /* int32 */
        case 0xe0: hdr = 9; break; /* int64 */
        case 0xf0: hdr = 4; break; /* int24 */
        case 0xfe: hdr = 2; break; /* int8 */
        default:
          if ( n < 0xf1 || n > 0xfd )
            return RDB_ERR_ENCODING;
          hdr = 1;                 /* 1111xxxx */
          break;
      }
      break;
  }
  if ( hdr > avail )
    return RDB_ERR_ENCODING;

  switch ( n & 0xc0 ) {
    case 0x00: dlen = n & 0x3f; break;
    case 0x40: dlen = ( (size_t) ( n & 0x3f ) << 8 ) | p[ 1 ]; break;
    case 0x80: dlen = be<uint32_t>( &p[ 1 ] ); break;
    default:   /* immediate integer, no data */
      switch ( n ) {
        case 0xc0: lval.ival = s16( &p[ 1 ] ); break;
        case 0xd0: lval.ival = s32( &p[ 1 ] ); break;
        case 0xe0: lval.ival = s64( &p[ 1 ] ); break;
        case 0xf0: lval.ival = s24( &p[ 1 ] ); break;
        case 0xfe: lval.ival = s8( &p[ 1 ] ); break;
        default:   lval.ival = ( n & 0xf ) - 1; break;
      }
      this->ptr = &p[ hdr ];
      return RDB_OK;
  }
  if ( dlen > avail - hdr )
    return RDB_ERR_ENCODING;
  lval.data     = &p[ hdr ];
  lval.data_len = dlen;
  this->ptr     = &p[ hdr + dlen ];
  return RDB_OK;
}

bool
RdbListPack::init( const uint8_t *b,  size_t sz ) noexcept
{
  /* header is [ lpbytes * 4 ][ lplen * 2 ] */
  if ( sz < 7 )
    return false;
  this->lpbytes = le<uint32_t>( b );
  this->lplen   = le<uint16_t>( &b[ 4 ] );
  if ( this->lpbytes < 7 || this->lpbytes > sz ||
       b[ this->lpbytes - 1 ] != 0xff )
    return false;
  this->ptr = &b[ 6 ];
  this->end = &b[ this->lpbytes - 1 ];
  return true;
}

RdbListPack::ListPackEnc
RdbListPack::lp_code( uint8_t b ) noexcept
{
  switch ( ( b & 0xF0 ) >> 4 ) {
    case 0: case 1: case 2: case 3: case 4: case 5: case 6: case 7: /*(0...)*/
      return LP_7BIT_UINT;
    case 8: case 9: case 10: case 11: /* 0x80, 0x90, 0xA0, 0xB0       (10..)*/
      return LP_6BIT_STR;
    case 12: case 13:                 /* 0xC0, 0xD0             (1100, 1101)*/
      return LP_13BIT_INT;
    case 14:                          /* 0xE0                         (1110)*/
      return LP_12BIT_STR;
    default:
      switch ( b & 0x0F ) {
        case 0: return LP_32BIT_STR;  /* 0xF0 */
        case 1: return LP_16BIT_INT;  /* 0xF1 */
        case 2: return LP_24BIT_INT;  /* 0xF2 */
        case 3: return LP_32BIT_INT;  /* 0xF3 */
        case 4: return LP_64BIT_INT;  /* 0xF4 */
        case 15: return LP_END;       /* 0xFF */
        default: return LP_UNUSED;    /* 0xF5 -> 0xFE */
      }
  }
}

/* sizes of the next link, stored in a u64 constant */
#define ISZ( v, e ) ( (uint64_t) v << ( (int) RdbListPack::e * 4 ) )
static const uint64_t LP_SIZE =
  ISZ( 1, LP_7BIT_UINT ) | /* 0.......   7 bits immediate */
  ISZ( 1, LP_6BIT_STR  ) | /* 10......   6 bits string */
  ISZ( 2, LP_13BIT_INT ) | /* 110.....   5 +  8 bits immediate */
  ISZ( 2, LP_12BIT_STR ) | /* 1110....   4 +  8 bits string */
  ISZ( 5, LP_32BIT_STR ) | /* 11110000   x   32 bits string */
  ISZ( 3, LP_16BIT_INT ) | /* 11110001   x   16 bits immediate */
  ISZ( 4, LP_24BIT_INT ) | /* 11110010   x   24 bits immediate */
  ISZ( 5, LP_32BIT_INT ) | /* 11110011   x   32 bits immediate */
  ISZ( 9, LP_64BIT_INT );  /* 11110100   x   64 bits immediate */
#undef ISZ

/* ptr -> [ next ][ data ][ back ][ next-2 ]
 * if returns RDB_OK, then
 * ptr -> [ next-2 ] */
RdbErrCode
RdbListPack::next( RdbListValue &lval ) noexcept
{
  const uint8_t * p = this->ptr;
  size_t          avail, hdr, dlen = 0, entry_len;
  ListPackEnc     e;

  lval.data     = NULL;
  lval.data_len = 0;
  lval.ival     = 0;
  if ( p >= this->end )
    return RDB_EOF_MARK;
  avail = this->end - p;
  e     = lp_code( p[ 0 ] );
  if ( e == LP_END || e == LP_UNUSED ) /* 0xff before the end is corrupt */
    return RDB_ERR_ENCODING;
  hdr = ( LP_SIZE >> ( e * 4 ) ) & 0xfU;
  if ( hdr > avail )
    return RDB_ERR_ENCODING;

  switch ( e ) {
    case LP_7BIT_UINT: lval.ival = p[ 0 ] & 0x7f; break;
    case LP_13BIT_INT: {
      int64_t v = ( (int64_t) ( p[ 0 ] & 0x1f ) << 8 ) | p[ 1 ];
      if ( v >= 4096 ) /* sign bit of 13 */
        v -= 8192;
      lval.ival = v;
      break;
    }
    case LP_16BIT_INT: lval.ival = s16( &p[ 1 ] ); break;
    case LP_24BIT_INT: lval.ival = s24( &p[ 1 ] ); break;
    case LP_32BIT_INT: lval.ival = s32( &p[ 1 ] ); break;
    case LP_64BIT_INT: lval.ival = s64( &p[ 1 ] ); break;
    case LP_6BIT_STR:  dlen = p[ 0 ] & 0x3f; break;
    case LP_12BIT_STR: dlen = ( (size_t) ( p[ 0 ] & 0xf ) << 8 ) | p[ 1 ]; break;
    case LP_32BIT_STR: dlen = le<uint32_t>( &p[ 1 ] ); break;
    default: break;
  }
  if ( e == LP_6BIT_STR || e == LP_12BIT_STR || e == LP_32BIT_STR ) {
    if ( dlen > avail - hdr )
      return RDB_ERR_ENCODING;
    lval.data     = &p[ hdr ];
    lval.data_len = dlen;
  }
  /* the back link follows the entry */
  entry_len = hdr + dlen;
  entry_len += lpback_size( entry_len );
  if ( entry_len > avail )
    return RDB_ERR_ENCODING;
  this->ptr = &p[ entry_len ];
  return RDB_OK;
}

RdbErrCode
RdbListPack::next_ival( int64_t &ival ) noexcept
{
  RdbListValue lval;
  RdbErrCode   err = this->next( lval );
  if ( err == RDB_OK && ! lval.is_int() )
    err = RDB_ERR_ENCODING;
  ival = lval.ival;
  return err;
}

bool
RdbIntSet::init( const uint8_t *b,  size_t sz ) noexcept
{
  if ( sz < 8 )
    return false;
  this->enc = le<uint32_t>( b );
  this->len = le<uint32_t>( &b[ 4 ] );
  this->idx = 0;
  this->ptr = &b[ 8 ];
  /* check valid int size */
  if ( this->enc != 2 && this->enc != 4 && this->enc != 8 )
    return false;
  return (uint64_t) this->enc * this->len == sz - 8;
}

RdbErrCode
RdbIntSet::next( int64_t &ival ) noexcept
{
  if ( this->idx >= this->len )
    return RDB_EOF_MARK;
  switch ( this->enc ) {
    case 2:  ival = s16( this->ptr ); break;
    case 4:  ival = s32( this->ptr ); break;
    default: ival = s64( this->ptr ); break;
  }
  this->ptr = &this->ptr[ this->enc ];
  this->idx++;
  return RDB_OK;
}

bool
RdbZipMap::init( const uint8_t *b,  size_t sz ) noexcept
{
  /* [ zmlen ] ... [ 0xff ] */
  if ( sz < 2 || b[ sz - 1 ] != 0xff )
    return false;
  this->ptr = &b[ 1 ];
  this->end = &b[ sz ];
  return true;
}

bool
RdbZipMap::zm_len( uint32_t &len ) noexcept
{
  if ( this->ptr >= this->end )
    return false;
  uint8_t c = this->ptr[ 0 ];
  if ( c < 254 ) {
    len = c;
    this->ptr = &this->ptr[ 1 ];
    return true;
  }
  if ( c == 254 && this->end - this->ptr >= 5 ) {
    len = le<uint32_t>( &this->ptr[ 1 ] );
    this->ptr = &this->ptr[ 5 ];
    return true;
  }
  return false;
}

RdbErrCode
RdbZipMap::next( RdbListValue &field,  RdbListValue &val ) noexcept
{
  uint32_t flen, vlen, free_len;

  field.data = val.data = NULL;
  field.data_len = val.data_len = 0;
  if ( this->ptr >= this->end )
    return RDB_ERR_ENCODING;
  if ( this->ptr[ 0 ] == 0xff )
    return RDB_EOF_MARK;
  /* field */
  if ( ! this->zm_len( flen ) || (size_t) ( this->end - this->ptr ) < flen )
    return RDB_ERR_ENCODING;
  field.data     = this->ptr;
  field.data_len = flen;
  this->ptr      = &this->ptr[ flen ];
  /* value, free space after val is 1 byte */
  if ( ! this->zm_len( vlen ) || this->ptr >= this->end )
    return RDB_ERR_ENCODING;
  free_len  = this->ptr[ 0 ];
  this->ptr = &this->ptr[ 1 ];
  if ( (uint64_t) ( this->end - this->ptr ) < (uint64_t) vlen + free_len )
    return RDB_ERR_ENCODING;
  val.data     = this->ptr;
  val.data_len = vlen;
  this->ptr    = &this->ptr[ vlen + free_len ];
  return RDB_OK;
}
