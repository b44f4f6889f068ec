#include <stdio.h>
#include <string.h>
#include <stdint.h>
#include <stdlib.h>
#include <errno.h>
#ifndef _MSC_VER
#include <unistd.h>
#else
#include <io.h>
#endif
#include <rdbscan/rdb_source.h>

using namespace rdbscan;

uint64_t
RdbSource::remaining( void ) const noexcept
{
  return RDB_UNKNOWN_SIZE;
}

size_t
RdbMemSource::read( void *p,  size_t len ) noexcept
{
  if ( len > this->avail )
    len = this->avail;
  ::memcpy( p, this->buf, len );
  this->buf    = &this->buf[ len ];
  this->avail -= len;
  return len;
}

uint64_t
RdbMemSource::remaining( void ) const noexcept
{
  return this->avail;
}

size_t
RdbFdSource::read( void *p,  size_t len ) noexcept
{
  for (;;) {
#ifndef _MSC_VER
    ssize_t n = ::read( this->fd, p, len );
#else
    int n = ::_read( this->fd, p, (unsigned int) len );
#endif
    if ( n >= 0 )
      return (size_t) n;
    if ( errno != EINTR ) {
      this->err_no = errno;
      return 0;
    }
  }
}

RdbCursor::~RdbCursor()
{
  if ( this->buf != NULL )
    ::free( this->buf );
}

bool
RdbCursor::fill( size_t n ) noexcept
{
  size_t   have = this->avail();
  uint64_t left;

  if ( n <= have )
    return true;
  left = this->src.remaining();
  /* if the source can't have n, fail before growing the buffer */
  if ( left != RDB_UNKNOWN_SIZE && left < (uint64_t) ( n - have ) ) {
    this->fail( RDB_ERR_TRUNC, this->offset );
    return false;
  }
  /* shift the unconsumed data to the front */
  if ( this->start > 0 ) {
    if ( have > 0 )
      ::memmove( this->buf, &this->buf[ this->start ], have );
    this->start = 0;
    this->end   = have;
  }
  while ( this->end < n ) {
    /* only grow when full, the size is bounded by the data read */
    if ( this->end == this->buf_size ) {
      size_t    sz = ( this->buf_size == 0 ) ? INIT_SIZE : this->buf_size * 2;
      uint8_t * p;
      if ( sz < this->buf_size ||
           (p = (uint8_t *) ::realloc( this->buf, sz )) == NULL ) {
        this->fail( RDB_ERR_ALLOC, this->offset );
        return false;
      }
      this->buf      = p;
      this->buf_size = sz;
    }
    size_t m = this->src.read( &this->buf[ this->end ],
                               this->buf_size - this->end );
    if ( m == 0 ) {
      this->fail( RDB_ERR_TRUNC, this->offset );
      return false;
    }
    this->end += m;
  }
  return true;
}

void
RdbCursor::show_window( const char *nm ) const noexcept
{
  if ( this->buf == NULL )
    return;
  /* 256 bytes before the position, 256 after */
  size_t off     = ( this->start > 256 ) ? this->start - 256 : 0,
         end_off = this->end;
  off &= ~(size_t) 15;
  if ( end_off > off + 512 )
    end_off = off + 512;
  print_hex( nm, this->offset - ( this->start - off ), &this->buf[ off ],
             end_off - off );
}

namespace {
static const char hex_chars[] = "0123456789abcdef";
struct HexDump {
  char     line[ 80 ];
  uint32_t boff, hex, ascii;
  uint64_t stream_off;

  HexDump( uint64_t off ) : boff( 0 ), stream_off( off ) {
    this->flush_line();
  }
  void flush_line( void ) {
    this->stream_off += this->boff;
    this->boff  = 0;
    this->hex   = 9;
    this->ascii = 61;
    this->init_line();
  }
  /* offset of the line is in the first 6 columns */
  void init_line( void ) {
    uint64_t k = this->stream_off;
    ::memset( this->line, ' ', 79 );
    this->line[ 79 ] = '\0';
    for ( int j = 5; j >= 0; j-- ) {
      this->line[ j ] = hex_chars[ k & 0xf ];
      k >>= 4;
    }
  }
  size_t fill_line( const uint8_t *ptr,  size_t off,  size_t len ) {
    while ( off < len && this->boff < 16 ) {
      uint8_t b = ptr[ off++ ];
      this->line[ this->hex ]   = hex_chars[ b >> 4 ];
      this->line[ this->hex+1 ] = hex_chars[ b & 0xf ];
      this->hex += 3;
      if ( b >= ' ' && b <= 126 )
        this->line[ this->ascii ] = b;
      this->ascii++;
      if ( ( ++this->boff & 0x3 ) == 0 )
        this->hex++;
    }
    return off;
  }
};
}

void
rdbscan::print_hex( const char *nm,  uint64_t off,  const uint8_t *b,
                    size_t len ) noexcept
{
  HexDump hex( off );
  size_t  i = 0;
  fprintf( stderr, "%s:\n", nm );
  while ( i < len ) {
    i = hex.fill_line( b, i, len );
    fprintf( stderr, "%s\n", hex.line );
    hex.flush_line();
  }
}
