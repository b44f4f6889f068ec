#ifndef __rdbscan__rdb_source_h__
#define __rdbscan__rdb_source_h__

#include <stddef.h>
#include <stdint.h>
#include <rdbscan/rdb_err.h>

#ifdef __cplusplus
namespace rdbscan {

static const uint64_t RDB_UNKNOWN_SIZE = ~(uint64_t) 0;

/* a forward only supplier of dump bytes: a file, a buffer, a socket */
struct RdbSource {
  virtual ~RdbSource() {}
  /* copy up to len bytes to p, return 0 when no more input */
  virtual size_t read( void *p,  size_t len ) noexcept = 0;
  /* how many bytes are left, RDB_UNKNOWN_SIZE if not known */
  virtual uint64_t remaining( void ) const noexcept;
};

/* a dump already in memory, or mmapped */
struct RdbMemSource : public RdbSource {
  const uint8_t * buf;   /* the data to be consumed */
  size_t          avail; /* amount of data left */

  RdbMemSource( const void *b,  size_t sz )
    : buf( (const uint8_t *) b ), avail( sz ) {}
  virtual size_t read( void *p,  size_t len ) noexcept;
  virtual uint64_t remaining( void ) const noexcept;
};

/* read(2) from a pipe or a file, does not own the fd */
struct RdbFdSource : public RdbSource {
  int fd,     /* stdin or an open file */
      err_no; /* errno, if read failed */

  RdbFdSource( int f ) : fd( f ), err_no( 0 ) {}
  virtual size_t read( void *p,  size_t len ) noexcept;
};

typedef uint64_t (*RdbCrcFn)( uint64_t crc,  const void *buf,  size_t len );

/* sequential reader over a source, the window of the stream is buffered
 *
 *  buf: [ consumed ][ unconsumed ][ free ]
 *       0           start        end      buf_size
 *
 * a pointer returned by incr() is valid until the next incr() */
struct RdbCursor {
  RdbSource & src;
  uint8_t   * buf;      /* window of the stream */
  size_t      buf_size, /* allocated size of buf */
              start,    /* first unconsumed byte */
              end;      /* end of data read from src */
  uint64_t    offset,   /* amount of data consumed from the stream */
              err_off,  /* where the last error was detected */
              crc;      /* running crc of the consumed bytes */
  RdbCrcFn    crc_fn;   /* if null, crc is not computed */
  RdbErrCode  err;      /* set when incr() fails */

  static const size_t INIT_SIZE = 64 * 1024;

  RdbCursor( RdbSource &s,  RdbCrcFn fn = 0 )
    : src( s ), buf( 0 ), buf_size( 0 ), start( 0 ), end( 0 ), offset( 0 ),
      err_off( 0 ), crc( 0 ), crc_fn( fn ), err( RDB_OK ) {}
  ~RdbCursor();

  size_t avail( void ) const { return this->end - this->start; }
  /* record an error at stream offset off */
  RdbErrCode fail( RdbErrCode e,  uint64_t off ) {
    this->err     = e;
    this->err_off = off;
    return e;
  }
  /* make at least n bytes available, false if src is exhausted */
  bool fill( size_t n ) noexcept;
  /* consume n bytes, null if truncated or out of memory */
  const uint8_t *incr( size_t n ) noexcept {
    if ( n > this->avail() && ! this->fill( n ) )
      return 0;
    const uint8_t * b = &this->buf[ this->start ];
    if ( this->crc_fn != 0 && n > 0 )
      this->crc = this->crc_fn( this->crc, b, n );
    this->start  += n;
    this->offset += n;
    return b;
  }
  /* hex dump the buffered bytes around the current position to stderr */
  void show_window( const char *nm ) const noexcept;
};

void print_hex( const char *nm,  uint64_t off,  const uint8_t *b,
                size_t len ) noexcept;

} // namespace
#endif
#endif
