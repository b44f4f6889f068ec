#include <stdio.h>
#include <string.h>
#include <stdint.h>
#include <stdlib.h>
#include <rdbscan/rdb_int.h>
#include <rdbscan/rdb_decode.h>

using namespace rdbscan;

RdbConfig::RdbConfig()
  : crc( jones_crc64 ), ops( 0 ), filter( 0 ), min_ver( RDB_MIN_VERSION ),
    max_ver( RDB_MAX_VERSION ), verify_crc( true )
{
}

void
RdbOpTable::zero( void )
{
  ::memset( this->code, RDB_OP_NONE, sizeof( this->code ) );
}

void
RdbOpTable::init( uint16_t ver )
{
  this->zero();
  this->set( 0xfc, RDB_OP_EXPIRED_MS );   /* millisecond, 8 bytes */
  this->set( 0xfd, RDB_OP_EXPIRED_SEC );  /* second, 4 bytes */
  this->set( 0xfe, RDB_OP_DBSELECT );     /* length */
  this->set( 0xff, RDB_OP_EOF );          /* crc follows */
  if ( ver >= 7 ) {
    this->set( 0xfa, RDB_OP_AUX );        /* string, string */
    this->set( 0xfb, RDB_OP_DBRESIZE );   /* length, length */
  }
  if ( ver >= 9 ) {
    this->set( 0xf7, RDB_OP_MODULE_AUX ); /* module2 */
    this->set( 0xf8, RDB_OP_IDLE );       /* length */
    this->set( 0xf9, RDB_OP_FREQ );       /* byte */
  }
  if ( ver >= 10 && ver < 12 )
    this->set( 0xf5, RDB_OP_FUNCTION );   /* string */
  if ( ver >= 12 ) {
    this->set( 0xf4, RDB_OP_FREQ );
    this->set( 0xf5, RDB_OP_IDLE );
  }
}

bool
RdbOpTable::set( uint8_t b,  RdbOpcode op )
{
  if ( b < FIRST_OP ) /* would shadow a type tag */
    return false;
  this->code[ b - FIRST_OP ] = (uint8_t) op;
  return true;
}

void RdbSink::on_dbselect( uint32_t ) noexcept {}
void RdbSink::on_dbresize( uint64_t,  uint64_t ) noexcept {}
void RdbSink::on_aux( const std::string &,  const std::string & ) noexcept {}
void RdbSink::on_module_aux( const std::string & ) noexcept {}
void RdbSink::on_function( const std::string & ) noexcept {}

bool
RdbFilter::match_key( const std::string & ) noexcept
{
  return true;
}

RdbErrCode
RdbDecode::decode_len( uint64_t &val ) noexcept
{
  RdbLength  sz;
  RdbErrCode err;
  if ( (err = sz.decode( this->cur )) != RDB_OK )
    return err;
  /* counts can't be immediate or lzf */
  if ( sz.kind != RDB_LEN_PLAIN )
    return this->fail( RDB_ERR_LEN, sz.off );
  val = sz.len;
  return RDB_OK;
}

RdbErrCode
RdbDecode::decode_rlen( std::string &str )
{
  RdbLength  rlen;
  RdbErrCode err;
  if ( (err = rlen.decode( this->cur )) != RDB_OK )
    return err;
  return rlen.consume( this->cur, this->cfg.dz, str );
}

RdbErrCode
RdbDecode::parse( RdbSink &sink )
{
  const uint8_t * b;
  RdbErrCode      err;

  /* single use */
  if ( this->state != RDB_ST_HEADER )
    return RDB_ERR_OUTPUT;
  err = this->decode_header();

  while ( err == RDB_OK && this->state == RDB_ST_OPCODE ) {
    uint64_t off = this->cur.offset;
    if ( (b = this->cur.incr( 1 )) == NULL ) {
      err = this->cur.err;
      break;
    }
    uint8_t   c  = b[ 0 ];
    RdbOpcode op = this->ops.lookup( c );
    if ( op == RDB_OP_NONE )
      err = this->decode_entry( c, off, sink );
    else
      err = this->decode_opcode( op, off, sink );
  }
  this->state      = RDB_ST_DONE;
  this->status.err = err;
  if ( err != RDB_OK )
    this->status.off = this->cur.err_off;
  else
    this->status.off = this->cur.offset;
  return err;
}

RdbErrCode
RdbDecode::decode_header( void ) noexcept
{
  const uint8_t * b;

  /* REDIS0012 */
  if ( (b = this->cur.incr( 9 )) == NULL )
    return this->cur.err;
  if ( ::memcmp( b, "REDIS", 5 ) != 0 )
    return this->fail( RDB_ERR_HDR, 0 );
  this->ver = 0;
  for ( size_t i = 5; i < 9; i++ ) {
    if ( b[ i ] < '0' || b[ i ] > '9' )
      return this->fail( RDB_ERR_HDR, i );
    this->ver = (uint16_t) ( ( this->ver * 10 ) + ( b[ i ] - '0' ) );
  }
  this->status.ver = this->ver;
  if ( this->ver < this->cfg.min_ver || this->ver > this->cfg.max_ver )
    return this->fail( RDB_ERR_VERSION, 5 );

  if ( this->cfg.ops != NULL )
    this->ops = *this->cfg.ops;
  else
    this->ops.init( this->ver );
  this->state = RDB_ST_OPCODE;
  return RDB_OK;
}

RdbErrCode
RdbDecode::decode_opcode( RdbOpcode op,  uint64_t op_off,  RdbSink &sink )
{
  const uint8_t * b;
  RdbErrCode      err;

  /* expire, freq, idle must be followed by the key they belong to */
  if ( ! is_meta_op( op ) && ! this->meta.is_empty() )
    return this->fail( RDB_ERR_META, op_off );

  switch ( op ) {
    case RDB_OP_IDLE: { /* length */
      uint64_t idle;
      if ( (err = this->decode_len( idle )) != RDB_OK )
        return err;
      this->meta.set_idle( idle );
      return RDB_OK;
    }
    case RDB_OP_FREQ: /* byte */
      if ( (b = this->cur.incr( 1 )) == NULL )
        return this->cur.err;
      this->meta.set_freq( b[ 0 ] );
      return RDB_OK;

    case RDB_OP_EXPIRED_MS: /* millisecond */
      if ( (b = this->cur.incr( 8 )) == NULL )
        return this->cur.err;
      this->meta.set_expire_ms( le<uint64_t>( b ) );
      return RDB_OK;

    case RDB_OP_EXPIRED_SEC: /* second */
      if ( (b = this->cur.incr( 4 )) == NULL )
        return this->cur.err;
      this->meta.set_expire_sec( le<uint32_t>( b ) );
      return RDB_OK;

    case RDB_OP_AUX: { /* string, string */
      std::string var, val;
      if ( (err = this->decode_rlen( var )) != RDB_OK ||
           (err = this->decode_rlen( val )) != RDB_OK )
        return err;
      sink.on_aux( var, val );
      return RDB_OK;
    }
    case RDB_OP_DBRESIZE: { /* length, length */
      uint64_t keys, expires;
      if ( (err = this->decode_len( keys )) != RDB_OK ||
           (err = this->decode_len( expires )) != RDB_OK )
        return err;
      sink.on_dbresize( keys, expires );
      return RDB_OK;
    }
    case RDB_OP_DBSELECT: { /* length */
      uint64_t db;
      uint64_t off = this->cur.offset;
      if ( (err = this->decode_len( db )) != RDB_OK )
        return err;
      if ( db > 0xffffffffU )
        return this->fail( RDB_ERR_LEN, off );
      this->db = (uint32_t) db;
      sink.on_dbselect( this->db );
      return RDB_OK;
    }
    case RDB_OP_MODULE_AUX: { /* module id, when opcode, when, module data */
      uint64_t    id, when_op, when;
      std::string name;
      uint64_t    off;
      if ( (err = this->decode_len( id )) != RDB_OK )
        return err;
      off = this->cur.offset;
      if ( (err = this->decode_len( when_op )) != RDB_OK )
        return err;
      if ( when_op != 2 ) /* a uint module opcode */
        return this->fail( RDB_ERR_ENCODING, off );
      if ( (err = this->decode_len( when )) != RDB_OK ||
           (err = this->skip_module_value()) != RDB_OK )
        return err;
      rdb_module_name( id, name );
      sink.on_module_aux( name );
      return RDB_OK;
    }
    case RDB_OP_FUNCTION: { /* library source */
      std::string code;
      if ( (err = this->decode_rlen( code )) != RDB_OK )
        return err;
      sink.on_function( code );
      break;
    }
    case RDB_OP_EOF:
      this->state = RDB_ST_DONE;
      return this->decode_trailer();

    case RDB_OP_NONE: /* parse() sends type tags to decode_entry() */
      break;
  }
  return RDB_OK;
}

RdbErrCode
RdbDecode::decode_entry( uint8_t tag,  uint64_t tag_off,  RdbSink &sink )
{
  RdbObject  obj;
  RdbErrCode err;

  this->state = RDB_ST_OBJECT;
  if ( (err = this->decode_object( tag, tag_off, obj )) != RDB_OK )
    return err;
  /* the meta read so far belongs to this key only */
  obj.meta = this->meta.take_and_reset();
  this->status.obj_cnt++;
  this->state = RDB_ST_OPCODE;

  if ( this->cfg.filter != NULL && ! this->cfg.filter->match_key( obj.key ) )
    return RDB_OK;
  this->status.out_cnt++;
  if ( sink.on_object( obj ) == RDB_STOP ) {
    this->status.stopped = true;
    this->state = RDB_ST_DONE;
  }
  return RDB_OK;
}

RdbErrCode
RdbDecode::decode_trailer( void ) noexcept
{
  const uint8_t * b;
  uint64_t        calc = this->cur.crc, /* header through the eof byte */
                  off  = this->cur.offset,
                  stored;

  /* crc added in version 5 */
  if ( this->ver < 5 )
    return RDB_OK;
  if ( (b = this->cur.incr( 8 )) == NULL )
    return this->cur.err;
  stored = le<uint64_t>( b );
  /* zero means it was not computed */
  if ( this->cfg.verify_crc && stored != 0 && stored != calc )
    return this->fail( RDB_ERR_CRC, off );
  return RDB_OK;
}

RdbErrCode
rdbscan::rdb_parse( RdbSource &src,  RdbSink &sink,  const RdbConfig &cfg,
                    RdbStatus *status )
{
  RdbDecode  dec( src, cfg );
  RdbErrCode err = dec.parse( sink );
  if ( status != NULL )
    *status = dec.status;
  return err;
}
