#include <stdio.h>
#include <string.h>
#include <stdint.h>
#include <stdlib.h>
#include <math.h>
#include <utility>
#include <rdbscan/rdb_int.h>
#include <rdbscan/rdb_decode.h>
#include <rdbscan/rdb_pack.h>

using namespace rdbscan;

namespace {
/* stream entry flags, in the listpack */
enum RdbStreamFlags {
  RDB_STREAM_NONE             = 0,
  RDB_STREAM_ENTRY_DELETED    = 1,
  RDB_STREAM_ENTRY_SAMEFIELDS = 2
};
/* quicklist 2 node containers */
enum RdbQuickNode {
  RDB_QUICKLIST_PLAIN  = 1, /* a single large element */
  RDB_QUICKLIST_PACKED = 2  /* a listpack of elements */
};
/* module value opcodes, saved by the module type api */
enum RdbModuleOp {
  RDB_MODULE_OP_EOF    = 0,
  RDB_MODULE_OP_SINT   = 1, /* length */
  RDB_MODULE_OP_UINT   = 2, /* length */
  RDB_MODULE_OP_FLOAT  = 3, /* 4 bytes */
  RDB_MODULE_OP_DOUBLE = 4, /* 8 bytes */
  RDB_MODULE_OP_STRING = 5  /* string */
};
}

/* the logical kind of a type tag, false if not decodable */
static bool
type_kind( uint8_t tag,  RdbObjKind &kind )
{
  switch ( tag ) {
    case RDB_STRING:             kind = RDB_KIND_STRING; return true;
    case RDB_LIST:
    case RDB_LIST_ZIPLIST:
    case RDB_LIST_QUICKLIST:
    case RDB_LIST_QUICKLIST_2:   kind = RDB_KIND_LIST;   return true;
    case RDB_SET:
    case RDB_SET_INTSET:
    case RDB_SET_LISTPACK:       kind = RDB_KIND_SET;    return true;
    case RDB_ZSET:
    case RDB_ZSET_2:
    case RDB_ZSET_ZIPLIST:
    case RDB_ZSET_LISTPACK:      kind = RDB_KIND_ZSET;   return true;
    case RDB_HASH:
    case RDB_HASH_ZIPMAP:
    case RDB_HASH_ZIPLIST:
    case RDB_HASH_LISTPACK:      kind = RDB_KIND_HASH;   return true;
    case RDB_STREAM_LISTPACKS:
    case RDB_STREAM_LISTPACKS_2:
    case RDB_STREAM_LISTPACKS_3: kind = RDB_KIND_STREAM; return true;
    case RDB_MODULE_2:           kind = RDB_KIND_MODULE; return true;
    default:                     return false;
  }
}

const char *
rdbscan::rdb_type_name( uint8_t tag ) noexcept
{
  switch ( tag ) {
    case RDB_STRING:             return "string";
    case RDB_LIST:               return "list";
    case RDB_SET:                return "set";
    case RDB_ZSET:               return "zset";
    case RDB_HASH:               return "hash";
    case RDB_ZSET_2:             return "zset_2";
    case RDB_MODULE:             return "module";
    case RDB_MODULE_2:           return "module_2";
    case RDB_HASH_ZIPMAP:        return "hash_zipmap";
    case RDB_LIST_ZIPLIST:       return "list_ziplist";
    case RDB_SET_INTSET:         return "set_intset";
    case RDB_ZSET_ZIPLIST:       return "zset_ziplist";
    case RDB_HASH_ZIPLIST:       return "hash_ziplist";
    case RDB_LIST_QUICKLIST:     return "list_quicklist";
    case RDB_STREAM_LISTPACKS:   return "stream_listpacks";
    case RDB_HASH_LISTPACK:      return "hash_listpack";
    case RDB_ZSET_LISTPACK:      return "zset_listpack";
    case RDB_LIST_QUICKLIST_2:   return "list_quicklist_2";
    case RDB_STREAM_LISTPACKS_2: return "stream_listpacks_2";
    case RDB_SET_LISTPACK:       return "set_listpack";
    case RDB_STREAM_LISTPACKS_3: return "stream_listpacks_3";
    default:                     return "unknown";
  }
}

const char *
RdbObject::kind_name( void ) const noexcept
{
  switch ( this->kind ) {
    case RDB_KIND_STRING: return "string";
    case RDB_KIND_LIST:   return "list";
    case RDB_KIND_SET:    return "set";
    case RDB_KIND_ZSET:   return "zset";
    case RDB_KIND_HASH:   return "hash";
    case RDB_KIND_STREAM: return "stream";
    case RDB_KIND_MODULE: return "module";
  }
  return "unknown";
}

size_t
RdbObject::count( void ) const
{
  switch ( this->kind ) {
    case RDB_KIND_LIST:
    case RDB_KIND_SET:    return this->elems.size();
    case RDB_KIND_ZSET:   return this->zset.size();
    case RDB_KIND_HASH:   return this->hash.size();
    case RDB_KIND_STREAM: return this->stream.records.size();
    default:              return 1;
  }
}

RdbErrCode
RdbDecode::decode_object( uint8_t tag,  uint64_t tag_off,  RdbObject &obj )
{
  RdbErrCode err;

  /* an unknown type can't be skipped, the size is not known */
  if ( ! type_kind( tag, obj.kind ) ) {
    this->status.type_tag = tag;
    return this->fail( RDB_ERR_TYPE, tag_off );
  }
  obj.type = tag;
  obj.db   = this->db;
  if ( (err = this->decode_rlen( obj.key )) != RDB_OK )
    return err;

  switch ( tag ) {
    case RDB_STRING: /* a single string, the simplest structure */
      return this->decode_rlen( obj.str );
    case RDB_LIST:
    case RDB_SET:
      return this->decode_elems( obj );
    case RDB_HASH:
      return this->decode_hash( obj );
    case RDB_ZSET:
    case RDB_ZSET_2:
      return this->decode_zset( obj );
    case RDB_HASH_ZIPMAP:
      return this->decode_hash_zipmap( obj );
    case RDB_SET_INTSET:
      return this->decode_set_intset( obj );
    case RDB_LIST_ZIPLIST:
    case RDB_ZSET_ZIPLIST:
    case RDB_HASH_ZIPLIST:
      return this->decode_ziplist( obj );
    case RDB_HASH_LISTPACK:
    case RDB_ZSET_LISTPACK:
    case RDB_SET_LISTPACK:
      return this->decode_listpack( obj );
    case RDB_LIST_QUICKLIST:
    case RDB_LIST_QUICKLIST_2:
      return this->decode_quicklist( obj );
    case RDB_STREAM_LISTPACKS:
    case RDB_STREAM_LISTPACKS_2:
    case RDB_STREAM_LISTPACKS_3:
      return this->decode_stream( obj );
    case RDB_MODULE_2:
      return this->decode_module( obj );
    default:
      break;
  }
  this->status.type_tag = tag;
  return this->fail( RDB_ERR_TYPE, tag_off );
}

RdbErrCode
RdbDecode::decode_elems( RdbObject &obj ) /* list or set */
{
  uint64_t   cnt;
  RdbErrCode err;

  if ( (err = this->decode_len( cnt )) != RDB_OK )
    return err;
  for ( ; cnt > 0; cnt-- ) {
    obj.elems.push_back( std::string() );
    if ( (err = this->decode_rlen( obj.elems.back() )) != RDB_OK )
      return err;
  }
  return RDB_OK;
}

RdbErrCode
RdbDecode::decode_hash( RdbObject &obj ) /* field : value */
{
  uint64_t   cnt;
  RdbErrCode err;

  if ( (err = this->decode_len( cnt )) != RDB_OK )
    return err;
  for ( ; cnt > 0; cnt-- ) {
    obj.hash.push_back( RdbHashPair() );
    RdbHashPair & h = obj.hash.back();
    if ( (err = this->decode_rlen( h.field )) != RDB_OK ||
         (err = this->decode_rlen( h.value )) != RDB_OK )
      return err;
  }
  return RDB_OK;
}

RdbErrCode
RdbDecode::decode_zset( RdbObject &obj ) /* or zset_2 */
{
  const uint8_t * b;
  uint64_t        cnt, off;
  RdbErrCode      err;

  if ( (err = this->decode_len( cnt )) != RDB_OK )
    return err;
  for ( ; cnt > 0; cnt-- ) {
    RdbZSetPair z;
    if ( (err = this->decode_rlen( z.member )) != RDB_OK )
      return err;
    off = this->cur.offset;
    if ( obj.type == RDB_ZSET_2 ) { /* binary double value */
      uint64_t bits;
      if ( (b = this->cur.incr( 8 )) == NULL )
        return this->cur.err;
      bits = le<uint64_t>( b );
      ::memcpy( &z.score, &bits, 8 );
    }
    else { /* RDB_ZSET, a string encoded float */
      if ( (b = this->cur.incr( 1 )) == NULL )
        return this->cur.err;
      switch ( b[ 0 ] ) {
        case 253: z.score = NAN; break;
        case 254: z.score = HUGE_VAL; break;
        case 255: z.score = -HUGE_VAL; break;
        default: {
          RdbListValue lval;
          lval.data_len = b[ 0 ];
          if ( (b = this->cur.incr( lval.data_len )) == NULL )
            return this->cur.err;
          lval.data = b;
          if ( ! lval.to_dbl( z.score ) )
            return this->fail( RDB_ERR_ENCODING, off );
          break;
        }
      }
    }
    obj.zset.push_back( std::move( z ) );
  }
  return RDB_OK;
}

RdbErrCode
RdbDecode::decode_hash_zipmap( RdbObject &obj )
{
  std::string  blob;
  RdbZipMap    zmap;
  RdbListValue field, val;
  uint64_t     off = this->cur.offset;
  RdbErrCode   err;

  if ( (err = this->decode_rlen( blob )) != RDB_OK )
    return err;
  if ( ! zmap.init( (const uint8_t *) blob.data(), blob.size() ) )
    return this->fail( RDB_ERR_ENCODING, off );
  while ( (err = zmap.next( field, val )) == RDB_OK ) {
    obj.hash.push_back( RdbHashPair() );
    field.to_str( obj.hash.back().field );
    val.to_str( obj.hash.back().value );
  }
  if ( err != RDB_EOF_MARK )
    return this->fail( err, off );
  return RDB_OK;
}

RdbErrCode
RdbDecode::decode_set_intset( RdbObject &obj )
{
  std::string  blob;
  RdbIntSet    iset;
  RdbListValue lval;
  uint64_t     off = this->cur.offset;
  RdbErrCode   err;

  if ( (err = this->decode_rlen( blob )) != RDB_OK )
    return err;
  if ( ! iset.init( (const uint8_t *) blob.data(), blob.size() ) )
    return this->fail( RDB_ERR_ENCODING, off );
  while ( iset.next( lval.ival ) == RDB_OK ) {
    obj.elems.push_back( std::string() );
    lval.to_str( obj.elems.back() );
  }
  return RDB_OK;
}

/* the same structure for zip lists and list packs, different outputs */
template <class Packed>
static RdbErrCode
unpack_elems( Packed &pk,  RdbObject &obj )
{
  RdbListValue lval;
  RdbErrCode   err;

  while ( (err = pk.next( lval )) == RDB_OK ) {
    switch ( obj.kind ) {
      case RDB_KIND_HASH: { /* field, value */
        RdbHashPair h;
        lval.to_str( h.field );
        if ( pk.next( lval ) != RDB_OK )
          return RDB_ERR_ENCODING;
        lval.to_str( h.value );
        obj.hash.push_back( std::move( h ) );
        break;
      }
      case RDB_KIND_ZSET: { /* member, score */
        RdbZSetPair z;
        lval.to_str( z.member );
        if ( pk.next( lval ) != RDB_OK || ! lval.to_dbl( z.score ) )
          return RDB_ERR_ENCODING;
        obj.zset.push_back( std::move( z ) );
        break;
      }
      default: /* list elements or set members */
        obj.elems.push_back( std::string() );
        lval.to_str( obj.elems.back() );
        break;
    }
  }
  return ( err == RDB_EOF_MARK ) ? RDB_OK : err;
}

RdbErrCode
RdbDecode::decode_ziplist( RdbObject &obj )
{
  std::string blob;
  RdbZipList  zip;
  uint64_t    off = this->cur.offset;
  RdbErrCode  err;

  if ( (err = this->decode_rlen( blob )) != RDB_OK )
    return err;
  if ( ! zip.init( (const uint8_t *) blob.data(), blob.size() ) )
    return this->fail( RDB_ERR_ENCODING, off );
  if ( (err = unpack_elems( zip, obj )) != RDB_OK )
    return this->fail( err, off );
  return RDB_OK;
}

RdbErrCode
RdbDecode::decode_listpack( RdbObject &obj )
{
  std::string blob;
  RdbListPack list;
  uint64_t    off = this->cur.offset;
  RdbErrCode  err;

  if ( (err = this->decode_rlen( blob )) != RDB_OK )
    return err;
  if ( ! list.init( (const uint8_t *) blob.data(), blob.size() ) )
    return this->fail( RDB_ERR_ENCODING, off );
  if ( (err = unpack_elems( list, obj )) != RDB_OK )
    return this->fail( err, off );
  return RDB_OK;
}

RdbErrCode
RdbDecode::decode_quicklist( RdbObject &obj )
{
  uint64_t   cnt, off, container = RDB_QUICKLIST_PACKED;
  RdbErrCode err;

  if ( (err = this->decode_len( cnt )) != RDB_OK )
    return err;
  /* for each ziplist, or each listpack or plain node */
  for ( ; cnt > 0; cnt-- ) {
    std::string blob;
    off = this->cur.offset;
    if ( obj.type == RDB_LIST_QUICKLIST_2 ) {
      if ( (err = this->decode_len( container )) != RDB_OK )
        return err;
      if ( container != RDB_QUICKLIST_PLAIN &&
           container != RDB_QUICKLIST_PACKED )
        return this->fail( RDB_ERR_ENCODING, off );
      off = this->cur.offset;
    }
    if ( (err = this->decode_rlen( blob )) != RDB_OK )
      return err;
    if ( container == RDB_QUICKLIST_PLAIN ) {
      obj.elems.push_back( std::move( blob ) );
      continue;
    }
    if ( obj.type == RDB_LIST_QUICKLIST ) {
      RdbZipList zip;
      if ( ! zip.init( (const uint8_t *) blob.data(), blob.size() ) )
        return this->fail( RDB_ERR_ENCODING, off );
      err = unpack_elems( zip, obj );
    }
    else {
      RdbListPack list;
      if ( ! list.init( (const uint8_t *) blob.data(), blob.size() ) )
        return this->fail( RDB_ERR_ENCODING, off );
      err = unpack_elems( list, obj );
    }
    if ( err != RDB_OK )
      return this->fail( err, off );
  }
  return RDB_OK;
}

/* a stream listpack:
 *   master : [ count ][ deleted ][ nfields ][ field ... ][ 0 ]
 *   entry  : [ flags ][ ms-diff ][ seq-diff ]
 *            samefields ? [ value ... ] : [ nfields ][ field, value ... ]
 *            [ lp-count ]
 * each entry id is the master id (the node key) + diff */

/* a field count can't exceed the bytes left, each item is at least 2 */
static bool
fits_listpack( const RdbListPack &list,  int64_t n )
{
  return n >= 0 && n <= (int64_t) ( list.end - list.ptr ) / 2;
}

static RdbErrCode
unpack_stream( RdbListPack &list,  const RdbStreamId &master,  RdbStream &st )
{
  std::vector<std::string> master_fields;
  RdbListValue             lval;
  int64_t                  count, deleted, nfields, term;

  if ( list.next_ival( count ) != RDB_OK ||
       list.next_ival( deleted ) != RDB_OK ||
       list.next_ival( nfields ) != RDB_OK ||
       ! fits_listpack( list, nfields ) )
    return RDB_ERR_ENCODING;
  for ( int64_t i = 0; i < nfields; i++ ) {
    if ( list.next( lval ) != RDB_OK )
      return RDB_ERR_ENCODING;
    master_fields.push_back( std::string() );
    lval.to_str( master_fields.back() );
  }
  if ( list.next_ival( term ) != RDB_OK ) /* skip the zero terminate */
    return RDB_ERR_ENCODING;

  for (;;) {
    RdbStreamRecord rec;
    int64_t         flags, ms_diff, seq_diff, n, lp_count, cnt;
    RdbErrCode      err = list.next_ival( flags );
    if ( err == RDB_EOF_MARK )
      break;
    if ( err != RDB_OK ||
         list.next_ival( ms_diff ) != RDB_OK ||
         list.next_ival( seq_diff ) != RDB_OK )
      return RDB_ERR_ENCODING;
    rec.id.set( master.ms + (uint64_t) ms_diff,
                master.seq + (uint64_t) seq_diff );
    if ( ( flags & RDB_STREAM_ENTRY_SAMEFIELDS ) != 0 ) {
      /* using the master fields */
      n   = nfields;
      cnt = n + 3;
    }
    else {
      if ( list.next_ival( n ) != RDB_OK || ! fits_listpack( list, n ) )
        return RDB_ERR_ENCODING;
      cnt = n * 2 + 4;
    }
    for ( int64_t i = 0; i < n; i++ ) {
      rec.fields.push_back( RdbHashPair() );
      RdbHashPair & h = rec.fields.back();
      if ( ( flags & RDB_STREAM_ENTRY_SAMEFIELDS ) != 0 )
        h.field = master_fields[ i ];
      else {
        if ( list.next( lval ) != RDB_OK )
          return RDB_ERR_ENCODING;
        lval.to_str( h.field );
      }
      if ( list.next( lval ) != RDB_OK )
        return RDB_ERR_ENCODING;
      lval.to_str( h.value );
    }
    /* check that the field count is correct */
    if ( list.next_ival( lp_count ) != RDB_OK || lp_count != cnt )
      return RDB_ERR_ENCODING;
    /* skip deleted entries */
    if ( ( flags & RDB_STREAM_ENTRY_DELETED ) == 0 )
      st.records.push_back( std::move( rec ) );
  }
  return RDB_OK;
}

RdbErrCode
RdbDecode::decode_stream( RdbObject &obj )
{
  RdbStream     & st = obj.stream;
  const uint8_t * b;
  uint64_t        cnt, off, ms, seq;
  RdbErrCode      err;

  if ( (err = this->decode_len( cnt )) != RDB_OK )
    return err;
  /* for each list pack, keyed by the master id */
  for ( ; cnt > 0; cnt-- ) {
    std::string nodekey, blob;
    RdbStreamId master;
    RdbListPack list;
    off = this->cur.offset;
    if ( (err = this->decode_rlen( nodekey )) != RDB_OK )
      return err;
    if ( nodekey.size() != 16 )
      return this->fail( RDB_ERR_ENCODING, off );
    master.set( be<uint64_t>( nodekey.data() ),
                be<uint64_t>( &nodekey.data()[ 8 ] ) );
    off = this->cur.offset;
    if ( (err = this->decode_rlen( blob )) != RDB_OK )
      return err;
    if ( ! list.init( (const uint8_t *) blob.data(), blob.size() ) ||
         unpack_stream( list, master, st ) != RDB_OK )
      return this->fail( RDB_ERR_ENCODING, off );
  }
  /* info about the stream */
  if ( (err = this->decode_len( st.length )) != RDB_OK ||
       (err = this->decode_len( ms )) != RDB_OK ||
       (err = this->decode_len( seq )) != RDB_OK )
    return err;
  st.last.set( ms, seq );
  if ( obj.type >= RDB_STREAM_LISTPACKS_2 ) {
    if ( (err = this->decode_len( ms )) != RDB_OK ||
         (err = this->decode_len( seq )) != RDB_OK )
      return err;
    st.first.set( ms, seq );
    if ( (err = this->decode_len( ms )) != RDB_OK ||
         (err = this->decode_len( seq )) != RDB_OK )
      return err;
    st.max_deleted.set( ms, seq );
    if ( (err = this->decode_len( st.entries_added )) != RDB_OK )
      return err;
  }
  /* for each group */
  if ( (err = this->decode_len( cnt )) != RDB_OK )
    return err;
  for ( ; cnt > 0; cnt-- ) {
    st.groups.push_back( RdbStreamGroup() );
    RdbStreamGroup & group = st.groups.back();
    uint64_t         pend_cnt, cons_cnt;

    group.entries_read = 0;
    if ( (err = this->decode_rlen( group.name )) != RDB_OK ||
         (err = this->decode_len( ms )) != RDB_OK ||
         (err = this->decode_len( seq )) != RDB_OK )
      return err;
    group.last.set( ms, seq );
    if ( obj.type >= RDB_STREAM_LISTPACKS_2 &&
         (err = this->decode_len( group.entries_read )) != RDB_OK )
      return err;
    /* for each pending entry of the group */
    if ( (err = this->decode_len( pend_cnt )) != RDB_OK )
      return err;
    for ( ; pend_cnt > 0; pend_cnt-- ) {
      RdbStreamPend pend;
      if ( (b = this->cur.incr( 128 / 8 )) == NULL ) /* stream id */
        return this->cur.err;
      pend.id.set( be<uint64_t>( b ), be<uint64_t>( &b[ 8 ] ) );
      if ( (b = this->cur.incr( 8 )) == NULL )
        return this->cur.err;
      pend.delivery_time = le<uint64_t>( b );
      if ( (err = this->decode_len( pend.delivery_cnt )) != RDB_OK )
        return err;
      group.pending.push_back( pend );
    }
    /* for each consumer */
    if ( (err = this->decode_len( cons_cnt )) != RDB_OK )
      return err;
    for ( ; cons_cnt > 0; cons_cnt-- ) {
      group.consumers.push_back( RdbStreamConsumer() );
      RdbStreamConsumer & cons = group.consumers.back();
      /* name and info */
      if ( (err = this->decode_rlen( cons.name )) != RDB_OK )
        return err;
      if ( (b = this->cur.incr( 8 )) == NULL )
        return this->cur.err;
      cons.seen_time   = le<uint64_t>( b );
      cons.active_time = 0;
      if ( obj.type >= RDB_STREAM_LISTPACKS_3 ) {
        if ( (b = this->cur.incr( 8 )) == NULL )
          return this->cur.err;
        cons.active_time = le<uint64_t>( b );
      }
      /* the consumer's pending list */
      if ( (err = this->decode_len( pend_cnt )) != RDB_OK )
        return err;
      for ( ; pend_cnt > 0; pend_cnt-- ) {
        RdbStreamId id;
        if ( (b = this->cur.incr( 128 / 8 )) == NULL )
          return this->cur.err;
        id.set( be<uint64_t>( b ), be<uint64_t>( &b[ 8 ] ) );
        cons.pending.push_back( id );
      }
    }
  }
  return RDB_OK;
}

/* module id: 9 chars of a 64 char set in the top 54 bits, version in the
 * bottom 10 bits */
static void
module_type_name( uint64_t m,  std::string &name )
{
  static const char char_set[ 65 ] = /* 64 chars */
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ" "abcdefghijklmnopqrstuvwxyz" "0123456789-_";
  name.clear();
  for ( int i = 9; i > 0; i-- )
    name += char_set[ ( m >> ( ( i * 6 ) + 4 ) ) & 63 ];
}

RdbErrCode
RdbDecode::decode_module( RdbObject &obj )
{
  uint64_t   m;
  RdbErrCode err;

  if ( (err = this->decode_len( m )) != RDB_OK )
    return err;
  module_type_name( m, obj.str );
  obj.module_ver = (uint32_t) ( m & 1023 );
  /* the value is opaque without the module */
  return this->skip_module_value();
}

RdbErrCode
RdbDecode::skip_module_value( void )
{
  uint64_t   op, off, v;
  RdbErrCode err;

  for (;;) {
    off = this->cur.offset;
    if ( (err = this->decode_len( op )) != RDB_OK )
      return err;
    switch ( op ) {
      case RDB_MODULE_OP_EOF:
        return RDB_OK;
      case RDB_MODULE_OP_SINT:
      case RDB_MODULE_OP_UINT:
        if ( (err = this->decode_len( v )) != RDB_OK )
          return err;
        break;
      case RDB_MODULE_OP_FLOAT:
        if ( this->cur.incr( 4 ) == NULL )
          return this->cur.err;
        break;
      case RDB_MODULE_OP_DOUBLE:
        if ( this->cur.incr( 8 ) == NULL )
          return this->cur.err;
        break;
      case RDB_MODULE_OP_STRING: {
        std::string s;
        if ( (err = this->decode_rlen( s )) != RDB_OK )
          return err;
        break;
      }
      default:
        return this->fail( RDB_ERR_ENCODING, off );
    }
  }
}

void
rdbscan::rdb_module_name( uint64_t module_id,  std::string &name )
{
  module_type_name( module_id, name );
}
