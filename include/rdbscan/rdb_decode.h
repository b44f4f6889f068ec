#ifndef __rdbscan__rdb_decode_h__
#define __rdbscan__rdb_decode_h__

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <functional>
#include <rdbscan/rdb_err.h>
#include <rdbscan/rdb_source.h>
#include <rdbscan/rdb_object.h>

#ifdef __cplusplus
namespace rdbscan {
/* the redis rdb encoded data types, the tag byte before each key */
enum RdbType {
  RDB_STRING               = 0,  /* data bytes */
  RDB_LIST                 = 1,  /* list of strings, before quicklist */
  RDB_SET                  = 2,  /* list of string members */
  RDB_ZSET                 = 3,  /* string + dbl string score */
  RDB_HASH                 = 4,  /* list of strings for field + value */
  RDB_ZSET_2               = 5,  /* string + dbl binary score */
  RDB_MODULE               = 6,  /* pre GA module, can't be decoded */
  RDB_MODULE_2             = 7,  /* module id + module opcodes */
  RDB_HASH_ZIPMAP          = 9,  /* zipmap of field + value */
  RDB_LIST_ZIPLIST         = 10, /* ziplist of elements */
  RDB_SET_INTSET           = 11, /* array of ints, all same size */
  RDB_ZSET_ZIPLIST         = 12, /* ziplist of member + score */
  RDB_HASH_ZIPLIST         = 13, /* ziplist of field + value */
  RDB_LIST_QUICKLIST       = 14, /* list of ziplist */
  RDB_STREAM_LISTPACKS     = 15, /* stream, listpack of entries */
  RDB_HASH_LISTPACK        = 16, /* listpack of field + value */
  RDB_ZSET_LISTPACK        = 17, /* listpack of member + score */
  RDB_LIST_QUICKLIST_2     = 18, /* list of listpack or plain nodes */
  RDB_STREAM_LISTPACKS_2   = 19, /* + first id, max deleted, entries read */
  RDB_SET_LISTPACK         = 20, /* listpack of members */
  RDB_STREAM_LISTPACKS_3   = 21  /* + consumer active time */
};

/* info that is not data, a reserved byte >= 0xf0 in the dump */
enum RdbOpcode {
  RDB_OP_NONE        = 0, /* not an opcode, a type tag */
  RDB_OP_MODULE_AUX  = 1, /* module id, when, module opcodes */
  RDB_OP_IDLE        = 2, /* length */
  RDB_OP_FREQ        = 3, /* byte */
  RDB_OP_AUX         = 4, /* string, string */
  RDB_OP_DBRESIZE    = 5, /* length, length */
  RDB_OP_EXPIRED_MS  = 6, /* millisecond, 8 bytes */
  RDB_OP_EXPIRED_SEC = 7, /* second, 4 bytes */
  RDB_OP_DBSELECT    = 8, /* length */
  RDB_OP_EOF         = 9, /* crc follows */
  RDB_OP_FUNCTION    = 10 /* string, a function library */
};

/* which opcodes belong to the next key */
static inline bool is_meta_op( RdbOpcode op ) {
  return op == RDB_OP_IDLE || op == RDB_OP_FREQ ||
         op == RDB_OP_EXPIRED_MS || op == RDB_OP_EXPIRED_SEC;
}

/* maps the reserved bytes 0xf0 -> 0xff to opcodes, the set of opcodes
 * depends on the version in the header */
struct RdbOpTable {
  static const uint8_t FIRST_OP = 0xf0;
  uint8_t code[ 16 ];

  RdbOpTable() { this->zero(); }
  void zero( void );
  /* the default opcodes for version ver */
  void init( uint16_t ver );
  /* override one byte, false if b is not in the reserved range */
  bool set( uint8_t b,  RdbOpcode op );
  RdbOpcode lookup( uint8_t b ) const {
    if ( b < FIRST_OP )
      return RDB_OP_NONE;
    return (RdbOpcode) this->code[ b - FIRST_OP ];
  }
};

/* decompress in[ in_len ] into out[ out_len ], return size decompressed,
 * 0 on failure */
typedef size_t (*RdbDecompressFn)( const void *in,  size_t in_len,
                                   void *out,  size_t out_len,
                                   void *closure );
/* lzf_decompress(), the codec used by redis */
size_t rdb_lzf_decompress( const void *in,  size_t in_len,  void *out,
                           size_t out_len,  void *closure ) noexcept;

/* lzf can't expand more than this, a back ref is 3 bytes for 264 */
static const uint64_t RDB_LZF_MAX_RATIO = 128;

struct RdbDecompress {
  RdbDecompressFn fn;
  void          * closure;
  uint64_t        max_ratio; /* len over zlen refused before alloc, 0 = any */
  RdbDecompress() : fn( rdb_lzf_decompress ), closure( 0 ),
                    max_ratio( RDB_LZF_MAX_RATIO ) {}
};

/* the major length codec, always occurs in a rdb header
 *
 * length header: <= 0x3f         : 6 bit  ( 0 -> 0x3f )
 *                <= 0x7fff       : 14 bit ( 0 -> 0x3fff ) (big endian)
 *                == 0x80 4 bytes : 32 bit (big endian)
 *                == 0x81 8 bytes : 64 bit (big endian)
 *                -- 0xc0 <int8>
 *                -- 0xc1 <int16>
 *                -- 0xc2 <int32>
 *                == 0xc3 <zlen> <len> : compressed len, uncompressed len */
enum RdbLenKind {
  RDB_LEN_PLAIN = 0, /* len bytes follow, or a count */
  RDB_LEN_INT   = 1, /* ival is the value, nothing follows */
  RDB_LEN_LZF   = 2  /* zlen bytes follow, decompress to len */
};

struct RdbLength {
  uint64_t   len,  /* the length of data that follows */
             zlen, /* if lzf, this is compressed size */
             off;  /* stream offset of the tag byte */
  int64_t    ival; /* if int, the encoded signed integer */
  RdbLenKind kind;

  RdbLength() : len( 0 ), zlen( 0 ), off( 0 ), ival( 0 ),
                kind( RDB_LEN_PLAIN ) {}
  /* type of lengths */
  enum LengthEnc {
    RDB_LEN_ERR = -1,
    RDB_LEN_6   = 0, /* 0x00 6 bits, 0x3f */
    RDB_LEN_14  = 1, /* 0x40 14 bits, 0x3fff (big endian) */
    RDB_LEN_32  = 2, /* 0x80 32 bits, big endian */
    RDB_LEN_64  = 3, /* 0x81 64 bits, big endian */
    RDB_LZF     = 4, /* 0xc3 <zlen> <len> */
    RDB_INT8    = 5, /* 0xc0 8 bits */
    RDB_INT16   = 6, /* 0xc1 16 bits, little endian */
    RDB_INT32   = 7  /* 0xc2 32 bits, little endian */
  };
  /* convert a byte into a type */
  static LengthEnc length_encoding( uint8_t b ) {
    switch ( b & 0xc0 ) {
      case 0x00: return RDB_LEN_6;  /* len = 6 bits */
      case 0x40: return RDB_LEN_14; /* len = 14 bits */
      case 0x80: return ( b == 0x80 ) ? RDB_LEN_32 : /* len = 32 bits */
                        ( b == 0x81 ) ? RDB_LEN_64 : RDB_LEN_ERR; /* 64 bits */
      case 0xc0:
        switch ( b ) {
          case 0xc3: return RDB_LZF;   /* variable , 1 + <zlen> + <len> */
          case 0xc0: return RDB_INT8;  /* ival = 8 bits */
          case 0xc1: return RDB_INT16; /* ival = 16 bits */
          case 0xc2: return RDB_INT32; /* ival = 32 bits */
          default: break;
        }
        break;
    }
    return RDB_LEN_ERR;
  }
  /* read one length, int, or lzf marker from the cursor */
  RdbErrCode decode( RdbCursor &cur ) noexcept;
  /* read the bytes of the string this length describes, the int as
   * decimal digits, or the decompressed lzf data */
  RdbErrCode consume( RdbCursor &cur,  const RdbDecompress &dz,
                      std::string &str ) const;
};

/* per key hook return */
enum RdbAction {
  RDB_CONTINUE = 0,
  RDB_STOP     = 1  /* stop decoding, parse() returns RDB_OK */
};

/* consumer of the decoded keys */
struct RdbSink {
  virtual ~RdbSink() {}
  /* called foreach key, obj can be moved from */
  virtual RdbAction on_object( RdbObject &obj ) = 0;
  /* info that is not a key */
  virtual void on_dbselect( uint32_t db ) noexcept;
  virtual void on_dbresize( uint64_t keys,  uint64_t expires ) noexcept;
  virtual void on_aux( const std::string &var,
                       const std::string &val ) noexcept;
  virtual void on_module_aux( const std::string &module ) noexcept;
  virtual void on_function( const std::string &code ) noexcept;
};

/* sink that calls a function foreach key */
struct RdbFuncSink : public RdbSink {
  typedef std::function<RdbAction( RdbObject & )> ObjectFn;
  ObjectFn fn;

  RdbFuncSink( const ObjectFn &f ) : fn( f ) {}
  virtual RdbAction on_object( RdbObject &obj ) {
    return this->fn( obj );
  }
};

struct RdbFilter {
  virtual ~RdbFilter() {}
  /* returns true if key should be output */
  virtual bool match_key( const std::string &key ) noexcept;
};

static const uint16_t RDB_MIN_VERSION = 1,
                      RDB_MAX_VERSION = 12;

struct RdbConfig {
  RdbDecompress      dz;         /* lzf codec */
  RdbCrcFn           crc;        /* crc of the dump */
  const RdbOpTable * ops;        /* if null, use the default for version */
  RdbFilter        * filter;     /* if null, all keys go to the sink */
  uint16_t           min_ver,    /* supported range of versions */
                     max_ver;
  bool               verify_crc; /* check trailer crc */

  RdbConfig();
};

enum RdbState {
  RDB_ST_HEADER = 0, /* REDIS0012 */
  RDB_ST_OPCODE = 1, /* next byte is opcode or type */
  RDB_ST_OBJECT = 2, /* decoding a key */
  RDB_ST_DONE   = 3  /* eof, stopped, or error */
};

struct RdbStatus {
  RdbErrCode err;      /* result of parse() */
  uint64_t   off,      /* stream offset where err was detected */
             obj_cnt,  /* count of keys decoded */
             out_cnt;  /* count of keys passed to the sink */
  uint16_t   ver;      /* version in header */
  int        type_tag; /* the tag when err is RDB_ERR_TYPE */
  bool       stopped;  /* sink returned RDB_STOP */

  RdbStatus() : err( RDB_OK ), off( 0 ), obj_cnt( 0 ), out_cnt( 0 ),
                ver( 0 ), type_tag( -1 ), stopped( false ) {}
};

/* decode an rdb file which has a header, a body, and a trailer
 *
 * decode_header()  = REDIS + 4 digit version
 * parse() loop     = opcode or type tag, until EOF
 *   if type tag, decode_object() calls one of these :
 *     decode_elems()       : LIST, SET
 *     decode_hash()        : HASH
 *     decode_zset()        : ZSET, ZSET_2
 *     decode_hash_zipmap() : HASH_ZIPMAP
 *     decode_set_intset()  : SET_INTSET
 *     decode_ziplist()     : LIST_ZIPLIST, ZSET_ZIPLIST, HASH_ZIPLIST
 *     decode_listpack()    : HASH_LISTPACK, ZSET_LISTPACK, SET_LISTPACK
 *     decode_quicklist()   : LIST_QUICKLIST, LIST_QUICKLIST_2
 *     decode_stream()      : STREAM_LISTPACKS, _2, _3
 *     decode_module()      : MODULE_2
 * decode_trailer() = crc check
 *
 * an instance is used for one parse only */
struct RdbDecode {
  const RdbConfig & cfg;
  RdbCursor         cur;
  RdbOpTable        ops;    /* opcodes for ver */
  RdbMeta           meta;   /* pending for the next key */
  RdbStatus         status;
  RdbState          state;
  uint32_t          db;     /* current db select */
  uint16_t          ver;    /* rdb ver in header */

  RdbDecode( RdbSource &src,  const RdbConfig &c )
    : cfg( c ), cur( src, c.verify_crc ? c.crc : 0 ),
      state( RDB_ST_HEADER ), db( 0 ), ver( 0 ) {}

  /* decode the dump, calling sink foreach key */
  RdbErrCode parse( RdbSink &sink );
  /* check magic and version, set up ops */
  RdbErrCode decode_header( void ) noexcept;
  /* one opcode that is not a type */
  RdbErrCode decode_opcode( RdbOpcode op,  uint64_t op_off,  RdbSink &sink );
  /* tag is a type, decode the key and send it to the sink */
  RdbErrCode decode_entry( uint8_t tag,  uint64_t tag_off,  RdbSink &sink );
  /* dispatch on tag to build obj */
  RdbErrCode decode_object( uint8_t tag,  uint64_t tag_off,  RdbObject &obj );
  /* check the crc after the eof marker */
  RdbErrCode decode_trailer( void ) noexcept;

  RdbErrCode decode_elems( RdbObject &obj );
  RdbErrCode decode_hash( RdbObject &obj );
  RdbErrCode decode_zset( RdbObject &obj );
  RdbErrCode decode_hash_zipmap( RdbObject &obj );
  RdbErrCode decode_set_intset( RdbObject &obj );
  RdbErrCode decode_ziplist( RdbObject &obj );
  RdbErrCode decode_listpack( RdbObject &obj );
  RdbErrCode decode_quicklist( RdbObject &obj );
  RdbErrCode decode_stream( RdbObject &obj );
  RdbErrCode decode_module( RdbObject &obj );
  /* module aux data or a module value: opcodes until module eof */
  RdbErrCode skip_module_value( void );

  /* decode a length, must not be an int or lzf */
  RdbErrCode decode_len( uint64_t &val ) noexcept;
  /* decode a length and the string it describes */
  RdbErrCode decode_rlen( std::string &str );
  RdbErrCode fail( RdbErrCode err,  uint64_t off ) {
    return this->cur.fail( err, off );
  }
};

/* decode src with cfg, calling sink foreach key, status is optional */
RdbErrCode rdb_parse( RdbSource &src,  RdbSink &sink,  const RdbConfig &cfg,
                      RdbStatus *status = 0 );

/* the redis crc64, jones polynomial */
uint64_t jones_crc64( uint64_t crc,  const void *buf,  size_t len ) noexcept;

const char *rdb_type_name( uint8_t tag ) noexcept;
/* the 9 char module type name encoded in a module id */
void rdb_module_name( uint64_t module_id,  std::string &name );

} // namespace
#endif
#endif
