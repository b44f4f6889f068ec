#ifndef __rdbscan__rdb_object_h__
#define __rdbscan__rdb_object_h__

#include <stdint.h>
#include <string>
#include <vector>

#ifdef __cplusplus
namespace rdbscan {

enum RdbMetaFlags {
  RDB_META_EXPIRE     = 1, /* expire_ms is set */
  RDB_META_EXPIRE_SEC = 2, /* expire came from the second opcode */
  RDB_META_FREQ       = 4, /* freq is set */
  RDB_META_IDLE       = 8  /* idle is set */
};

/* the idle, freq, expired opcodes that belong to the next key */
struct RdbMeta {
  uint64_t expire_ms, /* absolute unix time in milliseconds */
           idle;      /* seconds since last access */
  uint8_t  freq,      /* lfu log counter */
           flags;     /* RdbMetaFlags, absent unless set */

  RdbMeta() : expire_ms( 0 ), idle( 0 ), freq( 0 ), flags( 0 ) {}

  void zero( void ) {
    this->expire_ms = 0;
    this->idle      = 0;
    this->freq      = 0;
    this->flags     = 0;
  }
  void set_expire_ms( uint64_t ms ) {
    this->expire_ms = ms;
    this->flags = ( this->flags & ~RDB_META_EXPIRE_SEC ) | RDB_META_EXPIRE;
  }
  void set_expire_sec( uint32_t sec ) {
    this->expire_ms = (uint64_t) sec * 1000;
    this->flags |= RDB_META_EXPIRE | RDB_META_EXPIRE_SEC;
  }
  void set_freq( uint8_t f ) {
    this->freq   = f;
    this->flags |= RDB_META_FREQ;
  }
  void set_idle( uint64_t i ) {
    this->idle   = i;
    this->flags |= RDB_META_IDLE;
  }
  bool has_expire( void ) const { return ( this->flags & RDB_META_EXPIRE ) != 0; }
  bool has_freq( void ) const   { return ( this->flags & RDB_META_FREQ ) != 0; }
  bool has_idle( void ) const   { return ( this->flags & RDB_META_IDLE ) != 0; }
  bool is_empty( void ) const   { return this->flags == 0; }
  /* return the pending meta and clear it, once per key */
  RdbMeta take_and_reset( void ) {
    RdbMeta m = *this;
    this->zero();
    return m;
  }
};

/* the logical kind of a key, independent of the encoding in the dump */
enum RdbObjKind {
  RDB_KIND_STRING = 0,
  RDB_KIND_LIST   = 1,
  RDB_KIND_SET    = 2,
  RDB_KIND_ZSET   = 3,
  RDB_KIND_HASH   = 4,
  RDB_KIND_STREAM = 5,
  RDB_KIND_MODULE = 6
};

struct RdbHashPair {
  std::string field, /* a hash field = value */
              value;
};

struct RdbZSetPair {
  std::string member; /* a zset member with score */
  double      score;
};

struct RdbStreamId {
  uint64_t ms,  /* a stream id is an incrementing 128 bit number */
           seq; /* usually the UTC milliseconds + a serial */
  RdbStreamId() : ms( 0 ), seq( 0 ) {}
  void set( uint64_t m,  uint64_t s ) {
    this->ms  = m;
    this->seq = s;
  }
};

struct RdbStreamRecord {
  RdbStreamId              id;
  std::vector<RdbHashPair> fields;
};

struct RdbStreamPend {
  RdbStreamId id;            /* this pending entry id */
  uint64_t    delivery_time, /* last time delivered, ms */
              delivery_cnt;  /* count of times delivered */
};

struct RdbStreamConsumer {
  std::string              name;
  uint64_t                 seen_time,   /* ms, last interaction */
                           active_time; /* ms, last read, version 3 only */
  std::vector<RdbStreamId> pending;     /* ids owned by this consumer */
};

struct RdbStreamGroup {
  std::string                    name;
  RdbStreamId                    last;         /* last id delivered */
  uint64_t                       entries_read; /* version 2 and up */
  std::vector<RdbStreamPend>     pending;
  std::vector<RdbStreamConsumer> consumers;
};

struct RdbStream {
  std::vector<RdbStreamRecord> records;       /* not deleted entries */
  uint64_t                     length,        /* count of entries */
                               entries_added; /* version 2 and up */
  RdbStreamId                  last,          /* last id used */
                               first,         /* version 2 and up */
                               max_deleted;   /* version 2 and up */
  std::vector<RdbStreamGroup>  groups;
  RdbStream() : length( 0 ), entries_added( 0 ) {}
};

/* a key and its value, the payload used depends on kind:
 *   STRING : str
 *   LIST   : elems, in list order
 *   SET    : elems, in dump order
 *   ZSET   : zset
 *   HASH   : hash, in dump order
 *   STREAM : stream
 *   MODULE : str is the module name, module_ver its version */
struct RdbObject {
  RdbObjKind               kind;
  uint8_t                  type;       /* RdbType tag as it was in the dump */
  uint32_t                 db,         /* selected db when decoded */
                           module_ver;
  std::string              key,
                           str;
  RdbMeta                  meta;       /* expire, freq, idle of this key */
  std::vector<std::string> elems;
  std::vector<RdbHashPair> hash;
  std::vector<RdbZSetPair> zset;
  RdbStream                stream;

  RdbObject() : kind( RDB_KIND_STRING ), type( 0 ), db( 0 ),
                module_ver( 0 ) {}
  /* number of elements or fields, 1 for string and module */
  size_t count( void ) const;
  const char *kind_name( void ) const noexcept;
};

} // namespace
#endif
#endif
