#include <string.h>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <rdbscan/rdb_decode.h>
#include "rdb_test_util.h"

using namespace rdbscan;
using namespace rdbscan::test;

namespace {
struct SkipFilter : public RdbFilter {
  virtual bool match_key( const std::string &key ) noexcept {
    return key != "skip";
  }
};
}

TEST( rdb_decode_test, MinimalDumpHasNoObjects )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 12 ).selectdb( 0 ).eof();
  ASSERT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  EXPECT_TRUE( sink.objs.empty() );
  EXPECT_EQ( 0u, status.obj_cnt );
  EXPECT_EQ( 12, status.ver );
  ASSERT_EQ( 1u, sink.dbs.size() );
  EXPECT_EQ( 0u, sink.dbs[ 0 ] );
}

TEST( rdb_decode_test, FreqAttachesToKey )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 12 ).selectdb( 0 ).resizedb( 1, 0 ).freq( 42 );
  b.string_kv( "key1", "val1" ).eof_nocrc();
  cfg.verify_crc = false;
  ASSERT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  ASSERT_EQ( 1u, sink.objs.size() );
  const RdbObject &o = sink.objs[ 0 ];
  EXPECT_EQ( "key1", o.key );
  EXPECT_EQ( "val1", o.str );
  EXPECT_TRUE( o.meta.has_freq() );
  EXPECT_EQ( 42, o.meta.freq );
  EXPECT_FALSE( o.meta.has_idle() );
  EXPECT_FALSE( o.meta.has_expire() );
  EXPECT_EQ( 1u, sink.resize_keys );
  EXPECT_EQ( 0u, sink.resize_expires );
}

TEST( rdb_decode_test, IdleAttachesToKey )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 12 ).selectdb( 0 ).resizedb( 1, 0 ).idle( 1000 );
  b.string_kv( "key2", "val2" ).eof_nocrc();
  cfg.verify_crc = false;
  ASSERT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  ASSERT_EQ( 1u, sink.objs.size() );
  const RdbObject &o = sink.objs[ 0 ];
  EXPECT_EQ( "key2", o.key );
  EXPECT_EQ( "val2", o.str );
  EXPECT_TRUE( o.meta.has_idle() );
  EXPECT_EQ( 1000u, o.meta.idle );
  EXPECT_FALSE( o.meta.has_freq() );
}

TEST( rdb_decode_test, Version12AlternateMetaBytes )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 12 ).selectdb( 0 );
  b.byte( 0xf4 ).byte( 7 ).byte( 0xf5 ).len( 300 );
  b.string_kv( "k", "v" ).eof();
  ASSERT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  ASSERT_EQ( 1u, sink.objs.size() );
  EXPECT_EQ( 7, sink.objs[ 0 ].meta.freq );
  EXPECT_EQ( 300u, sink.objs[ 0 ].meta.idle );
}

TEST( rdb_decode_test, MetaDoesNotLeakToNextKey )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 12 ).selectdb( 0 ).freq( 10 ).string_kv( "key1", "a" );
  b.string_kv( "key2", "b" ).eof();
  ASSERT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  ASSERT_EQ( 2u, sink.objs.size() );
  EXPECT_TRUE( sink.objs[ 0 ].meta.has_freq() );
  EXPECT_EQ( 10, sink.objs[ 0 ].meta.freq );
  EXPECT_FALSE( sink.objs[ 1 ].meta.has_freq() );
  EXPECT_TRUE( sink.objs[ 1 ].meta.is_empty() );
}

TEST( rdb_decode_test, FreqAndIdleTogether )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 10 ).selectdb( 0 ).idle( 5 ).freq( 3 ).string_kv( "k", "v" ).eof();
  ASSERT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  ASSERT_EQ( 1u, sink.objs.size() );
  EXPECT_EQ( 5u, sink.objs[ 0 ].meta.idle );
  EXPECT_EQ( 3, sink.objs[ 0 ].meta.freq );
  EXPECT_TRUE( sink.objs[ 0 ].meta.has_idle() );
  EXPECT_TRUE( sink.objs[ 0 ].meta.has_freq() );
}

TEST( rdb_decode_test, ExpireMsAttachesToOneKey )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 9 ).selectdb( 0 ).expire_ms( 1700000000123ULL );
  b.string_kv( "a", "1" ).string_kv( "b", "2" ).eof();
  ASSERT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  ASSERT_EQ( 2u, sink.objs.size() );
  EXPECT_TRUE( sink.objs[ 0 ].meta.has_expire() );
  EXPECT_EQ( 1700000000123ULL, sink.objs[ 0 ].meta.expire_ms );
  EXPECT_EQ( 0, sink.objs[ 0 ].meta.flags & RDB_META_EXPIRE_SEC );
  EXPECT_FALSE( sink.objs[ 1 ].meta.has_expire() );
}

TEST( rdb_decode_test, ExpireSecondsStoredAsMs )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 6 ).selectdb( 0 ).expire_sec( 1700000000U ).string_kv( "a", "1" );
  b.eof();
  ASSERT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  ASSERT_EQ( 1u, sink.objs.size() );
  EXPECT_EQ( 1700000000000ULL, sink.objs[ 0 ].meta.expire_ms );
  EXPECT_NE( 0, sink.objs[ 0 ].meta.flags & RDB_META_EXPIRE_SEC );
}

TEST( rdb_decode_test, OrderAndMetaPreserved )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 11 ).selectdb( 0 );
  b.string_kv( "k0", "v" );
  b.freq( 1 ).string_kv( "k1", "v" );
  b.idle( 2 ).string_kv( "k2", "v" );
  b.expire_ms( 3 ).freq( 4 ).idle( 5 ).string_kv( "k3", "v" );
  b.expire_ms( 6 ).string_kv( "k4", "v" );
  b.eof();
  ASSERT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  ASSERT_EQ( 5u, sink.objs.size() );
  for ( size_t i = 0; i < 5; i++ ) {
    char key[ 4 ] = { 'k', (char) ( '0' + i ), 0, 0 };
    EXPECT_EQ( key, sink.objs[ i ].key );
  }
  EXPECT_TRUE( sink.objs[ 0 ].meta.is_empty() );
  EXPECT_EQ( RDB_META_FREQ, sink.objs[ 1 ].meta.flags );
  EXPECT_EQ( RDB_META_IDLE, sink.objs[ 2 ].meta.flags );
  EXPECT_EQ( RDB_META_EXPIRE | RDB_META_FREQ | RDB_META_IDLE,
             sink.objs[ 3 ].meta.flags );
  EXPECT_EQ( 3u, sink.objs[ 3 ].meta.expire_ms );
  EXPECT_EQ( 4, sink.objs[ 3 ].meta.freq );
  EXPECT_EQ( 5u, sink.objs[ 3 ].meta.idle );
  EXPECT_EQ( RDB_META_EXPIRE, sink.objs[ 4 ].meta.flags );
  EXPECT_EQ( 6u, sink.objs[ 4 ].meta.expire_ms );
}

TEST( rdb_decode_test, StopAfterFirstObject )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 12 ).selectdb( 0 ).string_kv( "a", "1" ).string_kv( "b", "2" );
  b.string_kv( "c", "3" ).eof();
  sink.stop_after = 1;
  ASSERT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  ASSERT_EQ( 1u, sink.objs.size() );
  EXPECT_EQ( "a", sink.objs[ 0 ].key );
  EXPECT_TRUE( status.stopped );
  EXPECT_EQ( 1u, status.obj_cnt );
}

TEST( rdb_decode_test, FuncSinkStops )
{
  RdbBuilder b;
  RdbConfig  cfg;
  RdbStatus  status;
  size_t     cnt = 0;

  b.hdr( 12 ).string_kv( "a", "1" ).string_kv( "b", "2" ).eof();
  RdbFuncSink sink( [&cnt]( RdbObject & ) {
    return ++cnt == 2 ? RDB_STOP : RDB_CONTINUE;
  } );
  ASSERT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  EXPECT_EQ( 2u, cnt );
  EXPECT_TRUE( status.stopped );
}

TEST( rdb_decode_test, InvalidLengthAtTagByte )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 12 ).selectdb( 0 ).byte( RDB_STRING ).byte( 0x84 ).raw( "junk" );
  EXPECT_EQ( RDB_ERR_LEN, parse_dump( b.buf, sink, cfg, status ) );
  EXPECT_EQ( RDB_ERR_LEN, status.err );
  EXPECT_EQ( 12u, status.off );
  EXPECT_TRUE( sink.objs.empty() );
}

TEST( rdb_decode_test, TruncatedMidKeyLength )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 12 ).selectdb( 0 ).string_kv( "key1", "val1" );
  b.byte( RDB_STRING ).byte( 0x80 ).byte( 0x00 ); /* 32 bit len cut */
  EXPECT_EQ( RDB_ERR_TRUNC, parse_dump( b.buf, sink, cfg, status ) );
  ASSERT_EQ( 1u, sink.objs.size() );
  EXPECT_EQ( "key1", sink.objs[ 0 ].key );
  EXPECT_EQ( 1u, status.obj_cnt );
}

TEST( rdb_decode_test, TruncatedFromPipe )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;

  b.hdr( 12 ).selectdb( 0 ).string_kv( "key1", "val1" ).byte( RDB_STRING );
  b.str( "key2" ).byte( 10 ).raw( "abc" );
  ChunkSource src( b.buf, 3 );
  RdbDecode   dec( src, cfg );
  EXPECT_EQ( RDB_ERR_TRUNC, dec.parse( sink ) );
  EXPECT_EQ( 1u, sink.objs.size() );
  EXPECT_EQ( b.buf.size() - 3, dec.status.off );
}

TEST( rdb_decode_test, WrongCrcAfterAllObjects )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 12 ).selectdb( 0 ).string_kv( "a", "1" ).string_kv( "b", "2" );
  b.eof();
  b.buf[ b.buf.size() - 1 ] ^= 0x55;
  EXPECT_EQ( RDB_ERR_CRC, parse_dump( b.buf, sink, cfg, status ) );
  EXPECT_EQ( 2u, sink.objs.size() );
  EXPECT_EQ( b.buf.size() - 8, status.off );
}

TEST( rdb_decode_test, CrcChecks )
{
  RdbBuilder b;
  b.hdr( 12 ).selectdb( 0 ).string_kv( "a", "1" );
  std::string body = b.buf;

  /* correct crc */
  {
    CollectSink sink;
    RdbConfig   cfg;
    RdbStatus   status;
    b.eof();
    EXPECT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  }
  /* zero crc is not checked */
  {
    CollectSink sink;
    RdbConfig   cfg;
    RdbStatus   status;
    RdbBuilder  z;
    z.raw( body ).eof_nocrc();
    EXPECT_EQ( RDB_OK, parse_dump( z.buf, sink, cfg, status ) );
  }
  /* bad crc, not verified */
  {
    CollectSink sink;
    RdbConfig   cfg;
    RdbStatus   status;
    RdbBuilder  x;
    x.raw( body ).byte( 0xff ).le64( 12345 );
    cfg.verify_crc = false;
    EXPECT_EQ( RDB_OK, parse_dump( x.buf, sink, cfg, status ) );
    EXPECT_EQ( 1u, sink.objs.size() );
  }
  /* trailer cut */
  {
    CollectSink sink;
    RdbConfig   cfg;
    RdbStatus   status;
    RdbBuilder  t;
    t.raw( body ).byte( 0xff ).le32( 0 );
    EXPECT_EQ( RDB_ERR_TRUNC, parse_dump( t.buf, sink, cfg, status ) );
  }
}

TEST( rdb_decode_test, OldVersionHasNoTrailer )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 4 ).selectdb( 0 ).string_kv( "a", "1" ).byte( 0xff );
  ASSERT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  EXPECT_EQ( 1u, sink.objs.size() );
  EXPECT_EQ( 4, status.ver );
}

TEST( rdb_decode_test, HeaderChecks )
{
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  EXPECT_EQ( RDB_ERR_HDR, parse_dump( "REDIX0009\xff", sink, cfg, status ) );
  EXPECT_EQ( 0u, status.off );
  EXPECT_EQ( RDB_ERR_HDR, parse_dump( "REDIS00a9\xff", sink, cfg, status ) );
  EXPECT_EQ( 7u, status.off );
  EXPECT_EQ( RDB_ERR_VERSION, parse_dump( "REDIS0013\xff", sink, cfg,
                                          status ) );
  EXPECT_EQ( 13, status.ver );
  EXPECT_EQ( RDB_ERR_VERSION, parse_dump( "REDIS0000\xff", sink, cfg,
                                          status ) );
  EXPECT_EQ( RDB_ERR_TRUNC, parse_dump( "REDIS", sink, cfg, status ) );

  cfg.min_ver = 9;
  EXPECT_EQ( RDB_ERR_VERSION, parse_dump( "REDIS0008\xff", sink, cfg,
                                          status ) );
  EXPECT_TRUE( sink.objs.empty() );
}

TEST( rdb_decode_test, OpcodesDependOnVersion )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  /* AUX was added in version 7 */
  b.hdr( 6 ).aux( "redis-ver", "3.0.0" );
  EXPECT_EQ( RDB_ERR_TYPE, parse_dump( b.buf, sink, cfg, status ) );
  EXPECT_EQ( 0xfa, status.type_tag );
  EXPECT_EQ( 9u, status.off );

  RdbOpTable ops;
  ops.init( 9 );
  EXPECT_EQ( RDB_OP_FREQ, ops.lookup( 0xf9 ) );
  EXPECT_EQ( RDB_OP_NONE, ops.lookup( 0xf4 ) );
  EXPECT_EQ( RDB_OP_NONE, ops.lookup( 0xf5 ) );
  ops.init( 10 );
  EXPECT_EQ( RDB_OP_FUNCTION, ops.lookup( 0xf5 ) );
  ops.init( 11 );
  EXPECT_EQ( RDB_OP_FUNCTION, ops.lookup( 0xf5 ) );
  ops.init( 12 );
  EXPECT_EQ( RDB_OP_FREQ, ops.lookup( 0xf4 ) );
  EXPECT_EQ( RDB_OP_IDLE, ops.lookup( 0xf5 ) );
  EXPECT_EQ( RDB_OP_NONE, ops.lookup( 0xf6 ) );
  EXPECT_EQ( RDB_OP_NONE, ops.lookup( RDB_STRING ) );
}

TEST( rdb_decode_test, FunctionLibrarySkipped )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;
  const char * lib = "#!lua name=mylib\n"
                     "redis.register_function('f', function() return 1 end)";

  b.hdr( 10 ).aux( "redis-ver", "7.0.0" ).function( lib );
  b.selectdb( 0 ).string_kv( "k", "v" ).eof();
  ASSERT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  ASSERT_EQ( 1u, sink.functions.size() );
  EXPECT_EQ( lib, sink.functions[ 0 ] );
  ASSERT_EQ( 1u, sink.objs.size() );
  EXPECT_EQ( "k", sink.objs[ 0 ].key );
  EXPECT_FALSE( sink.objs[ 0 ].meta.has_idle() );
}

TEST( rdb_decode_test, CustomOpTable )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;
  RdbOpTable  ops;

  ops.init( 9 );
  EXPECT_TRUE( ops.set( 0xf0, RDB_OP_FREQ ) );
  EXPECT_FALSE( ops.set( 0x10, RDB_OP_FREQ ) );
  EXPECT_EQ( RDB_OP_NONE, ops.lookup( 0x10 ) );
  cfg.ops = &ops;

  b.hdr( 9 ).selectdb( 0 ).byte( 0xf0 ).byte( 99 ).string_kv( "k", "v" );
  b.eof();
  ASSERT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  ASSERT_EQ( 1u, sink.objs.size() );
  EXPECT_EQ( 99, sink.objs[ 0 ].meta.freq );
}

TEST( rdb_decode_test, DanglingMetaFails )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 12 ).selectdb( 0 ).freq( 5 ).selectdb( 1 ).string_kv( "k", "v" );
  b.eof();
  EXPECT_EQ( RDB_ERR_META, parse_dump( b.buf, sink, cfg, status ) );
  EXPECT_EQ( 13u, status.off );
  EXPECT_TRUE( sink.objs.empty() );

  RdbBuilder e;
  CollectSink sink2;
  e.hdr( 12 ).idle( 5 ).eof();
  EXPECT_EQ( RDB_ERR_META, parse_dump( e.buf, sink2, cfg, status ) );
  EXPECT_EQ( 11u, status.off );
}

TEST( rdb_decode_test, IdleMustBePlainLength )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 12 ).selectdb( 0 ).byte( 0xf8 ).byte( 0xc1 ).byte( 0xe8 ).byte( 3 );
  b.string_kv( "k", "v" ).eof();
  EXPECT_EQ( RDB_ERR_LEN, parse_dump( b.buf, sink, cfg, status ) );
  EXPECT_EQ( 12u, status.off );
}

TEST( rdb_decode_test, AuxResizeAndSelect )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 11 ).aux( "redis-ver", "7.2.0" ).aux( "aof-base", "0" );
  b.selectdb( 3 ).resizedb( 2, 1 ).string_kv( "k", "v" ).eof();
  ASSERT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  ASSERT_EQ( 2u, sink.aux.size() );
  EXPECT_EQ( "redis-ver=7.2.0", sink.aux[ 0 ] );
  EXPECT_EQ( 2u, sink.resize_keys );
  EXPECT_EQ( 1u, sink.resize_expires );
  ASSERT_EQ( 1u, sink.objs.size() );
  EXPECT_EQ( 3u, sink.objs[ 0 ].db );
}

TEST( rdb_decode_test, ModuleAuxSkipped )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 10 ).byte( 0xf7 ).byte( 0x81 ).be64( module_id( "search-db", 2 ) );
  b.len( 2 ).len( 2 );                /* when opcode, when */
  b.len( 5 ).str( "opaque" ).len( 0 );
  b.selectdb( 0 ).string_kv( "k", "v" ).eof();
  ASSERT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  ASSERT_EQ( 1u, sink.modules.size() );
  EXPECT_EQ( "search-db", sink.modules[ 0 ] );
  EXPECT_EQ( 1u, sink.objs.size() );
}

TEST( rdb_decode_test, UnknownTypeFails )
{
  static const uint8_t tags[] = { RDB_MODULE, 8, 22, 25, 100 };
  for ( size_t i = 0; i < sizeof( tags ); i++ ) {
    RdbBuilder  b;
    CollectSink sink;
    RdbConfig   cfg;
    RdbStatus   status;
    b.hdr( 12 ).selectdb( 0 ).string_kv( "a", "1" ).byte( tags[ i ] );
    b.str( "k" ).str( "v" ).eof();
    EXPECT_EQ( RDB_ERR_TYPE, parse_dump( b.buf, sink, cfg, status ) );
    EXPECT_EQ( (int) tags[ i ], status.type_tag );
    EXPECT_EQ( 16u, status.off );
    EXPECT_EQ( 1u, sink.objs.size() );
  }
}

TEST( rdb_decode_test, DecoderIsSingleUse )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;

  b.hdr( 12 ).string_kv( "a", "1" ).eof();
  RdbMemSource src( b.buf.data(), b.buf.size() );
  RdbDecode    dec( src, cfg );
  EXPECT_EQ( RDB_OK, dec.parse( sink ) );
  EXPECT_EQ( RDB_ERR_OUTPUT, dec.parse( sink ) );
  EXPECT_EQ( RDB_OK, dec.status.err );
  EXPECT_EQ( 1u, sink.objs.size() );
}

TEST( rdb_decode_test, FilteredKeysConsumeMeta )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;
  SkipFilter  filter;

  b.hdr( 12 ).selectdb( 0 ).freq( 1 ).string_kv( "skip", "x" );
  b.string_kv( "keep", "y" ).eof();
  cfg.filter = &filter;
  ASSERT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  ASSERT_EQ( 1u, sink.objs.size() );
  EXPECT_EQ( "keep", sink.objs[ 0 ].key );
  EXPECT_TRUE( sink.objs[ 0 ].meta.is_empty() );
  EXPECT_EQ( 2u, status.obj_cnt );
  EXPECT_EQ( 1u, status.out_cnt );
}

TEST( rdb_decode_test, LzfCompressedValue )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  b.hdr( 12 ).selectdb( 0 ).byte( RDB_STRING ).str( "k" );
  b.byte( 0xc3 ).len( 4 ).len( 3 ).byte( 0x02 ).raw( "abc" );
  b.eof();
  ASSERT_EQ( RDB_OK, parse_dump( b.buf, sink, cfg, status ) );
  ASSERT_EQ( 1u, sink.objs.size() );
  EXPECT_EQ( "abc", sink.objs[ 0 ].str );
}

TEST( rdb_decode_test, LzfMismatchFails )
{
  RdbBuilder  b;
  CollectSink sink;
  RdbConfig   cfg;
  RdbStatus   status;

  /* literal run of 3, declared as 5 */
  b.hdr( 12 ).selectdb( 0 ).byte( RDB_STRING ).str( "k" );
  b.byte( 0xc3 ).len( 4 ).len( 5 ).byte( 0x02 ).raw( "abc" );
  b.eof();
  EXPECT_EQ( RDB_ERR_LZF, parse_dump( b.buf, sink, cfg, status ) );
  EXPECT_EQ( 14u, status.off );
  EXPECT_TRUE( sink.objs.empty() );
}
