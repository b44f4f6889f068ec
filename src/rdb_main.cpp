#ifdef _MSC_VER
#define _CRT_SECURE_NO_WARNINGS
#endif
#if defined( _MSC_VER ) || defined( __MINGW32__ )
#define RDB_WINDOWS 1
#endif
#include <stdio.h>
#include <string.h>
#include <stdint.h>
#include <stdlib.h>
#define __STDC_FORMAT_MACROS
#include <inttypes.h>
#ifndef RDB_WINDOWS
#include <unistd.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <sys/mman.h>
#else
#include <windows.h>
#endif
#include <rdbscan/rdb_decode.h>
#include <rdbscan/rdb_pcre.h>

using namespace rdbscan;

/* print a key, binary bytes are escaped */
static void
print_s( const std::string &str )
{
  static const char hex[] = "0123456789abcdef";
  char   out[ 128 ];
  size_t sz = 0;

  for ( size_t i = 0; i < str.size(); i++ ) {
    uint8_t c = (uint8_t) str[ i ];
    if ( c >= ' ' && c <= 126 ) {
      if ( c == '\\' || c == '"' )
        out[ sz++ ] = '\\';
      out[ sz++ ] = (char) c;
    }
    else {
      out[ sz++ ] = '\\';
      switch ( c ) {
        case '\n': out[ sz++ ] = 'n'; break;
        case '\r': out[ sz++ ] = 'r'; break;
        case '\t': out[ sz++ ] = 't'; break;
        default:   out[ sz++ ] = 'x';
                   out[ sz++ ] = hex[ c >> 4 ];
                   out[ sz++ ] = hex[ c & 0xf ]; break;
      }
    }
    if ( sz > 120 ) {
      fwrite( out, 1, sz, stdout );
      sz = 0;
    }
  }
  if ( sz > 0 )
    fwrite( out, 1, sz, stdout );
}

/* one line per key: db type key count [meta] */
struct ScanOutput : public RdbSink {
  uint64_t key_cnt;
  bool     show_meta,  /* expire, freq, idle, aux */
           count_only; /* only the total */

  ScanOutput() : key_cnt( 0 ), show_meta( false ), count_only( false ) {}

  virtual RdbAction on_object( RdbObject &obj ) {
    this->key_cnt++;
    if ( this->count_only )
      return RDB_CONTINUE;
    printf( "%u %s ", obj.db, rdb_type_name( obj.type ) );
    print_s( obj.key );
    if ( obj.kind == RDB_KIND_MODULE )
      printf( " %s.%u", obj.str.c_str(), obj.module_ver );
    else if ( obj.kind != RDB_KIND_STRING )
      printf( " %" PRIu64 "", (uint64_t) obj.count() );
    else
      printf( " %" PRIu64 "", (uint64_t) obj.str.size() );
    if ( this->show_meta ) {
      if ( obj.meta.has_expire() )
        printf( " expire_ms=%" PRIu64 "", obj.meta.expire_ms );
      if ( obj.meta.has_freq() )
        printf( " freq=%u", obj.meta.freq );
      if ( obj.meta.has_idle() )
        printf( " idle=%" PRIu64 "", obj.meta.idle );
    }
    printf( "\n" );
    return RDB_CONTINUE;
  }
  virtual void on_aux( const std::string &var,
                       const std::string &val ) noexcept {
    if ( ! this->show_meta || this->count_only )
      return;
    printf( "aux " );
    print_s( var ); printf( " " ); print_s( val ); printf( "\n" );
  }
  virtual void on_dbresize( uint64_t keys,  uint64_t expires ) noexcept {
    if ( ! this->show_meta || this->count_only )
      return;
    printf( "dbresize %" PRIu64 " %" PRIu64 "\n", keys, expires );
  }
  virtual void on_module_aux( const std::string &module ) noexcept {
    if ( ! this->show_meta || this->count_only )
      return;
    printf( "module_aux %s\n", module.c_str() );
  }
  virtual void on_function( const std::string &code ) noexcept {
    if ( ! this->show_meta || this->count_only )
      return;
    printf( "function %" PRIu64 " bytes\n", (uint64_t) code.size() );
  }
};

static const char *
get_arg( int argc, char *argv[], int b, const char *f, const char *def )
{
  for ( int i = 1; i < argc - b; i++ )
    if ( ::strcmp( f, argv[ i ] ) == 0 ) /* -e pat */
      return argv[ i + b ];
  return def; /* default value */
}

int
main( int argc, char *argv[] )
{
  const char * glob     = get_arg( argc, argv, 1, "-e", NULL ),
             * invert   = get_arg( argc, argv, 0, "-v", NULL ),
             * ign_case = get_arg( argc, argv, 0, "-i", NULL ),
             * fn       = get_arg( argc, argv, 1, "-f", NULL ),
             * meta     = get_arg( argc, argv, 0, "-m", NULL ),
             * count    = get_arg( argc, argv, 0, "-c", NULL ),
             * no_crc   = get_arg( argc, argv, 0, "-n", NULL ),
             * help     = get_arg( argc, argv, 0, "-h", NULL );
  if ( help != NULL ) {
    printf( "%s [-e pat] [-v] [-i] [-f file] [-m] [-c] [-n]\n"
            "   -e pat  : match key with glob pattern\n"
            "   -v      : invert key match\n"
            "   -i      : ignore key match case\n"
            "   -f file : dump rdb file to read\n"
            "   -m      : show expire, freq, idle and aux data\n"
            "   -c      : only print the count of keys which match\n"
            "   -n      : do not check the crc trailer\n"
            "default is to print a line for each matching key\n"
            "if no file is given, will read data from stdin\n", argv[ 0 ] );
    return 0;
  }

  RdbConfig  cfg;
  PcreFilter pcre_filter;
  ScanOutput out;
  void     * map     = NULL;
  size_t     map_len = 0;

  /* set up key filter */
  if ( glob != NULL ) {
    if ( ! pcre_filter.set_filter_expr( glob, ::strlen( glob ),
                                        ( ign_case != NULL ),
                                        ( invert != NULL ) ) ) {
      fprintf( stderr, "pcre filter failed\n" );
      return 1;
    }
    cfg.filter = &pcre_filter;
  }
  cfg.verify_crc = ( no_crc == NULL );
  out.show_meta  = ( meta != NULL );
  out.count_only = ( count != NULL );

  /* map the file, if filename given */
  if ( fn != NULL ) {
#ifndef RDB_WINDOWS
    int fd = ::open( fn, O_RDONLY );
    struct stat st;
    if ( fd < 0 ) {
      ::perror( fn );
      return 1;
    }
    if ( ::fstat( fd, &st ) != 0 ) {
      ::perror( "fstat" );
      ::close( fd );
      return 1;
    }
    map_len = st.st_size;
    if ( map_len > 0 ) {
      map = ::mmap( 0, map_len, PROT_READ, MAP_SHARED, fd, 0 );
      if ( map == MAP_FAILED ) {
        ::perror( "mmap" );
        ::close( fd );
        return 1;
      }
      if ( ::madvise( map, map_len, MADV_SEQUENTIAL ) != 0 )
        ::perror( "madvise" );
    }
    ::close( fd );
#else
    HANDLE h = CreateFileA( fn, GENERIC_READ, 0, NULL,
                            OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, NULL );
    LARGE_INTEGER st;
    if ( h == INVALID_HANDLE_VALUE ) {
      fprintf( stderr, "err open %s: %ld\n", fn, GetLastError() );
      return 1;
    }
    GetFileSizeEx( h, &st );
    map_len = st.QuadPart;
    HANDLE maph = CreateFileMappingA( h, NULL, PAGE_READONLY, 0, 0, NULL );
    if ( maph == NULL ) {
      fprintf( stderr, "err map %s: %ld\n", fn, GetLastError() );
      CloseHandle( h );
      return 1;
    }
    map = MapViewOfFile( maph, FILE_MAP_READ, 0, 0, 0 );
    if ( map == NULL ) {
      fprintf( stderr, "err view %s: %ld\n", fn, GetLastError() );
      CloseHandle( h );
      CloseHandle( maph );
      return 1;
    }
    CloseHandle( h );
    CloseHandle( maph );
#endif
  }
#ifdef RDB_WINDOWS
  else {
    freopen( NULL, "rb", stdin );
  }
#endif

  RdbMemSource mem( map, map_len );
  RdbFdSource  in( 0 );
  RdbSource  & src = ( fn != NULL ) ? (RdbSource &) mem : (RdbSource &) in;
  RdbDecode    decode( src, cfg );
  RdbErrCode   err = decode.parse( out );
  int          status = 0;

  if ( err != RDB_OK ) {
    char tmp[ 64 ];
    fprintf( stderr, "%s", rdb_err_description( err ) );
    if ( err == RDB_ERR_TYPE )
      fprintf( stderr, " (%d)", decode.status.type_tag );
    if ( err == RDB_ERR_TRUNC && in.err_no != 0 )
      fprintf( stderr, " (%s)", ::strerror( in.err_no ) );
    fprintf( stderr, "\n" );
    snprintf( tmp, sizeof( tmp ), "offset %" PRIu64 " (0x%" PRIx64 ")",
              decode.status.off, decode.status.off );
    decode.cur.show_window( tmp );
    status = 1;
  }
  if ( out.count_only || status != 0 )
    printf( "%" PRIu64 " keys\n", out.key_cnt );
#ifndef RDB_WINDOWS
  if ( map != NULL )
    ::munmap( map, map_len );
#else
  if ( map != NULL )
    UnmapViewOfFile( map );
#endif
  return status;
}
