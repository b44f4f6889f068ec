#include <stdio.h>
#include <stdint.h>
#include <string.h>
#include <strings.h>
#include <stdlib.h>
#include <rdbscan/rdb_decode.h>
#include <rdbscan/rdb_pcre.h>
#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

using namespace rdbscan;

bool
rdbscan::glob_to_pcre( const char *expr,  size_t expr_len,  std::string &pat )
{
  static const char meta[] = "\\^$.+(){}";
  size_t i = 0;

  pat.assign( "^(?:" );
  while ( i < expr_len ) {
    char c = expr[ i++ ];
    switch ( c ) {
      case '*': pat.append( ".*" ); break;
      case '?': pat.append( "." ); break;
      case '|': pat.append( "|" ); break;
      case '[': { /* character class, copied up to ] */
        size_t j = i;
        if ( j < expr_len && ( expr[ j ] == '!' || expr[ j ] == '^' ) )
          j++;
        if ( j < expr_len && expr[ j ] == ']' ) /* []] has ] as a member */
          j++;
        while ( j < expr_len && expr[ j ] != ']' )
          j++;
        if ( j == expr_len )
          return false;
        pat += '[';
        if ( expr[ i ] == '!' || expr[ i ] == '^' ) {
          pat += '^';
          i++;
        }
        for ( ; i < j; i++ ) {
          if ( expr[ i ] == '\\' || expr[ i ] == '[' )
            pat += '\\';
          pat += expr[ i ];
        }
        pat += ']';
        i = j + 1;
        break;
      }
      case '\\': /* escaped char is literal */
        if ( i < expr_len )
          c = expr[ i++ ];
        /* FALLTHRU */
      default:
        if ( c == '\0' ) {
          pat.append( "\\x00" );
          break;
        }
        if ( ::strchr( meta, c ) != NULL || c == '*' || c == '?' ||
             c == '|' || c == '[' || c == ']' )
          pat += '\\';
        pat += c;
        break;
    }
  }
  pat.append( ")$" );
  return true;
}

PcreFilter::~PcreFilter()
{
  this->release();
}

void
PcreFilter::release( void ) noexcept
{
  if ( this->md != NULL )
    pcre2_match_data_free( this->md );
  if ( this->re != NULL )
    pcre2_code_free( this->re );
  this->md = NULL;
  this->re = NULL;
}

bool
PcreFilter::set_filter_expr( const char *expr,  size_t expr_len,
                             bool ign_case,  bool inv ) noexcept
{
  pcre2_real_code_8       * re = NULL;
  pcre2_real_match_data_8 * md = NULL;
  PCRE2_SIZE  erroff = 0;
  int         error  = 0;
  std::string pat;

  this->release();
  this->name.clear();
  this->invert      = inv;
  this->ignore_case = ign_case;

  if ( ::memchr( expr, '*', expr_len ) != NULL ||
       ::memchr( expr, '?', expr_len ) != NULL ||
       ::memchr( expr, '[', expr_len ) != NULL ||
       ::memchr( expr, '|', expr_len ) != NULL ) {
    /* make a glob style wildcard into a pcre wildcard */
    if ( ! glob_to_pcre( expr, expr_len, pat ) ) {
      fprintf( stderr, "bad glob: %.*s\n", (int) expr_len, expr );
      return false;
    }
    re = pcre2_compile( (PCRE2_SPTR) pat.data(), pat.size(),
                        ign_case ? PCRE2_CASELESS : 0, &error, &erroff, 0 );
    if ( re != NULL ) {
      md = pcre2_match_data_create_from_pattern( re, NULL );
      if ( md == NULL ) {
        pcre2_code_free( re );
        re = NULL;
      }
    }
    if ( re == NULL ) {
      fprintf( stderr, "pcre(%d,%lu): %s\n", error, (unsigned long) erroff,
               pat.c_str() );
      return false;
    }
    /* wildcard key filter */
    this->re = re;
    this->md = md;
    return true;
  }
  /* strcmp key filter */
  this->name.assign( expr, expr_len );
  return true;
}

bool
PcreFilter::match_key( const std::string &key ) noexcept
{
  bool matched = false;

  if ( this->re == NULL ) {
    matched = ( key.size() == this->name.size() );
    if ( matched ) {
      if ( ! this->ignore_case )
        matched = ( ::memcmp( key.data(), this->name.data(),
                              key.size() ) == 0 );
      else
        matched = ( ::strncasecmp( key.data(), this->name.data(),
                                   key.size() ) == 0 );
    }
  }
  else {
    matched = ( pcre2_match( this->re, (PCRE2_SPTR) key.data(), key.size(),
                             0, 0, this->md, 0 ) > 0 );
  }
  if ( this->invert )
    return ! matched;
  return matched;
}
