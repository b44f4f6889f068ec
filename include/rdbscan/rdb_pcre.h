#ifndef __rdbscan__rdb_pcre_h__
#define __rdbscan__rdb_pcre_h__

#include <string>
#include <rdbscan/rdb_decode.h>

#ifdef __cplusplus

extern "C" {
  struct pcre2_real_code_8;
  struct pcre2_real_match_data_8;
}

namespace rdbscan {

/* filter keys by pcre */
struct PcreFilter : public RdbFilter {
  std::string               name;        /* if expr is simple string match */
  pcre2_real_code_8       * re;          /* pcre regex compiled */
  pcre2_real_match_data_8 * md;          /* pcre match context  */
  bool                      ignore_case, /* like grep -i */
                            invert;      /* invert match, like grep -v */

  PcreFilter() : re( 0 ), md( 0 ), ignore_case( false ), invert( false ) {}
  ~PcreFilter();
  /* return false if expr failed to compile */
  bool set_filter_expr( const char *expr,  size_t expr_len,
                        bool ign_case,  bool inv ) noexcept;
  /* return true if key matched */
  virtual bool match_key( const std::string &key ) noexcept;
  void release( void ) noexcept;
};

/* convert a glob: * ? [a-z] [!a-z] and | alternates, to an anchored pcre,
 * false if a [ is not closed */
bool glob_to_pcre( const char *expr,  size_t expr_len,  std::string &pat );

} // namespace
#endif
#endif
