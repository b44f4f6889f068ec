#ifndef __rdbscan__rdb_err_h__
#define __rdbscan__rdb_err_h__

#ifdef __cplusplus
namespace rdbscan {

/* decoding status errors, every error is fatal to the parse */
enum RdbErrCode {
  RDB_OK           = 0,
  RDB_ERR_OUTPUT   = -1,  /* decoder was already used */
  RDB_ERR_TRUNC    = -2,  /* not enough data to decode */
  RDB_ERR_VERSION  = -3,  /* version outside of the supported range */
  RDB_ERR_CRC      = -4,  /* trailer crc was non-zero and did not check */
  RDB_ERR_TYPE     = -5,  /* RdbType is unknown */
  RDB_ERR_HDR      = -6,  /* magic or version digits are wrong */
  RDB_ERR_LZF      = -7,  /* decompress failed or size doesn't match */
  RDB_ERR_LEN      = -8,  /* length tag bits are not a valid encoding */
  RDB_ERR_META     = -9,  /* expire, freq, idle not followed by a key */
  RDB_ERR_ENCODING = -10, /* ziplist, listpack, intset, stream is corrupt */
  RDB_ERR_ALLOC    = -11, /* buffer alloc failed */
  RDB_EOF_MARK     = -12  /* end of a packed list, not returned by parse */
};

const char *rdb_err_description( RdbErrCode err ) noexcept;

} // namespace
#endif
#endif
