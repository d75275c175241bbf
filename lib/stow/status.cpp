#include <cstring>

#include "stow/status.hpp"

namespace stow {

const char* status_str(int rc){
  switch (rc){
    case ST_OK:                 return "success";
    case ST_BAD_LABEL:          return "not a stow archive (label mismatch)";
    case ST_BAD_VERSION_MARKER: return "missing version marker";
    case ST_VERSION_TOO_NEW:    return "archive major version is newer than this reader";
    case ST_VERSION_TOO_OLD:    return "archive major version is older than this reader";
    case ST_MINOR_TOO_NEW:      return "archive uses features from a newer minor version";
    case ST_BAD_FIELD:          return "malformed field";
    case ST_OPTION_MISMATCH:    return "compression/encryption option mismatch";
    case ST_NO_PASSWORD:        return "archive is encrypted but no password was supplied";
    case ST_CHECKSUM_MISMATCH:  return "checksum mismatch";
    case ST_COUNT_MISMATCH:     return "entry count mismatch";
    case ST_TRUNCATED:          return "unexpected end of archive";
    case ST_TRAILING_DATA:      return "trailing data after last entry";
    case ST_CRYPTO:             return "cryptographic failure";
    case ST_AUTH:               return "authentication failed (wrong password or corrupted data)";
    case ST_COMPRESS:           return "compression failure";
    case ST_UNSUPPORTED_ENTRY:  return "unsupported entry type";
    case ST_PATH_TOO_LONG:      return "path too long";
    default: break;
  }
  if (rc < 0 && rc > -1000) return std::strerror(-rc);
  return "unknown error";
}

}
