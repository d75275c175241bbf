#pragma once

namespace stow {

// Archive-level failures. System call failures travel as -errno, so these
// stay well below the errno range.
enum Status : int {
  ST_OK                 = 0,
  ST_BAD_LABEL          = -1001,
  ST_BAD_VERSION_MARKER = -1002,
  ST_VERSION_TOO_NEW    = -1003,
  ST_VERSION_TOO_OLD    = -1004,
  ST_MINOR_TOO_NEW      = -1005,
  ST_BAD_FIELD          = -1006,
  ST_OPTION_MISMATCH    = -1007,
  ST_NO_PASSWORD        = -1008,
  ST_CHECKSUM_MISMATCH  = -1009,
  ST_COUNT_MISMATCH     = -1010,
  ST_TRUNCATED          = -1011,
  ST_TRAILING_DATA      = -1012,
  ST_CRYPTO             = -1013,
  ST_AUTH               = -1014,
  ST_COMPRESS           = -1015,
  ST_UNSUPPORTED_ENTRY  = -1016,
  ST_PATH_TOO_LONG      = -1017,
};

const char* status_str(int rc);

}
