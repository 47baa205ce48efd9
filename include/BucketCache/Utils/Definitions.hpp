#pragma once

// Fixes conflict in Windows with <windows.h>
#ifdef _WIN32
  #undef ERROR
#endif

/// Macro alias for trailing return type functions.
#define fn auto

/// Name used for per-user data and config directories.
#define BKC_APP_DIR_NAME "bucketcache"
