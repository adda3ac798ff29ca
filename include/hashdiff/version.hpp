#pragma once

#define HASHDIFF_VERSION_MAJOR 0
#define HASHDIFF_VERSION_MINOR 1
#define HASHDIFF_VERSION_PATCH 0

#define HASHDIFF_VERSION_STRING "0.1.0"

// For compile-time version checks
#define HASHDIFF_VERSION \
  (HASHDIFF_VERSION_MAJOR * 10000 + HASHDIFF_VERSION_MINOR * 100 + HASHDIFF_VERSION_PATCH)

namespace hashdiff {

inline const char* Version() { return HASHDIFF_VERSION_STRING; }

}  // namespace hashdiff
