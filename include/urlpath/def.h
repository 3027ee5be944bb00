#pragma once

#include "co/def.h"

// __upapi: export symbols when urlpath is built as a shared library.
// URLPATH_SHARED and BUILDING_URLPATH_SHARED are set by the build files.
#if defined(URLPATH_SHARED) && URLPATH_SHARED > 0
  #ifdef _WIN32
    #ifdef BUILDING_URLPATH_SHARED
      #define __upapi __declspec(dllexport)
    #else
      #define __upapi __declspec(dllimport)
    #endif
  #else
    #define __upapi __attribute__((visibility("default")))
  #endif
#else
  #define __upapi
#endif
