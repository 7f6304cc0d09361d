#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(NGIN_METADATA_STATIC)
    #define NGIN_METADATA_API
  #else
    #if defined(NGIN_METADATA_EXPORTS)
      #define NGIN_METADATA_API __declspec(dllexport)
    #else
      #define NGIN_METADATA_API __declspec(dllimport)
    #endif
  #endif
#else
  #define NGIN_METADATA_API
#endif
