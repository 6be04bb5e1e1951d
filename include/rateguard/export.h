// include/rateguard/export.h
#pragma once

// Static builds (RG_STATIC) and non-Windows targets need no decoration.
#if defined(_WIN32) && !defined(RG_STATIC)
  // The library's own compile line defines RG_EXPORTS.
  #if defined(RG_EXPORTS)
    #define RG_API __declspec(dllexport)
  #else
    #define RG_API __declspec(dllimport)
  #endif
#else
  #define RG_API
#endif
