#pragma once

#if defined(_WIN32) && defined(BASE_SHARED)
  #ifdef BASE_EXPORTS
    #define DLL_BASE __declspec(dllexport)
  #else
    #define DLL_BASE __declspec(dllimport)
  #endif
#else
  #define DLL_BASE
#endif
