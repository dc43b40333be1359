#pragma once

#if defined(_WIN32) && defined(POPUP_LIB_SHARED)
  #ifdef POPUP_LIB_EXPORTS
    #define DLL_POPUP_LIB __declspec(dllexport)
  #else
    #define DLL_POPUP_LIB __declspec(dllimport)
  #endif
#else
  #define DLL_POPUP_LIB
#endif
