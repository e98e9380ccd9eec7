#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(REGTOKEN_EXPORTS)
    #define REGTOKEN_API __declspec(dllexport)
  #elif defined(REGTOKEN_SHARED)
    #define REGTOKEN_API __declspec(dllimport)
  #else
    #define REGTOKEN_API
  #endif
#elif defined(__GNUC__) && __GNUC__ >= 4
  #define REGTOKEN_API __attribute__((visibility("default")))
#else
  #define REGTOKEN_API
#endif
