#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(FLAKEID_SNOWFLAKE_SHARED)
    #if defined(FLAKEID_SNOWFLAKE_BUILD_SHARED)
      #define FLAKEID_SNOWFLAKE_API __declspec(dllexport)
    #else
      #define FLAKEID_SNOWFLAKE_API __declspec(dllimport)
    #endif
  #else
    #define FLAKEID_SNOWFLAKE_API
  #endif
#elif defined(__GNUC__) && __GNUC__ >= 4
  #define FLAKEID_SNOWFLAKE_API __attribute__((visibility("default")))
#else
  #define FLAKEID_SNOWFLAKE_API
#endif
