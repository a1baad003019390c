#pragma once

#if defined(_WIN32)
    #if defined(ANNEX_EXPORT)
        #define ANNEX_API __declspec(dllexport)
    #else
        #define ANNEX_API __declspec(dllimport)
    #endif
#else
    #define ANNEX_API __attribute__((visibility("default")))
#endif
