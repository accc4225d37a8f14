#pragma once

#if defined(_WIN32)
    #if defined(DATABRAIN_EXPORT)
        #define DATABRAIN_API __declspec(dllexport)
    #else
        #define DATABRAIN_API __declspec(dllimport)
    #endif
#else
    #define DATABRAIN_API __attribute__((visibility("default")))
#endif
