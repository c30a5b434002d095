#pragma once

#if defined(_WIN32)
    #if defined(REGULATOR_EXPORT)
        #define REGULATOR_API __declspec(dllexport)
    #else
        #define REGULATOR_API __declspec(dllimport)
    #endif
#else
    #define REGULATOR_API __attribute__((visibility("default")))
#endif
