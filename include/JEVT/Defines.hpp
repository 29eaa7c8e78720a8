#pragma once

#ifndef JEVT_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(JEVT_SHARED_BUILD)
#define JEVT_API __declspec(dllexport)
#elif defined(JEVT_SHARED)
#define JEVT_API __declspec(dllimport)
#else
#define JEVT_API
#endif
#else
#if defined(JEVT_SHARED_BUILD) || defined(JEVT_SHARED)
#define JEVT_API __attribute__((visibility("default")))
#else
#define JEVT_API
#endif
#endif
#endif

namespace JEVT
{

    [[noreturn]] inline void Unreachable()
    {
#if defined(_MSC_VER) && !defined(__clang__)// MSVC
        __assume(false);
#else// GCC, Clang
        __builtin_unreachable();
#endif
    }

}// namespace JEVT
