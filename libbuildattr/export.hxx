// file      : libbuildattr/export.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

// Normally we don't export class templates (but do complete specializations),
// inline functions, and classes with only inline member functions. Exporting
// classes that inherit from non-exported/imported bases (e.g., std::string)
// will end up badly. The only known workarounds are to not inherit or to not
// export. Also, MinGW GCC doesn't like seeing non-exported functions being
// used before their inline definition. The workaround is to reorder code. In
// the end it's all trial and error.

#if defined(LIBBUILDATTR_STATIC)         // Using static.
#  define LIBBUILDATTR_SYMEXPORT
#elif defined(LIBBUILDATTR_STATIC_BUILD) // Building static.
#  define LIBBUILDATTR_SYMEXPORT
#elif defined(LIBBUILDATTR_SHARED)       // Using shared.
#  ifdef _WIN32
#    define LIBBUILDATTR_SYMEXPORT __declspec(dllimport)
#  else
#    define LIBBUILDATTR_SYMEXPORT
#  endif
#elif defined(LIBBUILDATTR_SHARED_BUILD) // Building shared.
#  ifdef _WIN32
#    define LIBBUILDATTR_SYMEXPORT __declspec(dllexport)
#  else
#    define LIBBUILDATTR_SYMEXPORT
#  endif
#else
// If none of the above macros are defined, then we assume we are being used
// by some third-party build system that cannot/doesn't signal the library
// type. Note that this fallback works for both static and shared libraries
// provided the library only exports functions (in other words, no global
// exported data) and for the shared case the result will be sub-optimal
// compared to having dllimport.
//
#  define LIBBUILDATTR_SYMEXPORT // Using static or shared.
#endif

// Variant of the above for explicit template instantiations: the extern
// template declaration (DEC) is imported when using the shared library
// while the explicit instantiation definition (DEF) is exported when
// building it.
//
#if defined(_WIN32) && defined(LIBBUILDATTR_SHARED)
#  define LIBBUILDATTR_DECEXPORT __declspec(dllimport)
#  define LIBBUILDATTR_DEFEXPORT
#elif defined(_WIN32) && defined(LIBBUILDATTR_SHARED_BUILD)
#  define LIBBUILDATTR_DECEXPORT
#  define LIBBUILDATTR_DEFEXPORT __declspec(dllexport)
#else
#  define LIBBUILDATTR_DECEXPORT
#  define LIBBUILDATTR_DEFEXPORT
#endif
