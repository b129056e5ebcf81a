#ifndef FRAGLOADER_EXPORT_HPP
#define FRAGLOADER_EXPORT_HPP

#ifdef FRAGLOADER_STATIC
// As a static library: no symbol import/export.
#  define FRAGLOADER_API
#else
 // As a shared library: export symbols on build, import symbols on use.
#  ifdef FRAGLOADER_EXPORTS
     // We are building this library
#    ifdef _MSC_VER
#         define FRAGLOADER_API __declspec(dllexport)
#    else
#         define FRAGLOADER_API __attribute__((__visibility__("default")))
#    endif
#  else
     // We are using this library
#    ifdef _MSC_VER
#         define FRAGLOADER_API __declspec(dllimport)
#    else
#         define FRAGLOADER_API // Symbol import is implicit on non-msvc compilers.
#    endif
#  endif
#endif

#endif
