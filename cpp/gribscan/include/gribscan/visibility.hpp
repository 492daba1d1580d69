/** Defines a GRIBSCAN_PUBLIC visibility attribute macro, which is used on all public interfaces.
 *  This can be defined before including `gribscan.hpp` to directly control symbol visibility.
 *  If not defined externally, this library attempts to export symbols from the translation unit
 *  where GRIBSCAN_IMPLEMENTATION is defined, and import them anywhere else.
 */
#ifndef GRIBSCAN_PUBLIC
#  if defined _WIN32 || defined __CYGWIN__
#    ifdef __GNUC__
#      define GRIBSCAN_EXPORT __attribute__((dllexport))
#      define GRIBSCAN_IMPORT __attribute__((dllimport))
#    else
#      define GRIBSCAN_EXPORT __declspec(dllexport)
#      define GRIBSCAN_IMPORT __declspec(dllimport)
#    endif
#    ifdef GRIBSCAN_IMPLEMENTATION
#      define GRIBSCAN_PUBLIC GRIBSCAN_EXPORT
#    else
#      define GRIBSCAN_PUBLIC GRIBSCAN_IMPORT
#    endif
#  else
#    define GRIBSCAN_EXPORT __attribute__((visibility("default")))
#    define GRIBSCAN_IMPORT
#    if __GNUC__ >= 4
#      define GRIBSCAN_PUBLIC __attribute__((visibility("default")))
#    else
#      define GRIBSCAN_PUBLIC
#    endif
#  endif
#endif
