/*

export.hpp
----------

Symbol visibility for the public classes. The library is header-only, so the
classes only need default visibility when a consumer builds with
-fvisibility=hidden and passes decoder objects across shared library borders.

*/

#pragma once

#ifndef MIMEXX_EXPORT
#  if defined(MIMEXX_STATIC_DEFINE) || defined(_WIN32) || defined(__CYGWIN__)
#    define MIMEXX_EXPORT
#  elif defined(__GNUC__) && __GNUC__ >= 4
#    define MIMEXX_EXPORT __attribute__((visibility("default")))
#  else
#    define MIMEXX_EXPORT
#  endif
#endif
