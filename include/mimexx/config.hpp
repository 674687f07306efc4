/*

config.hpp
----------

Global build configuration for mimexx.

Define MIMEXX_NO_EXCEPTIONS to disable exception-based wrappers.

*/

#pragma once

#if defined(MIMEXX_NO_EXCEPTIONS)
#define MIMEXX_THROWING_ENABLED 0
#else
#define MIMEXX_THROWING_ENABLED 1
#endif
