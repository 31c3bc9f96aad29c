/*

config.hpp
----------

Global build configuration for photoxx.

Define PHOTOXX_NO_EXCEPTIONS to disable exception-based wrappers.

*/

#pragma once

#if defined(PHOTOXX_NO_EXCEPTIONS)
#define PHOTOXX_THROWING_ENABLED 0
#else
#define PHOTOXX_THROWING_ENABLED 1
#endif

#define PHOTOXX_VERSION_STRING "0.1.0"
