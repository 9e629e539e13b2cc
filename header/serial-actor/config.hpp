#pragma once

#include <version>

// C++20 Atomic Wait/Notify feature detection
#if defined(__cpp_lib_atomic_wait) && __cpp_lib_atomic_wait >= 201907L
#define SERIAL_ACTOR_HAVE_ATOMIC_WAIT 1
#else
#define SERIAL_ACTOR_HAVE_ATOMIC_WAIT 0
#endif

#define SERIAL_ACTOR_CACHE_LINE_SIZE 64

// Messages handled per resume() pass before the loop re-checks for a stop request.
#ifndef SERIAL_ACTOR_DEFAULT_MAX_THROUGHPUT
#define SERIAL_ACTOR_DEFAULT_MAX_THROUGHPUT 64
#endif

// Values match SPDLOG_LEVEL_*.
#define SERIAL_ACTOR_LOG_LEVEL_TRACE 0
#define SERIAL_ACTOR_LOG_LEVEL_DEBUG 1
#define SERIAL_ACTOR_LOG_LEVEL_INFO 2
#define SERIAL_ACTOR_LOG_LEVEL_WARN 3
#define SERIAL_ACTOR_LOG_LEVEL_ERROR 4
#define SERIAL_ACTOR_LOG_LEVEL_CRITICAL 5
#define SERIAL_ACTOR_LOG_LEVEL_OFF 6

#ifndef SERIAL_ACTOR_LOG_LEVEL
#define SERIAL_ACTOR_LOG_LEVEL SERIAL_ACTOR_LOG_LEVEL_DEBUG
#endif
