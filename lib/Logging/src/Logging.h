#pragma once

#include <cstdarg>
#include <cstdio>
#include <functional>

/*
 * Levels are chosen at build time:
 *   LOG_LEVEL 0 - errors and warnings
 *   LOG_LEVEL 1 - + info
 *   LOG_LEVEL 2 - + debug
 * Nothing is emitted unless ENABLE_SERIAL_LOG is defined.
 */
#ifndef LOG_LEVEL
#define LOG_LEVEL 1
#endif

// Receives one fully formatted line (including the trailing newline).
using LogWriter = std::function<void(const char* line)>;
using LogClock = std::function<unsigned long()>;

// Milliseconds since the first log call (or whatever the installed clock returns)
unsigned long logMillis();

// Replace the sink. Passing nullptr restores the default stderr writer.
void logSetWriter(LogWriter writer);

// Replace the timestamp source. Passing nullptr restores the steady clock.
void logSetClock(LogClock clock);

void logSetEnabled(bool enabled);

void logPrintf(const char* level, const char* origin, const char* format, ...)
    __attribute__((format(printf, 3, 4)));

#ifdef ENABLE_SERIAL_LOG
#define LOG_ERR(origin, format, ...) logPrintf("[ERR]", origin, format "\n", ##__VA_ARGS__)
#define LOG_WRN(origin, format, ...) logPrintf("[WRN]", origin, format "\n", ##__VA_ARGS__)
#if LOG_LEVEL >= 1
#define LOG_INF(origin, format, ...) logPrintf("[INF]", origin, format "\n", ##__VA_ARGS__)
#else
#define LOG_INF(origin, format, ...) ((void)0)
#endif
#if LOG_LEVEL >= 2
#define LOG_DBG(origin, format, ...) logPrintf("[DBG]", origin, format "\n", ##__VA_ARGS__)
#else
#define LOG_DBG(origin, format, ...) ((void)0)
#endif
#else
#define LOG_ERR(origin, format, ...) ((void)0)
#define LOG_WRN(origin, format, ...) ((void)0)
#define LOG_INF(origin, format, ...) ((void)0)
#define LOG_DBG(origin, format, ...) ((void)0)
#endif
