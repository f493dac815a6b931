/**
 * Log.h - Logging utilities for the simulation core
 */
#pragma once

#include <cstdio>
#include <string>

namespace Lander {

// printf-style logging
#define LANDER_LOG_INFO(fmt, ...) printf("[INFO] " fmt "\n", ##__VA_ARGS__)
#define LANDER_LOG_WARN(fmt, ...) printf("[WARN] " fmt "\n", ##__VA_ARGS__)
#define LANDER_LOG_ERROR(fmt, ...) printf("[ERROR] " fmt "\n", ##__VA_ARGS__)

#ifdef LANDER_VERBOSE
#define LANDER_LOG_DEBUG(fmt, ...) printf("[DEBUG] " fmt "\n", ##__VA_ARGS__)
#else
#define LANDER_LOG_DEBUG(fmt, ...) ((void)0)
#endif

inline void LogInfo(const std::string& msg) { printf("[INFO] %s\n", msg.c_str()); }

} // namespace Lander
