#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace pastebin {

/**
 * Microseconds since the Unix epoch (negative before 1970).
 */
int64_t to_unix_micros(std::chrono::system_clock::time_point t);

std::chrono::system_clock::time_point from_unix_micros(int64_t micros);

/**
 * Seconds since the epoch with a six-digit fraction, e.g.
 * "1700000000.123456". This is the instant text mixed into paste ids.
 */
std::string format_epoch_seconds(std::chrono::system_clock::time_point t);

/**
 * UTC timestamp as "YYYY-MM-DD HH:MM:SS".
 */
std::string format_utc(std::chrono::system_clock::time_point t);

}  // namespace pastebin
