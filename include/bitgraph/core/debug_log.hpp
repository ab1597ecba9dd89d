/* Trace output for construction, derivation and load.
 *
 * BITGRAPH_DEBUG_LOG(fmt, ...) takes printf-style arguments and expands to
 * nothing unless BITGRAPH_ENABLE_DEBUG_OUTPUT is defined (CMake option
 * BITGRAPH_DEBUG_OUTPUT). Each line is prefixed with "[DEBUG][T<thread id>]"
 * and handed to the installed sink, or written to stdout when none is set.
 */
#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <sstream>
#include <string>
#include <thread>

namespace bitgraph::debug {

// Receives one complete line without trailing newline.
using DebugCallback = void (*)(const char* message);

inline std::atomic<DebugCallback> g_debug_callback{nullptr};

inline void set_debug_callback(DebugCallback cb) {
  g_debug_callback.store(cb, std::memory_order_release);
}

inline void clear_debug_callback() {
  g_debug_callback.store(nullptr, std::memory_order_release);
}

// vsnprintf into a string sized from the first pass, so long messages are
// never cut short.
inline std::string format_message(const char* fmt, va_list args) {
  va_list sizing;
  va_copy(sizing, args);
  const int needed = std::vsnprintf(nullptr, 0, fmt, sizing);
  va_end(sizing);
  if (needed <= 0) return {};
  std::string out(static_cast<std::size_t>(needed) + 1, '\0');
  std::vsnprintf(out.data(), out.size(), fmt, args);
  out.resize(static_cast<std::size_t>(needed));
  return out;
}

inline void debug_output(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  std::string body = format_message(fmt, args);
  va_end(args);

  std::ostringstream line;
  line << "[DEBUG][T" << std::this_thread::get_id() << "] " << body;
  const std::string text = line.str();

  if (DebugCallback cb = g_debug_callback.load(std::memory_order_acquire)) {
    cb(text.c_str());
    return;
  }
  std::fputs(text.c_str(), stdout);
  std::fputc('\n', stdout);
  std::fflush(stdout);
}

} // namespace bitgraph::debug

#ifdef BITGRAPH_ENABLE_DEBUG_OUTPUT
  #define BITGRAPH_DEBUG_LOG(...) ::bitgraph::debug::debug_output(__VA_ARGS__)
#else
  #define BITGRAPH_DEBUG_LOG(...) ((void)0)
#endif
