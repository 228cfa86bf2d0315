#pragma once
/**
 * @page pn-node-log PingNode Trace Log
 * @file node_log.hpp
 * @brief Tagged, printf-style trace lines routed to a single installable sink.
 *
 * Overview
 * --------
 * Every module that wants to say something calls node_log("TX", "...").
 * The line is formatted as "[TX] ..." into a fixed stack buffer and handed
 * to whatever sink is installed. The firmware installs a sink that wraps the
 * line in a MSG frame on the host link; the host tests install a capture
 * sink. With no sink installed, lines are dropped.
 *
 * Rules
 * -----
 * - No allocation. Lines longer than NODE_LOG_LINE_MAX - 1 are truncated.
 * - Never blocks beyond what the sink does.
 * - Tags are short uppercase words: TX, RX, CFG, BOOT, FATAL.
 *
 * @author Leo
 */

#include <cstddef>

/** Maximum formatted line length including the terminating NUL. */
static constexpr size_t NODE_LOG_LINE_MAX = 128;

/** Sink signature. @p line is NUL-terminated and only valid during the call. */
typedef void (*node_log_sink_t)(const char* line);

/**
 * @brief Install or replace the log sink.
 * @param sink Function receiving each formatted line; nullptr drops lines.
 */
void node_log_set_sink(node_log_sink_t sink);

/**
 * @brief Format and emit one trace line as "[tag] message".
 *
 * @param tag Short tag without brackets. Null is treated as "LOG".
 * @param fmt printf-style format string.
 */
void node_log(const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;
