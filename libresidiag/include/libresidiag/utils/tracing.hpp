#pragma once

#include <cstdint>
#include <functional>
#include <sstream>
#include <string>

namespace libresidiag {
namespace utils {

/**
 * @brief Leveled logging for the diagnostics engine
 *
 * Provides:
 * - Log levels (trace, debug, info, warn, error, none)
 * - Timestamped records with file:line
 * - Timing of orchestrator runs
 * - Environment variable control: RESIDIAG_LOG_LEVEL
 * - Mutex-protected output (tests may run in parallel tasks)
 * - A replaceable sink so host applications (and tests) can capture records
 *
 * Example usage:
 *   RESIDIAG_DEBUG("classified " << n << " observations as irregular");
 *   RESIDIAG_TIMING_START();
 *   // ... run tests ...
 *   RESIDIAG_TIMING_END("residual diagnostics");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

/// Receives every record that passes the level filter
using LogSink = std::function<void(LogLevel level, const std::string &formatted)>;

class Tracer {
public:
	/**
	 * @brief Read RESIDIAG_LOG_LEVEL once
	 *
	 * Values: trace, debug, info, warn, error, none (case-insensitive).
	 * Unset or unrecognised: WARN in release builds, INFO otherwise.
	 */
	static void Initialize();

	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	static bool ShouldLog(LogLevel level);

	/**
	 * @brief Redirect records to `sink`; an empty function restores stderr
	 */
	static void SetSink(LogSink sink);

	/**
	 * @brief Emit a record with source location
	 *
	 * @param level Record level
	 * @param file Source file (directory part is stripped)
	 * @param line Source line
	 * @param message Record text
	 */
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	/// Emit a record without source location
	static void LogDirect(LogLevel level, const std::string &message);

	static std::string GetLevelName(LogLevel level);

	static std::string GetTimestamp();

	/// @return Opaque handle for TimingEnd()
	static uint64_t TimingStart();

	/**
	 * @brief Log the elapsed time at debug level
	 *
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	static void Emit(LogLevel level, const std::string &formatted);

	static LogLevel current_level_;
	static bool initialized_;

	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

#define RESIDIAG_LOG_AT(level, msg)                                                                                    \
	do {                                                                                                               \
		if (libresidiag::utils::Tracer::ShouldLog(level)) {                                                            \
			std::ostringstream residiag_oss;                                                                           \
			residiag_oss << msg;                                                                                       \
			libresidiag::utils::Tracer::Log(level, __FILE__, __LINE__, residiag_oss.str());                           \
		}                                                                                                              \
	} while (0)

/// Usage: RESIDIAG_TRACE(message << stream << contents)
#define RESIDIAG_TRACE(msg) RESIDIAG_LOG_AT(libresidiag::utils::LogLevel::TRACE, msg)

#define RESIDIAG_DEBUG(msg) RESIDIAG_LOG_AT(libresidiag::utils::LogLevel::DBG, msg)

#define RESIDIAG_INFO(msg) RESIDIAG_LOG_AT(libresidiag::utils::LogLevel::INFO, msg)

#define RESIDIAG_WARN(msg) RESIDIAG_LOG_AT(libresidiag::utils::LogLevel::WARN, msg)

#define RESIDIAG_ERROR(msg) RESIDIAG_LOG_AT(libresidiag::utils::LogLevel::ERR, msg)

/**
 * Usage:
 *   RESIDIAG_TIMING_START();
 *   // ... do work ...
 *   RESIDIAG_TIMING_END("Operation name");
 */
#define RESIDIAG_TIMING_START() uint64_t residiag_timing_handle = libresidiag::utils::Tracer::TimingStart()

#define RESIDIAG_TIMING_END(operation_name)                                                                            \
	libresidiag::utils::Tracer::TimingEnd(residiag_timing_handle, operation_name)

} // namespace utils
} // namespace libresidiag
