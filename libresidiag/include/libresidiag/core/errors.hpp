#pragma once

#include <stdexcept>
#include <string>

namespace libresidiag {
namespace core {

/**
 * Error kinds raised by the diagnostics engine
 *
 * The kind doubles as the reason code of an undefined TestResult when a test
 * fails inside the orchestrator.
 */
enum class ErrorKind {
	INVALID_INPUT,         // Series too short, constant, non-finite, degenerate signs
	INVALID_CONFIGURATION, // Bad alpha, lags, nparam, frequency, bin width
	SAMPLING_MISMATCH      // Equidistant-only test called on irregular input
};

inline std::string ErrorKindName(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::INVALID_INPUT:
		return "invalid_input";
	case ErrorKind::INVALID_CONFIGURATION:
		return "invalid_configuration";
	case ErrorKind::SAMPLING_MISMATCH:
		return "sampling_mismatch";
	}
	return "unknown";
}

/**
 * Base class of all errors thrown by libresidiag
 *
 * Derives from std::invalid_argument: every failure of a test is a failure of
 * its arguments (data or parameters), never of the machine.
 */
class DiagnosticsError : public std::invalid_argument {
public:
	DiagnosticsError(ErrorKind kind, const std::string &message)
	    : std::invalid_argument(message), kind_(kind) {
	}

	ErrorKind Kind() const {
		return kind_;
	}

private:
	ErrorKind kind_;
};

/// Series unusable for the requested computation
class InvalidInputError : public DiagnosticsError {
public:
	explicit InvalidInputError(const std::string &message) : DiagnosticsError(ErrorKind::INVALID_INPUT, message) {
	}
};

/// Parameters inconsistent (df <= 0, lags <= 0, alpha outside (0, 1), ...)
class InvalidConfigurationError : public DiagnosticsError {
public:
	explicit InvalidConfigurationError(const std::string &message)
	    : DiagnosticsError(ErrorKind::INVALID_CONFIGURATION, message) {
	}
};

/// Test that needs equidistant sampling was given an irregular series
class SamplingMismatchError : public DiagnosticsError {
public:
	explicit SamplingMismatchError(const std::string &message)
	    : DiagnosticsError(ErrorKind::SAMPLING_MISMATCH, message) {
	}
};

} // namespace core
} // namespace libresidiag
