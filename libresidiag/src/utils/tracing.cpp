#include "libresidiag/utils/tracing.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <utility>

namespace libresidiag {
namespace utils {

#ifdef NDEBUG
LogLevel Tracer::current_level_ = LogLevel::WARN;
#else
LogLevel Tracer::current_level_ = LogLevel::INFO;
#endif
bool Tracer::initialized_ = false;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static std::mutex g_tracer_mutex;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static LogSink g_sink;

static LogLevel DefaultLevel() {
#ifdef NDEBUG
	return LogLevel::WARN;
#else
	return LogLevel::INFO;
#endif
}

void Tracer::Initialize() {
	if (initialized_) {
		return;
	}
	initialized_ = true;

	const char *env_level = std::getenv("RESIDIAG_LOG_LEVEL");
	if (env_level == nullptr) {
		current_level_ = DefaultLevel();
		return;
	}

	std::string level_str = env_level;
	for (auto &c : level_str) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}

	if (level_str == "trace") {
		current_level_ = LogLevel::TRACE;
	} else if (level_str == "debug") {
		current_level_ = LogLevel::DBG;
	} else if (level_str == "info") {
		current_level_ = LogLevel::INFO;
	} else if (level_str == "warn") {
		current_level_ = LogLevel::WARN;
	} else if (level_str == "error") {
		current_level_ = LogLevel::ERR;
	} else if (level_str == "none") {
		current_level_ = LogLevel::NONE;
	} else {
		current_level_ = DefaultLevel();
	}
}

void Tracer::SetLogLevel(LogLevel level) {
	current_level_ = level;
	initialized_ = true;
}

LogLevel Tracer::GetLogLevel() {
	if (!initialized_) {
		Initialize();
	}
	return current_level_;
}

bool Tracer::ShouldLog(LogLevel level) {
	if (!initialized_) {
		Initialize();
	}
	return level != LogLevel::NONE && level >= current_level_;
}

void Tracer::SetSink(LogSink sink) {
	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	g_sink = std::move(sink);
}

std::string Tracer::GetLevelName(LogLevel level) {
	switch (level) {
	case LogLevel::TRACE:
		return "TRACE";
	case LogLevel::DBG:
		return "DEBUG";
	case LogLevel::INFO:
		return "INFO";
	case LogLevel::WARN:
		return "WARN";
	case LogLevel::ERR:
		return "ERROR";
	case LogLevel::NONE:
		return "NONE";
	}
	return "UNKNOWN";
}

std::string Tracer::GetTimestamp() {
	auto now = std::chrono::system_clock::now();
	auto time = std::chrono::system_clock::to_time_t(now);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

	std::tm local_tm {};
	localtime_r(&time, &local_tm);

	std::ostringstream oss;
	oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count();
	return oss.str();
}

void Tracer::Emit(LogLevel level, const std::string &formatted) {
	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	if (g_sink) {
		g_sink(level, formatted);
		return;
	}
	std::cerr << formatted << '\n';
}

void Tracer::Log(LogLevel level, const std::string &file, int line, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	size_t last_slash = file.find_last_of("/\\");
	std::string filename = (last_slash == std::string::npos) ? file : file.substr(last_slash + 1);

	std::ostringstream oss;
	oss << "[" << GetTimestamp() << "] [residiag/" << GetLevelName(level) << "] " << filename << ":" << line << " - "
	    << message;
	Emit(level, oss.str());
}

void Tracer::LogDirect(LogLevel level, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	std::ostringstream oss;
	oss << "[" << GetTimestamp() << "] [residiag/" << GetLevelName(level) << "] " << message;
	Emit(level, oss.str());
}

uint64_t Tracer::TimingStart() {
	auto now = std::chrono::steady_clock::now().time_since_epoch();
	return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

double Tracer::TimingEnd(uint64_t handle, const std::string &operation_name) {
	auto end_time = std::chrono::steady_clock::now().time_since_epoch();
	auto end_ns = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(end_time).count());
	double duration_ms = static_cast<double>(end_ns - handle) / 1000000.0;

	std::ostringstream oss;
	oss << std::fixed << std::setprecision(2) << operation_name << " completed in " << duration_ms << " ms";
	LogDirect(LogLevel::DBG, oss.str());

	return duration_ms;
}

} // namespace utils
} // namespace libresidiag
