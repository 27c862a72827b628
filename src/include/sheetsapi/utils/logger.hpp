#pragma once

#include <atomic>
#include <cstring>
#include <fstream>
#include <mutex>
#include <string>
#include <utility>

#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace sheetsapi {

class Logger {
public:
	enum class Level { TRACE = 0, DEBUG = 1, INFO = 2, WARN = 3, ERROR = 4, CRITICAL = 5, OFF = 6 };

	static Logger &GetInstance();

	void SetLevel(Level level);
	Level GetLevel() const;

	// Mirrors every message into the given file (appending). An empty path closes the file sink.
	void SetLogFile(const std::string &path);
	void SetConsoleEnabled(bool enabled);

	bool ShouldLog(Level level) const {
		return static_cast<int>(level) >= static_cast<int>(currentLevel.load());
	}

	void Log(Level level, const std::string &message);

	template <typename... Args>
	void LogCtx(Level level, const char *file, int line, const char *func, const std::string &fmtStr,
	            Args &&...args) {
		if (!ShouldLog(level)) {
			return;
		}
		std::string message;
		try {
			message = fmt::vformat(fmtStr, fmt::make_format_args(args...));
		} catch (const fmt::format_error &) {
			message = fmtStr;
		}
		Log(level, fmt::format("[{}:{}:{}] {}", BaseFilename(file), line, func, message));
	}

private:
	Logger() = default;
	Logger(const Logger &) = delete;
	Logger &operator=(const Logger &) = delete;

	static const char *BaseFilename(const char *path) {
		if (!path) {
			return "";
		}
		const char *slash = std::strrchr(path, '/');
		return slash ? slash + 1 : path;
	}

	mutable std::mutex mutex;
	std::atomic<Level> currentLevel {Level::WARN};
	std::atomic<bool> consoleEnabled {true};
	std::ofstream fileStream;
};

// Parses "trace", "debug", "info", "warn", "error", "critical" or "off" (case-insensitive).
// Throws SheetsConfigException on anything else.
Logger::Level ParseLogLevel(const std::string &name);

const char *LogLevelName(Logger::Level level);

} // namespace sheetsapi

#define SHEETSAPI_LOG_TRACE(fmt, ...)                                                                                  \
	sheetsapi::Logger::GetInstance().LogCtx(sheetsapi::Logger::Level::TRACE, __FILE__, __LINE__, __func__, fmt,      \
	                                        ##__VA_ARGS__)
#define SHEETSAPI_LOG_DEBUG(fmt, ...)                                                                                  \
	sheetsapi::Logger::GetInstance().LogCtx(sheetsapi::Logger::Level::DEBUG, __FILE__, __LINE__, __func__, fmt,      \
	                                        ##__VA_ARGS__)
#define SHEETSAPI_LOG_INFO(fmt, ...)                                                                                   \
	sheetsapi::Logger::GetInstance().LogCtx(sheetsapi::Logger::Level::INFO, __FILE__, __LINE__, __func__, fmt,       \
	                                        ##__VA_ARGS__)
#define SHEETSAPI_LOG_WARN(fmt, ...)                                                                                   \
	sheetsapi::Logger::GetInstance().LogCtx(sheetsapi::Logger::Level::WARN, __FILE__, __LINE__, __func__, fmt,       \
	                                        ##__VA_ARGS__)
#define SHEETSAPI_LOG_ERROR(fmt, ...)                                                                                  \
	sheetsapi::Logger::GetInstance().LogCtx(sheetsapi::Logger::Level::ERROR, __FILE__, __LINE__, __func__, fmt,      \
	                                        ##__VA_ARGS__)
#define SHEETSAPI_LOG_CRITICAL(fmt, ...)                                                                               \
	sheetsapi::Logger::GetInstance().LogCtx(sheetsapi::Logger::Level::CRITICAL, __FILE__, __LINE__, __func__, fmt,   \
	                                        ##__VA_ARGS__)
