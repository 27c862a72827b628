#include "sheetsapi/utils/logger.hpp"
#include "sheetsapi/exception.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>

namespace sheetsapi {

Logger &Logger::GetInstance() {
	static Logger instance;
	return instance;
}

void Logger::SetLevel(Level level) {
	currentLevel.store(level);
}

Logger::Level Logger::GetLevel() const {
	return currentLevel.load();
}

void Logger::SetLogFile(const std::string &path) {
	std::lock_guard<std::mutex> lock(mutex);
	if (fileStream.is_open()) {
		fileStream.close();
	}
	if (path.empty()) {
		return;
	}
	fileStream.open(path, std::ios::out | std::ios::app);
	if (!fileStream.is_open()) {
		throw SheetsIOException("Unable to open log file: " + path);
	}
}

void Logger::SetConsoleEnabled(bool enabled) {
	consoleEnabled.store(enabled);
}

static std::string Timestamp() {
	auto now = std::chrono::system_clock::now();
	std::time_t seconds = std::chrono::system_clock::to_time_t(now);
	auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
	std::tm local {};
	localtime_r(&seconds, &local);
	return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}", local.tm_year + 1900, local.tm_mon + 1,
	                   local.tm_mday, local.tm_hour, local.tm_min, local.tm_sec, millis);
}

void Logger::Log(Level level, const std::string &message) {
	if (!ShouldLog(level) || level == Level::OFF) {
		return;
	}
	std::string line = fmt::format("[{}] [{}] {}", Timestamp(), LogLevelName(level), message);

	std::lock_guard<std::mutex> lock(mutex);
	if (consoleEnabled.load()) {
		std::cerr << line << std::endl;
	}
	if (fileStream.is_open()) {
		fileStream << line << '\n';
		fileStream.flush();
	}
}

const char *LogLevelName(Logger::Level level) {
	switch (level) {
	case Logger::Level::TRACE:
		return "trace";
	case Logger::Level::DEBUG:
		return "debug";
	case Logger::Level::INFO:
		return "info";
	case Logger::Level::WARN:
		return "warn";
	case Logger::Level::ERROR:
		return "error";
	case Logger::Level::CRITICAL:
		return "critical";
	case Logger::Level::OFF:
		return "off";
	}
	return "unknown";
}

Logger::Level ParseLogLevel(const std::string &name) {
	std::string lower = name;
	std::transform(lower.begin(), lower.end(), lower.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	for (int i = static_cast<int>(Logger::Level::TRACE); i <= static_cast<int>(Logger::Level::OFF); i++) {
		auto level = static_cast<Logger::Level>(i);
		if (lower == LogLevelName(level)) {
			return level;
		}
	}
	throw SheetsConfigException("Unknown log level '" + name + "'");
}

} // namespace sheetsapi
