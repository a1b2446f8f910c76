#pragma once

#include <string>

enum class LogLevel {
	Error,
	Warn,
	Info,
	Debug
};

const std::string vformat(const char* const zcFormat, ...);

// Prints one colored line to stdout. Never throws.
void Log(LogLevel Level, const std::string& Message);

#define DBC_LOG_ERROR(...) Log(LogLevel::Error, vformat(__VA_ARGS__))
#define DBC_LOG_WARN(...) Log(LogLevel::Warn, vformat(__VA_ARGS__))
#define DBC_LOG_INFO(...) Log(LogLevel::Info, vformat(__VA_ARGS__))
#define DBC_LOG_DEBUG(...) Log(LogLevel::Debug, vformat(__VA_ARGS__))
