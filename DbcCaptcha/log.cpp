#include "log.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include <termcolor/termcolor.hpp>

static std::mutex LogMutex;

const std::string vformat(const char* const zcFormat, ...)
{
	va_list vaArgs;
	va_start(vaArgs, zcFormat);

	// size the buffer from a copy of the argument list
	va_list vaArgsCopy;
	va_copy(vaArgsCopy, vaArgs);
	const int iLen = std::vsnprintf(NULL, 0, zcFormat, vaArgsCopy);
	va_end(vaArgsCopy);

	if (iLen < 0) {
		va_end(vaArgs);
		return std::string(zcFormat);
	}

	std::vector<char> zc(iLen + 1);
	std::vsnprintf(zc.data(), zc.size(), zcFormat, vaArgs);
	va_end(vaArgs);
	return std::string(zc.data(), iLen);
}

void Log(LogLevel Level, const std::string& Message)
{
	try {
		std::time_t Now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
		char Stamp[32];
		std::strftime(Stamp, sizeof(Stamp), "%Y-%m-%d %H:%M:%S", std::localtime(&Now));

		std::lock_guard<std::mutex> Lock(LogMutex);
		switch (Level) {
		case LogLevel::Error:
			std::cout << termcolor::red;
			break;
		case LogLevel::Warn:
			std::cout << termcolor::yellow;
			break;
		case LogLevel::Info:
			std::cout << termcolor::green;
			break;
		case LogLevel::Debug:
			std::cout << termcolor::grey;
			break;
		}
		std::cout << "[" << Stamp << "] [Thread ID " << std::this_thread::get_id() << "] " << Message << termcolor::reset << std::endl;
	}
	catch (const std::exception&) {
		// a failing stdout must not take the caller down with it
	}
}
