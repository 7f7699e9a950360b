#pragma once
#include <string_view>
#include <fstream>
#include <optional>

enum class LogLevel {
	Debug,
	Info,
	Warn,
	Error
};

class Logger {
public:
	Logger() = default;
	explicit Logger(std::string_view filename);

	void log(std::string_view area, std::string_view text, LogLevel level = LogLevel::Info);
	void set_level(LogLevel level);
	[[nodiscard]] LogLevel level() const { return min_level; }
private:
	LogLevel min_level {LogLevel::Info};
	std::optional<std::ofstream> file {};
};
