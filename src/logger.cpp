#include <iostream>
#include <stdexcept>
#include <string>
#include "logger.hpp"

Logger::Logger(std::string_view filename) {
	std::string name {filename};
	file.emplace(name);
	if (!file->is_open()) {
		throw std::runtime_error("logger: failed to open '" + name + "'");
	}
}

void Logger::set_level(LogLevel level) {
	min_level = level;
}

void Logger::log(std::string_view area, std::string_view text, LogLevel level) {
	if (level < min_level) {
		return;
	}

	std::string str;
	str.reserve(area.size() + text.size() + 2 + 9);
	str += '[';
	str += area;
	str += "]";
	switch (level) {
		case LogLevel::Debug:
			str += "[debug]: ";
			break;
		case LogLevel::Info:
			str += "[info]: ";
			break;
		case LogLevel::Warn:
			str += "[warn]: ";
			break;
		case LogLevel::Error:
			str += "[err]: ";
			break;
	}
	str += text;
	str += '\n';

	if (file) {
		*file << str;
		file->flush();
	}
	else {
		std::cout << str;
	}
}
