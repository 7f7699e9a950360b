#include "logger.hpp"
#include "math/vec.hpp"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {
	template<typename T>
	std::string to_string(const Vec3<T>& v) {
		return "(" + std::to_string(v.x) + ", " + std::to_string(v.y) + ", " + std::to_string(v.z) + ")";
	}

	void run(Logger& logger) {
		auto zero = Vec3<f32> {};
		auto broadcast = Vec3<u16>::from(11);
		auto full = Vec3<f32>::from(std::tuple {1, 2, 3});
		logger.log("construct", "zero " + to_string(zero) + ", broadcast " + to_string(broadcast) + ", full " + to_string(full));

		Vec3<f32> a {2, 3, 6};
		Vec3<f32> b {4, 5, 6};
		logger.log("length", to_string(a) + " -> " + std::to_string(a.length()));
		logger.log("dot", to_string(full) + " . " + to_string(b) + " = " + std::to_string(full.dot(b)));

		auto normal = full.cross(b);
		logger.log("cross", to_string(full) + " x " + to_string(b) + " = " + to_string(normal));
		logger.log(
				"cross",
				"residuals " + std::to_string(normal.dot(full)) + ", " + std::to_string(normal.dot(b)),
				LogLevel::Debug);

		auto unit = a.normalize();
		logger.log("normalize", to_string(a) + " -> " + to_string(unit) + ", length " + std::to_string(unit.length()));
		logger.log("normalize", "zero stays " + to_string(zero.normalize()), LogLevel::Debug);

		try {
			auto wrapped = Vec3<u16>::from(-1);
			logger.log("convert", "negative broadcast produced " + to_string(wrapped), LogLevel::Error);
		}
		catch (const ConversionError& e) {
			logger.log("convert", e.what(), LogLevel::Warn);
		}
	}
}

int main(int argc, char* argv[]) {
	std::unique_ptr<Logger> logger;
	try {
		logger = argc > 1 ? std::make_unique<Logger>(argv[1]) : std::make_unique<Logger>();
	}
	catch (const std::exception& e) {
		std::cerr << e.what() << '\n';
		return 1;
	}

	if (std::getenv("VEC3_LOG_DEBUG")) {
		logger->set_level(LogLevel::Debug);
	}

	try {
		run(*logger);
	}
	catch (const std::exception& e) {
		logger->log("demo", e.what(), LogLevel::Error);
		return 1;
	}
}
