#pragma once
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;
using f32 = float;
using f64 = double;
using usize = size_t;

template<typename T>
concept Numeric = std::is_arithmetic_v<T> && !std::same_as<std::remove_cv_t<T>, bool>;

class ConversionError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

namespace detail {
	template<std::integral T, std::integral U>
	constexpr bool int_fits(U value) {
		if constexpr (std::is_signed_v<T> == std::is_signed_v<U>) {
			return value >= std::numeric_limits<T>::min() && value <= std::numeric_limits<T>::max();
		}
		else if constexpr (std::is_signed_v<U>) {
			return value >= 0 && static_cast<std::make_unsigned_t<U>>(value) <= std::numeric_limits<T>::max();
		}
		else {
			return value <= static_cast<std::make_unsigned_t<T>>(std::numeric_limits<T>::max());
		}
	}

	// bounds are the powers of two -2^digits (signed only) and 2^digits, exact in any U.
	// nan and inf fail every comparison
	template<std::integral T, std::floating_point U>
	bool float_fits(U value) {
		auto upper = std::ldexp(U {1}, std::numeric_limits<T>::digits);
		auto lower = std::is_signed_v<T> ? -upper : U {0};
		auto truncated = std::trunc(value);
		return truncated >= lower && truncated < upper;
	}
}

// throws ConversionError instead of wrapping, casts to a floating type never fail
template<Numeric T, Numeric U>
[[nodiscard]] T as(U value) {
	if constexpr (std::floating_point<T>) {
		return static_cast<T>(value);
	}
	else if constexpr (std::integral<U>) {
		if (!detail::int_fits<T>(value)) {
			throw ConversionError("as: integer " + std::to_string(value) + " does not fit the target type");
		}
		return static_cast<T>(value);
	}
	else {
		if (!detail::float_fits<T>(value)) {
			throw ConversionError("as: value " + std::to_string(value) + " is not representable as an integer of the target type");
		}
		return static_cast<T>(value);
	}
}
