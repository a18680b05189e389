#include "cli.hpp"

#include <cerrno>
#include <cstdlib>

bool parse_int_arg(const char* text, long long min_value, long long max_value, long long& out) {
	if (text == nullptr) {
		return false;
	}

	char* end = nullptr;
	errno = 0;
	const long long value = std::strtoll(text, &end, 10);
	if (end == text || *end != '\0' || errno == ERANGE) {
		return false;
	}
	if (value < min_value || value > max_value) {
		return false;
	}
	out = value;
	return true;
}
