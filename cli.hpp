#pragma once

// Parses a whole base-10 integer in [min_value, max_value].
// Returns false on trailing characters, overflow or out-of-range values.
bool parse_int_arg(const char* text, long long min_value, long long max_value, long long& out);
