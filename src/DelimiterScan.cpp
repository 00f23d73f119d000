#include "DelimiterScan.hpp"
#include <cstring>

bool next_record_boundary(const char* data, size_t total_size, size_t from, char delimiter, size_t &boundary) {
	boundary = total_size;
	if (from >= total_size) {
		return false;
	}
	const void* hit = std::memchr(data + from, static_cast<unsigned char>(delimiter), total_size - from);
	if (hit == nullptr) {
		return false;
	}
	boundary = static_cast<size_t>(static_cast<const char*>(hit) - data) + 1;
	return true;
}

size_t count_records(const char* data, size_t size, char delimiter) {
	size_t records = 0;
	size_t pos = 0;
	size_t boundary = 0;
	while (next_record_boundary(data, size, pos, delimiter, boundary)) {
		++records;
		pos = boundary;
	}
	// trailing bytes without a delimiter still form one record
	if (pos < size) {
		++records;
	}
	return records;
}
