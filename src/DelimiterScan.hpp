#pragma once
#include <cstddef>

// Helper: find the first 'delimiter' at or after 'from' and set 'boundary' to the
// position right after it. Returns false (boundary == total_size) if there is none.
bool next_record_boundary(const char* data, size_t total_size, size_t from, char delimiter, size_t &boundary);

// Number of records in [data, data + size): delimiter-terminated records plus a
// trailing unterminated one, if any.
size_t count_records(const char* data, size_t size, char delimiter);
