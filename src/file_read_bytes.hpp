#pragma once

#include <vector>

#include <cstdio>
#include <cstddef>

namespace LineFlow {

/**
 * Reads the whole file into `result`. Returns false if the file can't be opened or read.
 */
inline bool file_read_bytes(const char* fileName, std::vector<char>& result) {
	FILE* file = std::fopen(fileName, "rb");

	if (!file) {
		return false;
	}

	std::fseek(file, 0, SEEK_END);
	auto size = std::ftell(file);

	if (size < 0) {
		std::fclose(file);
		return false;
	}

	std::rewind(file);
	result.resize(static_cast<size_t>(size));

	auto bytesRead = std::fread(result.data(), 1, static_cast<size_t>(size), file);
	std::fclose(file);

	return bytesRead == static_cast<size_t>(size);
}

}
