#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace ACC
{
	// CRC-64/XZ (ECMA-182 polynomial, reflected, init and xorout all ones)
	uint64_t Crc64(const void *data, size_t size);
	uint64_t Crc64(const std::string &data);

	// Fixed width, lowercase, zero padded
	std::string Crc64Hex(const std::string &data);
}
