#include "common/util/crc64.h"

#include <fmt/format.h>

// Reflected form of 0x42F0E1EBA9EA3693
static uint64_t CRC64Table[256];

static struct CRC64TableInit {
	CRC64TableInit() {
		for (uint64_t i = 0; i < 256; ++i) {
			uint64_t crc = i;
			for (int j = 0; j < 8; ++j) {
				crc = (crc >> 1) ^ ((crc & 1) ? 0xC96C5795D7870F42ull : 0ull);
			}
			CRC64Table[i] = crc;
		}
	}
} crc64TableInit;

uint64_t ACC::Crc64(const void *data, size_t size)
{
	const uint8_t *buffer = static_cast<const uint8_t *>(data);
	uint64_t crc = ~0ull;
	for (size_t i = 0; i < size; ++i) {
		crc = (crc >> 8) ^ CRC64Table[(crc ^ buffer[i]) & 0xFF];
	}
	return ~crc;
}

uint64_t ACC::Crc64(const std::string &data)
{
	return Crc64(data.data(), data.size());
}

std::string ACC::Crc64Hex(const std::string &data)
{
	return fmt::format("{:016x}", Crc64(data));
}
