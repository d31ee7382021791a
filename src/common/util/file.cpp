#include "common/util/file.h"
#include "common/logging.h"

#include <fstream>
#include <system_error>
#include <vector>

#include <sys/stat.h>
#include <fmt/format.h>

bool File::Exists(const std::string &name)
{
	struct stat sb{};
	if (stat(name.c_str(), &sb) == 0) {
		return true;
	}

	return false;
}

bool File::IsDirectory(const std::string &name)
{
	std::error_code ec;
	return fs::is_directory(name, ec);
}

bool File::Makedir(const std::string &directory_name)
{
	std::error_code ec;
	fs::create_directories(directory_name, ec);
	if (ec) {
		LOG_ERROR(MOD_MAIN, "Failed to create directory: {}: {}", directory_name, ec.message());
		return false;
	}
	return true;
}

FileContentsResult File::GetContents(const std::string &file_name)
{
	std::ifstream f(file_name, std::ios::in | std::ios::binary);
	if (!f) {
		return { .error = fmt::format("Couldn't open file [{}]", file_name) };
	}

	constexpr size_t CHUNK_SIZE = 4096;
	std::string lines;
	std::vector<char> buffer(CHUNK_SIZE);

	while (f.read(buffer.data(), CHUNK_SIZE) || f.gcount() > 0) {
		lines.append(buffer.data(), f.gcount());
	}

	return FileContentsResult{
		.contents = lines,
		.error = {}
	};
}

std::string File::WriteContents(const std::string &file_name, const std::string &contents)
{
	std::ofstream f(file_name, std::ios::out | std::ios::binary | std::ios::trunc);
	if (!f) {
		return fmt::format("Couldn't open file [{}] for writing", file_name);
	}

	f.write(contents.data(), static_cast<std::streamsize>(contents.size()));
	f.close();
	if (!f) {
		return fmt::format("Failed writing [{}] bytes to [{}]", contents.size(), file_name);
	}

	return {};
}
