#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

struct FileContentsResult {
	std::string contents;
	std::string error;
};

class File {
public:
	static bool Exists(const std::string &name);
	static bool IsDirectory(const std::string &name);
	static bool Makedir(const std::string& directory_name);
	static FileContentsResult GetContents(const std::string &file_name);
	// Returns an empty string on success, otherwise the error message
	static std::string WriteContents(const std::string &file_name, const std::string &contents);
};
