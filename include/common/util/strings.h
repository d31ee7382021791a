#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

class Strings {
public:
	static bool Contains(const std::vector<std::string>& container, const std::string& element);
	static bool Contains(const std::string& subject, const std::string& search);
	static bool IsNumber(const std::string &s);
	static int64_t ToBigInt(const std::string &s, int64_t fallback = 0);
	static uint64_t ToUnsignedBigInt(const std::string &s, uint64_t fallback = 0);
	static const std::string ToLower(std::string s);
	static std::string &LTrim(std::string &str, std::string_view chars = "\t\n\v\f\r ");
	static std::string &RTrim(std::string &str, std::string_view chars = "\t\n\v\f\r ");
	static std::string &Trim(std::string &str, const std::string &chars = "\t\n\v\f\r ");
	static std::string Join(const std::vector<std::string> &ar, const std::string &delim);
	static std::string Replace(std::string subject, const std::string &search, const std::string &replace);
	static std::vector<std::string> Split(const std::string &s, const char delim = ',');
	static bool BeginsWith(const std::string& subject, const std::string& search);
	static bool EndsWith(const std::string& subject, const std::string& search);
};
