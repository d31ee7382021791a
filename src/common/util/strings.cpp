#include "common/util/strings.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

bool Strings::Contains(const std::vector<std::string>& container, const std::string& element)
{
	return std::find(container.begin(), container.end(), element) != container.end();
}

bool Strings::Contains(const std::string& subject, const std::string& search)
{
	if (subject.length() < search.length()) {
		return false;
	}
	return subject.find(search) != std::string::npos;
}

bool Strings::IsNumber(const std::string &s)
{
	if (s.empty() || s == "-") {
		return false;
	}

	for (size_t i = 0; i < s.size(); ++i) {
		if (i == 0 && s[0] == '-') {
			continue;
		}
		if (std::isdigit(static_cast<unsigned char>(s[i])) == 0) {
			return false;
		}
	}

	return true;
}

int64_t Strings::ToBigInt(const std::string &s, int64_t fallback)
{
	if (!Strings::IsNumber(s)) {
		return fallback;
	}

	try {
		return std::stoll(s);
	}
	catch (const std::out_of_range &) {
		return fallback;
	}
	catch (const std::invalid_argument &) {
		return fallback;
	}
}

uint64_t Strings::ToUnsignedBigInt(const std::string &s, uint64_t fallback)
{
	if (!Strings::IsNumber(s) || s[0] == '-') {
		return fallback;
	}

	try {
		return std::stoull(s);
	}
	catch (const std::out_of_range &) {
		return fallback;
	}
	catch (const std::invalid_argument &) {
		return fallback;
	}
}

const std::string Strings::ToLower(std::string s)
{
	std::transform(
		s.begin(), s.end(), s.begin(),
		[](unsigned char c) { return ::tolower(c); }
	);
	return s;
}

std::string &Strings::LTrim(std::string &str, std::string_view chars)
{
	str.erase(0, str.find_first_not_of(chars));
	return str;
}

std::string &Strings::RTrim(std::string &str, std::string_view chars)
{
	str.erase(str.find_last_not_of(chars) + 1);
	return str;
}

std::string &Strings::Trim(std::string &str, const std::string &chars)
{
	return LTrim(RTrim(str, chars), chars);
}

std::string Strings::Join(const std::vector<std::string> &ar, const std::string &delim)
{
	std::string ret;
	for (size_t i = 0; i < ar.size(); ++i) {
		if (i != 0) {
			ret += delim;
		}
		ret += ar[i];
	}
	return ret;
}

std::string Strings::Replace(std::string subject, const std::string &search, const std::string &replace)
{
	if (search.empty()) {
		return subject;
	}

	size_t pos = 0;
	while ((pos = subject.find(search, pos)) != std::string::npos) {
		subject.replace(pos, search.length(), replace);
		pos += replace.length();
	}
	return subject;
}

// Empty fields between delimiters are kept, a trailing delimiter does not add one
std::vector<std::string> Strings::Split(const std::string &str, const char delim)
{
	std::vector<std::string> ret;
	std::string::size_type   start = 0;
	auto                     end   = str.find(delim);
	while (end != std::string::npos) {
		ret.emplace_back(str, start, end - start);
		start = end + 1;
		end   = str.find(delim, start);
	}
	if (str.length() > start) {
		ret.emplace_back(str, start, str.length() - start);
	}
	return ret;
}

bool Strings::BeginsWith(const std::string& subject, const std::string& search)
{
	if (subject.length() < search.length()) {
		return false;
	}
	return subject.compare(0, search.length(), search) == 0;
}

bool Strings::EndsWith(const std::string& subject, const std::string& search)
{
	if (subject.length() < search.length()) {
		return false;
	}
	return subject.compare(subject.length() - search.length(), search.length(), search) == 0;
}
