#pragma once

#include <json/json.h>

#include <cstdint>
#include <string>
#include <vector>

namespace ACC
{
	// Thin wrapper around a parsed JSON config document. Missing keys and
	// values of the wrong type fall back to the supplied defaults.
	class JsonConfigFile
	{
	public:
		JsonConfigFile();
		explicit JsonConfigFile(const Json::Value &value);
		~JsonConfigFile() = default;

		// A missing file yields an empty, not-loaded config; a file that fails to
		// parse yields an empty config with Error() set.
		static JsonConfigFile Load(const std::string &filename);
		static JsonConfigFile Parse(const std::string &json);

		bool Loaded() const { return m_loaded; }
		const std::string &Error() const { return m_error; }

		bool HasVariable(const std::string &name) const;
		std::string GetVariableString(const std::string &name, const std::string &default_value = "") const;
		int64_t GetVariableInt(const std::string &name, int64_t default_value = 0) const;
		uint64_t GetVariableUnsigned(const std::string &name, uint64_t default_value = 0) const;
		bool GetVariableBool(const std::string &name, bool default_value = false) const;
		std::vector<std::string> GetVariableStringList(const std::string &name) const;

		Json::Value &RawHandle() { return m_json; }
		const Json::Value &RawHandle() const { return m_json; }

	private:
		Json::Value m_json;
		bool m_loaded;
		std::string m_error;
	};
}
