#include "common/util/json_config.h"
#include "common/util/file.h"
#include "common/logging.h"

#include <sstream>

ACC::JsonConfigFile::JsonConfigFile() : m_json(Json::objectValue), m_loaded(false)
{
}

ACC::JsonConfigFile::JsonConfigFile(const Json::Value &value) : m_json(value), m_loaded(true)
{
}

ACC::JsonConfigFile ACC::JsonConfigFile::Load(const std::string &filename)
{
	if (!File::Exists(filename)) {
		LOG_DEBUG(MOD_CONFIG, "Config file {} not found, using defaults", filename);
		return JsonConfigFile();
	}

	auto r = File::GetContents(filename);
	if (!r.error.empty()) {
		JsonConfigFile ret;
		ret.m_error = r.error;
		LOG_ERROR(MOD_CONFIG, "{}", r.error);
		return ret;
	}

	JsonConfigFile ret = Parse(r.contents);
	if (!ret.m_error.empty()) {
		LOG_ERROR(MOD_CONFIG, "Failed to parse {}: {}", filename, ret.m_error);
	}
	return ret;
}

ACC::JsonConfigFile ACC::JsonConfigFile::Parse(const std::string &json)
{
	Json::Value root;
	Json::CharReaderBuilder builder;
	std::string errors;
	std::istringstream stream(json);

	if (!Json::parseFromStream(builder, stream, &root, &errors)) {
		JsonConfigFile ret;
		ret.m_error = errors;
		return ret;
	}

	if (!root.isObject()) {
		JsonConfigFile ret;
		ret.m_error = "Config root must be a JSON object";
		return ret;
	}

	return JsonConfigFile(root);
}

bool ACC::JsonConfigFile::HasVariable(const std::string &name) const
{
	return m_json.isObject() && m_json.isMember(name) && !m_json[name].isNull();
}

std::string ACC::JsonConfigFile::GetVariableString(const std::string &name, const std::string &default_value) const
{
	if (!HasVariable(name) || !m_json[name].isString()) {
		return default_value;
	}
	return m_json[name].asString();
}

int64_t ACC::JsonConfigFile::GetVariableInt(const std::string &name, int64_t default_value) const
{
	if (!HasVariable(name) || !m_json[name].isInt64()) {
		return default_value;
	}
	return m_json[name].asInt64();
}

uint64_t ACC::JsonConfigFile::GetVariableUnsigned(const std::string &name, uint64_t default_value) const
{
	if (!HasVariable(name) || !m_json[name].isUInt64()) {
		return default_value;
	}
	return m_json[name].asUInt64();
}

bool ACC::JsonConfigFile::GetVariableBool(const std::string &name, bool default_value) const
{
	if (!HasVariable(name) || !m_json[name].isBool()) {
		return default_value;
	}
	return m_json[name].asBool();
}

std::vector<std::string> ACC::JsonConfigFile::GetVariableStringList(const std::string &name) const
{
	std::vector<std::string> ret;
	if (!HasVariable(name)) {
		return ret;
	}

	const Json::Value &value = m_json[name];
	if (value.isString()) {
		ret.push_back(value.asString());
		return ret;
	}
	if (!value.isArray()) {
		return ret;
	}

	for (const auto &item : value) {
		if (item.isString()) {
			ret.push_back(item.asString());
		}
	}
	return ret;
}
