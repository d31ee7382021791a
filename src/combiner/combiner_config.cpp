#include "combiner/combiner_config.h"
#include "combiner/part_descriptor.h"
#include "common/logging.h"
#include "common/util/strings.h"

#include <stdexcept>

namespace ACC {
namespace Combiner {

namespace {

bool readStringList(const Json::Value& root, const char* key, std::vector<std::string>& out,
                    std::string& error) {
    if (!root.isMember(key)) {
        return true;
    }
    const Json::Value& value = root[key];
    if (!value.isArray()) {
        error = fmt::format("'{}' must be an array of strings", key);
        return false;
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.isString()) {
            error = fmt::format("'{}' must be an array of strings", key);
            return false;
        }
        items.push_back(item.asString());
    }
    out = std::move(items);
    return true;
}

bool readString(const Json::Value& root, const char* key, std::string& out, std::string& error) {
    if (!root.isMember(key)) {
        return true;
    }
    if (!root[key].isString()) {
        error = fmt::format("'{}' must be a string", key);
        return false;
    }
    out = root[key].asString();
    return true;
}

} // namespace

bool applyJsonConfig(const JsonConfigFile& file, CombinerConfig& cfg, std::string& error) {
    const Json::Value& root = file.RawHandle();
    if (!root.isObject()) {
        return true;
    }

    if (!readString(root, "import_path", cfg.importPath, error) ||
        !readString(root, "export_path", cfg.exportPath, error)) {
        return false;
    }

    if (root.isMember("combinations")) {
        if (!root["combinations"].isInt64() || root["combinations"].asInt64() < 0) {
            error = "'combinations' must be a non-negative integer";
            return false;
        }
        cfg.combinations = root["combinations"].asInt64();
    }

    if (root.isMember("seed")) {
        if (!root["seed"].isUInt64()) {
            error = "'seed' must be a non-negative integer";
            return false;
        }
        cfg.seed = root["seed"].asUInt64();
    }

    std::vector<std::string> categories;
    if (!readStringList(root, "categories", categories, error) ||
        !readStringList(root, "extensions", cfg.extensions, error) ||
        !readStringList(root, "ignore", cfg.ignore, error)) {
        return false;
    }
    if (root.isMember("categories")) {
        cfg.categories.clear();
        for (const auto& category : categories) {
            cfg.categories.insert(Strings::ToLower(category));
        }
    }

    cfg.createExportDir = file.GetVariableBool("create_export_dir", cfg.createExportDir);
    cfg.dryRun = file.GetVariableBool("dry_run", cfg.dryRun);

    LOG_DEBUG(MOD_CONFIG, "Config: import={} export={} combinations={} categories={}",
              cfg.importPath, cfg.exportPath, cfg.combinations, cfg.categories.size());
    return true;
}

std::optional<int64_t> parseCombinationCount(const std::string& value) {
    if (!Strings::IsNumber(value)) {
        return std::nullopt;
    }
    try {
        return static_cast<int64_t>(std::stoll(value));
    } catch (const std::out_of_range&) {
        LOG_DEBUG(MOD_CONFIG, "Combination count {} out of range", value);
        return std::nullopt;
    }
}

std::optional<uint64_t> parseSeed(const std::string& value) {
    // stoull would wrap a leading minus
    if (!Strings::IsNumber(value) || Strings::BeginsWith(value, "-")) {
        return std::nullopt;
    }
    try {
        return static_cast<uint64_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        LOG_DEBUG(MOD_CONFIG, "Seed {} out of range", value);
        return std::nullopt;
    }
}

std::string validateConfig(const CombinerConfig& cfg) {
    if (cfg.importPath.empty()) {
        return "an import folder is required";
    }
    if (cfg.exportPath.empty() && !cfg.dryRun) {
        return "an export folder is required";
    }
    if (cfg.combinations < 0) {
        return fmt::format("combinations must not be negative, got {}", cfg.combinations);
    }
    if (cfg.extensions.empty()) {
        return "at least one input file extension is required";
    }
    for (const auto& category : cfg.categories) {
        if (category.empty() || category.find(kTagSeparator) != std::string::npos) {
            return fmt::format("invalid category '{}'", category);
        }
    }
    return {};
}

} // namespace Combiner
} // namespace ACC
