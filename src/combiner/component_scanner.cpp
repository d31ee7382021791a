#include "combiner/component_scanner.h"
#include "common/logging.h"
#include "common/util/file.h"
#include "common/util/strings.h"

#include <algorithm>
#include <system_error>

namespace ACC {
namespace Combiner {

namespace {

std::vector<std::string> normalizeExtensions(const std::vector<std::string>& extensions) {
    std::vector<std::string> normalized;
    for (std::string ext : extensions) {
        Strings::Trim(ext);
        ext = Strings::ToLower(ext);
        if (!ext.empty() && ext[0] != '.') {
            ext = "." + ext;
        }
        if (!ext.empty()) {
            normalized.push_back(ext);
        }
    }
    return normalized;
}

bool isHidden(const fs::path& path) {
    std::string name = path.filename().string();
    return !name.empty() && name[0] == '.';
}

} // namespace

std::vector<std::string> listCategoryFolders(const std::string& root) {
    std::vector<std::string> folders;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(root, ec)) {
        if (entry.is_directory(ec) && !isHidden(entry.path())) {
            folders.push_back(Strings::ToLower(entry.path().filename().string()));
        }
    }
    std::sort(folders.begin(), folders.end());
    return folders;
}

ScanResult scanComponents(const std::string& root, const std::vector<std::string>& extensions) {
    ScanResult result;

    if (!File::IsDirectory(root)) {
        result.error = fmt::format("import folder '{}' is not a directory", root);
        LOG_ERROR(MOD_SCAN, "{}", result.error);
        return result;
    }

    std::vector<std::string> wanted = normalizeExtensions(extensions);
    if (wanted.empty()) {
        result.error = "no file extensions to scan for";
        LOG_ERROR(MOD_SCAN, "{}", result.error);
        return result;
    }

    std::error_code ec;
    std::vector<fs::path> categoryDirs;
    for (const auto& entry : fs::directory_iterator(root, ec)) {
        if (!entry.is_directory(ec)) {
            continue;
        }
        std::string folder = entry.path().filename().string();
        if (isHidden(entry.path())) {
            result.skippedFolders.push_back(folder);
            continue;
        }
        if (folder.find(kTagSeparator) != std::string::npos) {
            LOG_WARN(MOD_SCAN, "Folder '{}' contains '{}', cannot be a category", folder, kTagSeparator);
            result.skippedFolders.push_back(folder);
            continue;
        }
        categoryDirs.push_back(entry.path());
    }
    if (ec) {
        result.error = fmt::format("cannot list '{}': {}", root, ec.message());
        LOG_ERROR(MOD_SCAN, "{}", result.error);
        return result;
    }

    for (const auto& dir : categoryDirs) {
        std::string category = Strings::ToLower(dir.filename().string());
        size_t before = result.files.size();

        auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (!it->is_regular_file(ec)) {
                continue;
            }
            std::string ext = Strings::ToLower(it->path().extension().string());
            if (!Strings::Contains(wanted, ext)) {
                continue;
            }
            result.files.push_back(DiscoveredFile{
                category, it->path().stem().string(), it->path().string()});
        }
        if (ec) {
            LOG_WARN(MOD_SCAN, "Stopped scanning '{}': {}", dir.string(), ec.message());
            ec.clear();
        }

        LOG_DEBUG(MOD_SCAN, "Category '{}': {} files", category, result.files.size() - before);
    }

    std::sort(result.files.begin(), result.files.end(),
              [](const DiscoveredFile& a, const DiscoveredFile& b) { return a.path < b.path; });

    LOG_INFO(MOD_SCAN, "Found {} component files in {} categories under {}",
             result.files.size(), categoryDirs.size(), root);
    return result;
}

} // namespace Combiner
} // namespace ACC
