#include "fastdocx/opc/PartPath.hpp"
#include "fastdocx/core/Constants.hpp"
#include <vector>

namespace fastdocx {
namespace opc {

std::string directoryOf(std::string_view part_name) {
    size_t last_slash = part_name.find_last_of('/');
    if (last_slash == std::string_view::npos) {
        return std::string();
    }
    return std::string(part_name.substr(0, last_slash));
}

std::string resolvePartPath(std::string_view base_dir, std::string_view target) {
    std::string combined;
    if (!target.empty() && target.front() == '/') {
        combined = std::string(target.substr(1));
    } else if (base_dir.empty()) {
        combined = std::string(target);
    } else {
        combined.reserve(base_dir.size() + 1 + target.size());
        combined.append(base_dir.data(), base_dir.size());
        combined += '/';
        combined.append(target.data(), target.size());
    }

    std::vector<std::string_view> segments;
    std::string_view rest(combined);
    while (!rest.empty()) {
        size_t slash = rest.find('/');
        std::string_view segment = rest.substr(0, slash);
        rest = slash == std::string_view::npos ? std::string_view() : rest.substr(slash + 1);

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
            continue;
        }
        segments.push_back(segment);
    }

    std::string result;
    result.reserve(combined.size());
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            result += '/';
        }
        result.append(segments[i].data(), segments[i].size());
    }
    return result;
}

std::string relationshipsPathFor(std::string_view part_name) {
    std::string dir = directoryOf(part_name);
    std::string_view file_name = dir.empty() ? part_name : part_name.substr(dir.size() + 1);

    std::string result;
    if (!dir.empty()) {
        result = dir + "/";
    }
    result += core::Constants::kRelationshipsDirectory;
    result += '/';
    result.append(file_name.data(), file_name.size());
    result += core::Constants::kRelationshipsExtension;
    return result;
}

}} // namespace fastdocx::opc
