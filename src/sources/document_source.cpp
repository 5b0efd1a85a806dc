#include "notetrack/sources/document_source.hpp"
#include "notetrack/utils/string_utils.hpp"

namespace notetrack::sources {

std::string normalizeFolder(const std::string &folder) {
	return utils::trimByChar(utils::trim(folder), '/');
}

core::DocumentHandle makeHandle(const std::string &path) {
	const auto slash = path.rfind('/');
	std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
	const auto dot = name.rfind('.');
	if (dot != std::string::npos && dot > 0) {
		name.erase(dot);
	}
	return core::DocumentHandle{path, name};
}

bool isInFolder(const std::string &path, const std::string &folder, bool include_subfolders) {
	std::string relative = path;
	if (!folder.empty()) {
		if (!utils::startsWith(path, folder + "/")) {
			return false;
		}
		relative = path.substr(folder.size() + 1);
	}
	return include_subfolders || relative.find('/') == std::string::npos;
}

} // namespace notetrack::sources
