#include "notetrack/sources/filesystem_source.hpp"
#include "notetrack/sources/frontmatter_reader.hpp"
#include "notetrack/utils/logging.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace notetrack::sources {

namespace {

bool isMarkdownFile(const fs::directory_entry &entry) {
	std::error_code ec;
	return entry.is_regular_file(ec) && entry.path().extension() == ".md";
}

} // namespace

FilesystemDocumentSource::FilesystemDocumentSource(fs::path root) : root_(std::move(root)) {
	std::error_code ec;
	if (!fs::is_directory(root_, ec)) {
		throw std::invalid_argument("Vault root '" + root_.string() + "' is not a directory.");
	}
}

std::vector<core::DocumentHandle> FilesystemDocumentSource::listCandidateDocuments(const std::string &folder,
                                                                                   bool include_subfolders) const {
	std::vector<core::DocumentHandle> handles;
	const std::string normalized = normalizeFolder(folder);
	const fs::path directory = normalized.empty() ? root_ : root_ / normalized;

	std::error_code ec;
	if (!fs::is_directory(directory, ec)) {
		NOTETRACK_DEBUG("Folder '{}' does not exist under the vault root.", normalized);
		return handles;
	}

	auto collect = [&](const fs::directory_entry &entry) {
		if (isMarkdownFile(entry)) {
			handles.push_back(makeHandle(entry.path().lexically_relative(root_).generic_string()));
		}
	};
	if (include_subfolders) {
		for (fs::recursive_directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
			collect(*it);
		}
	} else {
		for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
			collect(*it);
		}
	}
	if (ec) {
		NOTETRACK_WARN("Listing '{}' stopped early: {}", directory.string(), ec.message());
	}

	std::sort(handles.begin(), handles.end(),
	          [](const core::DocumentHandle &a, const core::DocumentHandle &b) { return a.path < b.path; });
	return handles;
}

std::optional<std::string> FilesystemDocumentSource::readDocumentText(const core::DocumentHandle &handle) const {
	std::ifstream file(root_ / handle.path, std::ios::binary);
	if (!file) {
		NOTETRACK_DEBUG("Cannot open note '{}'.", handle.path);
		return std::nullopt;
	}
	std::ostringstream buffer;
	buffer << file.rdbuf();
	return buffer.str();
}

std::optional<core::DocumentMetadata>
FilesystemDocumentSource::readDocumentMetadata(const core::DocumentHandle &handle) const {
	const auto text = readDocumentText(handle);
	if (!text) {
		return std::nullopt;
	}
	return deriveMetadata(*text);
}

std::optional<core::DocumentHandle> FilesystemDocumentSource::resolveDocumentByPath(const std::string &path) const {
	const std::string normalized = normalizeFolder(path);
	std::error_code ec;
	if (normalized.empty() || !fs::is_regular_file(root_ / normalized, ec)) {
		return std::nullopt;
	}
	return makeHandle(normalized);
}

} // namespace notetrack::sources
