#include "notetrack/sources/memory_source.hpp"
#include "notetrack/sources/frontmatter_reader.hpp"
#include "notetrack/utils/string_utils.hpp"

#include <stdexcept>

namespace notetrack::sources {

void InMemoryDocumentSource::addNote(const std::string &path, std::string text,
                                     std::optional<core::DocumentMetadata> metadata) {
	const std::string normalized = normalizeFolder(path);
	if (normalized.empty()) {
		throw std::invalid_argument("Note path must not be empty.");
	}
	notes_[normalized] = Note{std::move(text), std::move(metadata)};
}

std::vector<core::DocumentHandle> InMemoryDocumentSource::listCandidateDocuments(const std::string &folder,
                                                                                 bool include_subfolders) const {
	const std::string normalized = normalizeFolder(folder);
	std::vector<core::DocumentHandle> handles;
	for (const auto &entry : notes_) {
		if (utils::endsWith(entry.first, ".md") && isInFolder(entry.first, normalized, include_subfolders)) {
			handles.push_back(makeHandle(entry.first));
		}
	}
	return handles;
}

std::optional<std::string> InMemoryDocumentSource::readDocumentText(const core::DocumentHandle &handle) const {
	const auto it = notes_.find(handle.path);
	if (it == notes_.end()) {
		return std::nullopt;
	}
	return it->second.text;
}

std::optional<core::DocumentMetadata>
InMemoryDocumentSource::readDocumentMetadata(const core::DocumentHandle &handle) const {
	const auto it = notes_.find(handle.path);
	if (it == notes_.end()) {
		return std::nullopt;
	}
	if (it->second.metadata) {
		return it->second.metadata;
	}
	return deriveMetadata(it->second.text);
}

std::optional<core::DocumentHandle> InMemoryDocumentSource::resolveDocumentByPath(const std::string &path) const {
	const std::string normalized = normalizeFolder(path);
	if (notes_.find(normalized) == notes_.end()) {
		return std::nullopt;
	}
	return makeHandle(normalized);
}

} // namespace notetrack::sources
