#pragma once

#include "notetrack/sources/document_source.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace notetrack::sources {

/**
 * @class InMemoryDocumentSource
 * @brief Notes held in memory, keyed by source-relative path.
 *
 * Metadata is derived from the note text unless it was supplied explicitly
 * when the note was added.
 */
class InMemoryDocumentSource : public IDocumentSource {
public:
	/**
	 * @brief Adds or replaces a note.
	 * @throws std::invalid_argument If @p path is empty.
	 */
	void addNote(const std::string &path, std::string text,
	             std::optional<core::DocumentMetadata> metadata = std::nullopt);

	std::size_t size() const {
		return notes_.size();
	}

	std::vector<core::DocumentHandle> listCandidateDocuments(const std::string &folder,
	                                                         bool include_subfolders) const override;
	std::optional<std::string> readDocumentText(const core::DocumentHandle &handle) const override;
	std::optional<core::DocumentMetadata> readDocumentMetadata(const core::DocumentHandle &handle) const override;
	std::optional<core::DocumentHandle> resolveDocumentByPath(const std::string &path) const override;

private:
	struct Note {
		std::string text;
		std::optional<core::DocumentMetadata> metadata;
	};

	std::map<std::string, Note> notes_;
};

} // namespace notetrack::sources
