#pragma once

#include "notetrack/core/document.hpp"

#include <optional>
#include <string>
#include <vector>

namespace notetrack::sources {

/**
 * @class IDocumentSource
 * @brief Abstract interface for a collection of markdown notes.
 *
 * Implementations list candidate notes under a folder and supply their text
 * and parsed metadata on demand. A missing note is reported as std::nullopt,
 * never as an exception.
 */
class IDocumentSource {
public:
	virtual ~IDocumentSource() = default;

	/**
	 * @brief Lists markdown notes under @p folder.
	 * @param folder Source-relative folder; "/" or "" denote the root.
	 * @param include_subfolders Whether to descend into nested folders.
	 * @return Handles sorted by path.
	 */
	virtual std::vector<core::DocumentHandle> listCandidateDocuments(const std::string &folder,
	                                                                 bool include_subfolders) const = 0;

	virtual std::optional<std::string> readDocumentText(const core::DocumentHandle &handle) const = 0;

	virtual std::optional<core::DocumentMetadata> readDocumentMetadata(const core::DocumentHandle &handle) const = 0;

	/// Looks a note up by its source-relative path, extension included.
	virtual std::optional<core::DocumentHandle> resolveDocumentByPath(const std::string &path) const = 0;
};

/// Strips leading and trailing slashes; "/" becomes "".
std::string normalizeFolder(const std::string &folder);

/// Builds a handle for a source-relative path.
core::DocumentHandle makeHandle(const std::string &path);

/// Whether @p path lies in @p folder (already normalized), directly or in a subfolder when allowed.
bool isInFolder(const std::string &path, const std::string &folder, bool include_subfolders);

} // namespace notetrack::sources
