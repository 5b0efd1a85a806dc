#pragma once

#include "notetrack/sources/document_source.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace notetrack::sources {

/**
 * @class FilesystemDocumentSource
 * @brief Reads markdown notes from a vault directory on disk.
 *
 * Document paths are relative to the vault root and use '/' separators.
 */
class FilesystemDocumentSource : public IDocumentSource {
public:
	/**
	 * @param root Vault root directory.
	 * @throws std::invalid_argument If @p root is not an existing directory.
	 */
	explicit FilesystemDocumentSource(std::filesystem::path root);

	const std::filesystem::path &root() const {
		return root_;
	}

	std::vector<core::DocumentHandle> listCandidateDocuments(const std::string &folder,
	                                                         bool include_subfolders) const override;
	std::optional<std::string> readDocumentText(const core::DocumentHandle &handle) const override;
	std::optional<core::DocumentMetadata> readDocumentMetadata(const core::DocumentHandle &handle) const override;
	std::optional<core::DocumentHandle> resolveDocumentByPath(const std::string &path) const override;

private:
	std::filesystem::path root_;
};

} // namespace notetrack::sources
