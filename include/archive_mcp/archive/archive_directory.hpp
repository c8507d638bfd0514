#pragma once

#include <archive_mcp/core/result.hpp>
#include <archive_mcp/index/document_index.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace archive_mcp {

struct ArchiveEntry {
    std::string filename;
    std::string path;
    std::uintmax_t size_bytes = 0;
};

// ---------------------------------------------------------------------------
// ArchiveDirectory — the documents directory backing the archive.
//
// Only regular files directly under the root whose extension is in the
// allow-list (case-insensitive) belong to the archive. Filenames are the
// document identifiers; a name carrying a path separator or ".." is
// rejected so reads never leave the root.
// ---------------------------------------------------------------------------
class ArchiveDirectory {
public:
    static const std::vector<std::string>& DefaultExtensions();

    explicit ArchiveDirectory(std::string root,
                              std::vector<std::string> extensions = DefaultExtensions());

    [[nodiscard]] const std::string& Root() const noexcept { return root_; }
    [[nodiscard]] const std::vector<std::string>& Extensions() const noexcept {
        return extensions_;
    }

    // Sorted by filename.
    [[nodiscard]] Result<std::vector<ArchiveEntry>, Error> Scan() const;

    [[nodiscard]] Result<std::string, Error> Read(std::string_view filename) const;

    // Scan + Read for every entry. Metadata carries path and size_bytes.
    [[nodiscard]] Result<std::vector<DocumentInput>, Error> LoadAll() const;

    [[nodiscard]] bool IsAllowedExtension(std::string_view filename) const;

private:
    std::string root_;
    std::vector<std::string> extensions_;  // lower-case, with leading dot
};

} // namespace archive_mcp
