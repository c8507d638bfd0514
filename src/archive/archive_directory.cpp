#include <archive_mcp/archive/archive_directory.hpp>

#include <archive_mcp/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace archive_mcp {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Error MakeArchiveError(const std::string& operation, const std::string& message,
                       ErrorCategory category, const std::string& path) {
    return Error{operation, message, category, path};
}

bool IsSafeFilename(std::string_view name) {
    if (name.empty() || name == "." || name == "..") return false;
    if (name.find('/') != std::string_view::npos) return false;
    if (name.find('\\') != std::string_view::npos) return false;
    return true;
}

} // anonymous namespace

const std::vector<std::string>& ArchiveDirectory::DefaultExtensions() {
    static const std::vector<std::string> kDefaults = {".html", ".md", ".txt"};
    return kDefaults;
}

ArchiveDirectory::ArchiveDirectory(std::string root,
                                   std::vector<std::string> extensions)
    : root_(std::move(root)) {
    extensions_.reserve(extensions.size());
    for (auto& ext : extensions) {
        auto lowered = ToLower(std::move(ext));
        if (!lowered.empty() && lowered.front() != '.') {
            lowered.insert(lowered.begin(), '.');
        }
        extensions_.push_back(std::move(lowered));
    }
}

bool ArchiveDirectory::IsAllowedExtension(std::string_view filename) const {
    auto ext = ToLower(fs::path(std::string(filename)).extension().string());
    return std::find(extensions_.begin(), extensions_.end(), ext) != extensions_.end();
}

Result<std::vector<ArchiveEntry>, Error> ArchiveDirectory::Scan() const {
    using R = Result<std::vector<ArchiveEntry>, Error>;

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return R::Err(MakeArchiveError("ArchiveScan", "Documents directory not found",
                                       ErrorCategory::NotFound, root_));
    }

    std::vector<ArchiveEntry> entries;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        return R::Err(MakeArchiveError("ArchiveScan", ec.message(),
                                       ErrorCategory::Io, root_));
    }
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;

        auto filename = entry.path().filename().string();
        if (!IsAllowedExtension(filename)) continue;

        auto size = entry.file_size(entry_ec);
        if (entry_ec) {
            LogWarn("archive", "Cannot stat " + entry.path().string() + ": " +
                                   entry_ec.message());
            continue;
        }
        entries.push_back({filename, entry.path().string(), size});
    }

    std::sort(entries.begin(), entries.end(),
              [](const ArchiveEntry& a, const ArchiveEntry& b) {
                  return a.filename < b.filename;
              });
    return R::Ok(std::move(entries));
}

Result<std::string, Error> ArchiveDirectory::Read(std::string_view filename) const {
    using R = Result<std::string, Error>;
    const std::string name(filename);

    if (!IsSafeFilename(filename)) {
        return R::Err(MakeArchiveError("ArchiveRead", "Invalid document name: " + name,
                                       ErrorCategory::InvalidArgument, name));
    }

    const auto path = (fs::path(root_) / name).string();
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || !IsAllowedExtension(name)) {
        return R::Err(MakeArchiveError("ArchiveRead", "Document not found: " + name,
                                       ErrorCategory::NotFound, path));
    }

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        return R::Err(MakeArchiveError("ArchiveRead", "Cannot open document: " + name,
                                       ErrorCategory::Io, path));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return R::Err(MakeArchiveError("ArchiveRead", "Error reading document: " + name,
                                       ErrorCategory::Io, path));
    }
    return R::Ok(buffer.str());
}

Result<std::vector<DocumentInput>, Error> ArchiveDirectory::LoadAll() const {
    using R = Result<std::vector<DocumentInput>, Error>;

    auto scanned = Scan();
    if (scanned.IsErr()) {
        return R::Err(scanned.Error());
    }

    std::vector<DocumentInput> docs;
    for (const auto& entry : scanned.Value()) {
        auto content = Read(entry.filename);
        if (content.IsErr()) {
            LogWarn("archive", content.Error().ToString());
            continue;
        }
        docs.push_back({entry.filename, std::move(content).Value(),
                        {{"path", entry.path}, {"size_bytes", entry.size_bytes}}});
    }
    return R::Ok(std::move(docs));
}

} // namespace archive_mcp
