#include "archive_classifier.hpp"
#include "logger.hpp"
#include "string_utils.hpp"
#include "transfer_exceptions.hpp"
#include <algorithm>

namespace fs = std::filesystem;

namespace xfer {

std::string importSourceKindToString(ImportSourceKind kind) {
    switch (kind) {
        case ImportSourceKind::ARCHIVE: return "archive";
        case ImportSourceKind::ARCHIVE_DIRECTORY: return "archive-directory";
        case ImportSourceKind::DUMP_DIRECTORY: return "dump-directory";
    }
    return "unknown";
}

ArchiveClassifier::ArchiveClassifier(std::string archiveExtension, int gzipScanDepth)
    : archiveExtension_(std::move(archiveExtension)), gzipScanDepth_(gzipScanDepth) {}

ImportSource ArchiveClassifier::classify(const fs::path& path) const {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        throw ValidationException(ErrorCode::INVALID_INPUT,
                                  "input path not accessible: " + path.string(),
                                  "inputPath", path.string());
    }

    ImportSource source;
    source.path = path;

    if (!fs::is_directory(status)) {
        source.kind = ImportSourceKind::ARCHIVE;
    } else if (containsArchives(path)) {
        source.kind = ImportSourceKind::ARCHIVE_DIRECTORY;
    } else {
        source.kind = ImportSourceKind::DUMP_DIRECTORY;
        source.gzip = containsGzipPayload(path);
    }

    ClassifierLogger::debug("{} classified as {}{}", path.string(),
                            importSourceKindToString(source.kind),
                            source.gzip ? " (gzip)" : "");
    return source;
}

std::vector<fs::path> ArchiveClassifier::listArchives(const fs::path& dir) const {
    std::vector<fs::path> archives;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_directory(typeEc)) {
            continue;
        }
        if (string_utils::iends_with(it->path().filename().string(), archiveExtension_)) {
            archives.push_back(it->path());
        }
    }
    if (ec) {
        throw createSystemError(ErrorCode::FILE_ERROR, "ArchiveClassifier",
                                "failed to read directory " + dir.string() + ": " + ec.message());
    }
    std::sort(archives.begin(), archives.end());
    return archives;
}

bool ArchiveClassifier::containsArchives(const fs::path& dir) const {
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (!it->is_directory(typeEc) &&
            string_utils::iends_with(it->path().filename().string(), archiveExtension_)) {
            return true;
        }
    }
    return false;
}

bool ArchiveClassifier::containsGzipPayload(const fs::path& dir) const {
    return containsGzipPayload(dir, gzipScanDepth_);
}

bool ArchiveClassifier::containsGzipPayload(const fs::path& dir, int remainingDepth) const {
    if (remainingDepth <= 0) {
        return false;
    }

    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_symlink(typeEc)) {
            // Symlinked files still count, symlinked directories are skipped
            if (!it->is_directory(typeEc) &&
                string_utils::iends_with(it->path().filename().string(), ".gz")) {
                return true;
            }
            continue;
        }
        if (it->is_directory(typeEc)) {
            if (containsGzipPayload(it->path(), remainingDepth - 1)) {
                return true;
            }
            continue;
        }
        if (string_utils::iends_with(it->path().filename().string(), ".gz")) {
            return true;
        }
    }
    return false;
}

std::vector<ImportDirEntry> scanImportDirectory(const fs::path& dir) {
    std::vector<ImportDirEntry> entries;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw createSystemError(ErrorCode::FILE_ERROR, "ArchiveClassifier",
                                "failed to read directory " + dir.string() + ": " + ec.message());
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code entryEc;
        if (!it->is_regular_file(entryEc)) {
            continue;
        }
        auto size = it->file_size(entryEc);
        if (entryEc) {
            continue;
        }
        entries.push_back({it->path().filename().string(), size});
    }
    std::sort(entries.begin(), entries.end(),
              [](const ImportDirEntry& a, const ImportDirEntry& b) { return a.name < b.name; });
    return entries;
}

} // namespace xfer
