#include "progress_parser.hpp"
#include "credential_masker.hpp"
#include <algorithm>
#include <iterator>
#include <regex>

namespace xfer {

namespace {

struct LineShape {
    ToolLineKind kind;
    std::regex pattern;
};

const std::vector<LineShape>& lineShapes() {
    static const std::vector<LineShape> shapes = {
        {ToolLineKind::DUMP_DONE,
         std::regex(R"(done dumping (\S+?)\.(\S+) \((\d+) documents?\))")},
        {ToolLineKind::RESTORE_FINISHED,
         std::regex(R"(finished restoring (\S+?)\.(\S+) \((\d+) document\S* (\d+) failure)")},
        {ToolLineKind::RESTORE_SUCCEEDED,
         std::regex(R"((\d+) document\(s\) restored successfully)")},
        {ToolLineKind::RESTORE_FAILED,
         std::regex(R"((\d+) document\(s\) failed to restore)")},
        {ToolLineKind::CONTINUING_ERROR, std::regex(R"(continuing through error:)")},
        {ToolLineKind::ARCHIVE_PRELUDE, std::regex(R"(archive prelude (\S+?)\.(\S+))")},
    };
    return shapes;
}

int64_t parseCount(const std::string& digits) {
    try {
        return std::stoll(digits);
    } catch (const std::out_of_range&) {
        return 0;
    }
}

ToolLineMatch toMatch(ToolLineKind kind, const std::smatch& m) {
    ToolLineMatch match{kind, {}, {}, 0, 0};
    switch (kind) {
        case ToolLineKind::DUMP_DONE:
            match.database = m[1];
            match.collection = m[2];
            match.count = parseCount(m[3]);
            break;
        case ToolLineKind::RESTORE_FINISHED:
            match.database = m[1];
            match.collection = m[2];
            match.count = parseCount(m[3]);
            match.failures = parseCount(m[4]);
            break;
        case ToolLineKind::RESTORE_SUCCEEDED:
        case ToolLineKind::RESTORE_FAILED:
            match.count = parseCount(m[1]);
            break;
        case ToolLineKind::ARCHIVE_PRELUDE:
            match.database = m[1];
            match.collection = m[2];
            break;
        case ToolLineKind::CONTINUING_ERROR:
            break;
    }
    return match;
}

} // namespace

std::vector<ToolLineMatch> matchToolLine(const std::string& line) {
    std::vector<ToolLineMatch> matches;
    for (const auto& shape : lineShapes()) {
        std::smatch m;
        if (std::regex_search(line, m, shape.pattern)) {
            matches.push_back(toMatch(shape.kind, m));
        }
    }
    return matches;
}

bool isToolErrorLine(const std::string& line) {
    return line.find("continuing through error:") != std::string::npos ||
           line.find("Failed") != std::string::npos;
}

DiagnosticTail::DiagnosticTail(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void DiagnosticTail::push(const std::string& line) {
    lines_.push_back(line);
    while (lines_.size() > capacity_) {
        lines_.pop_front();
    }
}

void DiagnosticTail::clear() {
    lines_.clear();
}

std::vector<std::string> DiagnosticTail::lines() const {
    return {lines_.begin(), lines_.end()};
}

std::string DiagnosticTail::maskedText() const {
    return maskLines(lines());
}

std::optional<ToolLineMatch> DumpAccumulator::consume(const std::string& line) {
    for (auto& match : matchToolLine(line)) {
        if (match.kind == ToolLineKind::DUMP_DONE) {
            ++namespacesDone_;
            recordsDumped_ += match.count;
            return match;
        }
    }
    return std::nullopt;
}

DatabaseImportResult& RestoreAccumulator::databaseEntry(const std::string& name) {
    auto it = std::find_if(result_.databases.begin(), result_.databases.end(),
                           [&name](const DatabaseImportResult& db) { return db.name == name; });
    if (it != result_.databases.end()) {
        return *it;
    }
    result_.databases.push_back({name, {}});
    return result_.databases.back();
}

std::optional<ToolLineMatch> RestoreAccumulator::consume(const std::string& line) {
    std::optional<ToolLineMatch> finished;

    for (auto& match : matchToolLine(line)) {
        switch (match.kind) {
            case ToolLineKind::RESTORE_FINISHED:
                databaseEntry(match.database)
                    .collections.push_back({match.collection, match.count, match.failures});
                result_.recordsInserted += match.count;
                result_.recordsFailed += match.failures;
                finished = match;
                break;
            case ToolLineKind::RESTORE_SUCCEEDED:
                result_.recordsInserted = match.count;
                break;
            case ToolLineKind::RESTORE_FAILED:
                result_.recordsFailed = match.count;
                break;
            default:
                break;
        }
    }

    if (isToolErrorLine(line)) {
        result_.addError(maskCredentials(line));
    }
    return finished;
}

bool PreviewAccumulator::consume(const std::string& line) {
    for (const auto& match : matchToolLine(line)) {
        if (match.kind != ToolLineKind::ARCHIVE_PRELUDE) {
            continue;
        }
        if (!seen_.insert(match.database + "." + match.collection).second) {
            return false;
        }

        auto& databases = preview_.databases;
        auto it = std::find_if(databases.begin(), databases.end(),
                               [&match](const ArchivePreviewDatabase& db) {
                                   return db.name == match.database;
                               });
        if (it == databases.end()) {
            databases.push_back({match.database, {}});
            it = std::prev(databases.end());
        }
        it->collections.push_back({match.collection});
        return true;
    }
    return false;
}

} // namespace xfer
