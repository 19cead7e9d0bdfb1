#include "zip_archive.hpp"
#include "transfer_exceptions.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <ctime>
#include <limits>
#include <zlib.h>

namespace xfer {

namespace {

constexpr uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;
constexpr uint32_t DATA_DESCRIPTOR_SIGNATURE = 0x08074b50;
constexpr uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
constexpr uint32_t END_OF_CENTRAL_DIR_SIGNATURE = 0x06054b50;
constexpr uint32_t ZIP64_END_SIGNATURE = 0x06064b50;
constexpr uint32_t ZIP64_LOCATOR_SIGNATURE = 0x07064b50;

constexpr uint16_t VERSION_NEEDED = 20;
constexpr uint16_t VERSION_ZIP64 = 45;
constexpr uint16_t ZIP64_EXTRA_TAG = 0x0001;
constexpr uint16_t FLAG_DATA_DESCRIPTOR = 0x0008;
constexpr uint16_t FLAG_UTF8 = 0x0800;
constexpr uint16_t METHOD_STORED = 0;
constexpr uint16_t METHOD_DEFLATED = 8;

constexpr size_t LOCAL_HEADER_SIZE = 30;
constexpr size_t CENTRAL_HEADER_SIZE = 46;
constexpr size_t END_OF_CENTRAL_DIR_SIZE = 22;
constexpr size_t ZIP64_END_SIZE = 56;
constexpr size_t ZIP64_LOCATOR_SIZE = 20;
constexpr size_t CHUNK_SIZE = 64 * 1024;

// Classic fields holding this value defer to the Zip64 records
constexpr uint32_t MAX_U32 = 0xffffffff;
constexpr uint16_t MAX_U16 = 0xffff;

SystemException archiveError(const std::string& path, const std::string& details) {
    return SystemException(ErrorCode::ARCHIVE_ERROR, details + ": " + path, "ZipArchive",
                           {{"path", path}});
}

uint16_t readU16(const unsigned char* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readU32(const unsigned char* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t readU64(const unsigned char* p) {
    return static_cast<uint64_t>(readU32(p)) | (static_cast<uint64_t>(readU32(p + 4)) << 32);
}

bool needsZip64(const ZipEntryInfo& entry) {
    return entry.compressedSize >= MAX_U32 || entry.uncompressedSize >= MAX_U32 ||
           entry.localHeaderOffset >= MAX_U32;
}

struct InflateStream {
    z_stream zs{};
    bool initialized = false;

    ~InflateStream() {
        if (initialized) {
            inflateEnd(&zs);
        }
    }
};

void dosDateTime(uint16_t& dosTime, uint16_t& dosDate) {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    int year = std::max(tm.tm_year + 1900, 1980);
    dosTime = static_cast<uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
    dosDate = static_cast<uint16_t>(((year - 1980) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
}

} // namespace

struct ZipWriter::DeflateStream {
    z_stream zs{};
    bool initialized = false;

    ~DeflateStream() {
        if (initialized) {
            deflateEnd(&zs);
        }
    }
};

ZipWriter::ZipWriter(const std::string& path, int compressionLevel)
    : path_(path), compressionLevel_(compressionLevel) {
    out_.open(path_, std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) {
        throw SystemException(ErrorCode::FILE_ERROR, "cannot create archive: " + path_,
                              "ZipArchive", {{"path", path_}});
    }
    dosDateTime(dosTime_, dosDate_);
}

ZipWriter::~ZipWriter() {
    stream_.reset();
    if (out_.is_open()) {
        out_.close();
    }
}

void ZipWriter::writeBytes(const void* data, size_t size) {
    out_.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!out_) {
        throw archiveError(path_, "write failed");
    }
    offset_ += size;
}

void ZipWriter::writeU16(uint16_t value) {
    unsigned char bytes[2] = {static_cast<unsigned char>(value & 0xff),
                              static_cast<unsigned char>((value >> 8) & 0xff)};
    writeBytes(bytes, sizeof(bytes));
}

void ZipWriter::writeU32(uint32_t value) {
    unsigned char bytes[4] = {
        static_cast<unsigned char>(value & 0xff), static_cast<unsigned char>((value >> 8) & 0xff),
        static_cast<unsigned char>((value >> 16) & 0xff),
        static_cast<unsigned char>((value >> 24) & 0xff)};
    writeBytes(bytes, sizeof(bytes));
}

void ZipWriter::writeU64(uint64_t value) {
    writeU32(static_cast<uint32_t>(value & MAX_U32));
    writeU32(static_cast<uint32_t>(value >> 32));
}

void ZipWriter::beginEntry(const std::string& name) {
    if (closed_) {
        throw archiveError(path_, "archive already closed");
    }
    if (stream_) {
        throw archiveError(path_, "entry '" + current_.name + "' still open");
    }
    if (name.empty() || name.size() > MAX_U16) {
        throw archiveError(path_, "invalid entry name");
    }

    current_ = ZipEntryInfo{};
    current_.name = name;
    current_.method = METHOD_DEFLATED;
    current_.localHeaderOffset = offset_;
    current_.crc32 = static_cast<uint32_t>(crc32(0L, Z_NULL, 0));

    writeU32(LOCAL_HEADER_SIGNATURE);
    writeU16(VERSION_NEEDED);
    writeU16(FLAG_DATA_DESCRIPTOR | FLAG_UTF8);
    writeU16(METHOD_DEFLATED);
    writeU16(dosTime_);
    writeU16(dosDate_);
    writeU32(0); // crc, sizes follow in the data descriptor
    writeU32(0);
    writeU32(0);
    writeU16(static_cast<uint16_t>(name.size()));
    writeU16(0);
    writeBytes(name.data(), name.size());

    auto stream = std::make_unique<DeflateStream>();
    if (deflateInit2(&stream->zs, compressionLevel_, Z_DEFLATED, -MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw archiveError(path_, "deflateInit2 failed");
    }
    stream->initialized = true;
    stream_ = std::move(stream);
}

void ZipWriter::drainDeflate(int flush) {
    std::array<unsigned char, CHUNK_SIZE> buffer;
    auto& zs = stream_->zs;
    int rc = Z_OK;
    do {
        zs.next_out = buffer.data();
        zs.avail_out = static_cast<uInt>(buffer.size());
        rc = deflate(&zs, flush);
        if (rc == Z_STREAM_ERROR) {
            throw archiveError(path_, "deflate failed");
        }
        size_t produced = buffer.size() - zs.avail_out;
        if (produced > 0) {
            writeBytes(buffer.data(), produced);
            current_.compressedSize += produced;
        }
    } while (zs.avail_out == 0 || (flush == Z_FINISH && rc != Z_STREAM_END));
}

void ZipWriter::write(std::string_view data) {
    if (!stream_) {
        throw archiveError(path_, "no open entry");
    }
    while (!data.empty()) {
        size_t take = std::min<size_t>(data.size(), std::numeric_limits<uInt>::max());
        auto& zs = stream_->zs;
        zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
        zs.avail_in = static_cast<uInt>(take);
        current_.crc32 = static_cast<uint32_t>(
            crc32(current_.crc32, reinterpret_cast<const Bytef*>(data.data()),
                  static_cast<uInt>(take)));
        current_.uncompressedSize += take;
        drainDeflate(Z_NO_FLUSH);
        data.remove_prefix(take);
    }
}

void ZipWriter::endEntry() {
    if (!stream_) {
        throw archiveError(path_, "no open entry");
    }
    stream_->zs.next_in = nullptr;
    stream_->zs.avail_in = 0;
    drainDeflate(Z_FINISH);
    stream_.reset();

    // Readers take the sizes from the central directory; the descriptor
    // widens to 8-byte sizes once they overflow
    writeU32(DATA_DESCRIPTOR_SIGNATURE);
    writeU32(current_.crc32);
    if (current_.compressedSize >= MAX_U32 || current_.uncompressedSize >= MAX_U32) {
        writeU64(current_.compressedSize);
        writeU64(current_.uncompressedSize);
    } else {
        writeU32(static_cast<uint32_t>(current_.compressedSize));
        writeU32(static_cast<uint32_t>(current_.uncompressedSize));
    }

    entries_.push_back(current_);
}

void ZipWriter::addEntry(const std::string& name, std::string_view content) {
    beginEntry(name);
    write(content);
    endEntry();
}

void ZipWriter::close() {
    if (closed_) {
        return;
    }
    if (stream_) {
        throw archiveError(path_, "entry '" + current_.name + "' still open");
    }

    uint64_t centralStart = offset_;
    for (const auto& entry : entries_) {
        const bool zip64 = needsZip64(entry);
        const uint16_t version = zip64 ? VERSION_ZIP64 : VERSION_NEEDED;
        writeU32(CENTRAL_HEADER_SIGNATURE);
        writeU16(version);
        writeU16(version);
        writeU16(FLAG_DATA_DESCRIPTOR | FLAG_UTF8);
        writeU16(entry.method);
        writeU16(dosTime_);
        writeU16(dosDate_);
        writeU32(entry.crc32);
        writeU32(zip64 ? MAX_U32 : static_cast<uint32_t>(entry.compressedSize));
        writeU32(zip64 ? MAX_U32 : static_cast<uint32_t>(entry.uncompressedSize));
        writeU16(static_cast<uint16_t>(entry.name.size()));
        writeU16(zip64 ? 28 : 0); // extra
        writeU16(0); // comment
        writeU16(0); // disk
        writeU16(0); // internal attributes
        writeU32(0); // external attributes
        writeU32(zip64 ? MAX_U32 : static_cast<uint32_t>(entry.localHeaderOffset));
        writeBytes(entry.name.data(), entry.name.size());
        if (zip64) {
            writeU16(ZIP64_EXTRA_TAG);
            writeU16(24);
            writeU64(entry.uncompressedSize);
            writeU64(entry.compressedSize);
            writeU64(entry.localHeaderOffset);
        }
    }
    const uint64_t centralSize = offset_ - centralStart;
    const uint64_t entryCount = entries_.size();

    if (entryCount >= MAX_U16 || centralSize >= MAX_U32 || centralStart >= MAX_U32) {
        const uint64_t zip64EndOffset = offset_;
        writeU32(ZIP64_END_SIGNATURE);
        writeU64(ZIP64_END_SIZE - 12);
        writeU16(VERSION_ZIP64);
        writeU16(VERSION_ZIP64);
        writeU32(0); // disk
        writeU32(0); // disk with central directory
        writeU64(entryCount);
        writeU64(entryCount);
        writeU64(centralSize);
        writeU64(centralStart);

        writeU32(ZIP64_LOCATOR_SIGNATURE);
        writeU32(0);
        writeU64(zip64EndOffset);
        writeU32(1); // total disks
    }

    writeU32(END_OF_CENTRAL_DIR_SIGNATURE);
    writeU16(0);
    writeU16(0);
    writeU16(static_cast<uint16_t>(std::min<uint64_t>(entryCount, MAX_U16)));
    writeU16(static_cast<uint16_t>(std::min<uint64_t>(entryCount, MAX_U16)));
    writeU32(static_cast<uint32_t>(std::min<uint64_t>(centralSize, MAX_U32)));
    writeU32(static_cast<uint32_t>(std::min<uint64_t>(centralStart, MAX_U32)));
    writeU16(0);

    out_.flush();
    out_.close();
    if (out_.fail()) {
        throw archiveError(path_, "close failed");
    }
    closed_ = true;
}

ZipReader::ZipReader(const std::string& path) : path_(path) {
    std::ifstream in(path_, std::ios::binary | std::ios::ate);
    if (!in.is_open()) {
        throw SystemException(ErrorCode::FILE_ERROR, "cannot open archive: " + path_,
                              "ZipArchive", {{"path", path_}});
    }

    auto fileSize = static_cast<uint64_t>(in.tellg());
    if (fileSize < END_OF_CENTRAL_DIR_SIZE) {
        throw archiveError(path_, "not a zip archive");
    }

    // The end record sits within the last 64 KiB + 22 bytes (max comment),
    // preceded by the Zip64 locator when there is one
    uint64_t tailSize =
        std::min<uint64_t>(fileSize, MAX_U16 + END_OF_CENTRAL_DIR_SIZE + ZIP64_LOCATOR_SIZE);
    std::vector<unsigned char> tail(tailSize);
    in.seekg(static_cast<std::streamoff>(fileSize - tailSize));
    in.read(reinterpret_cast<char*>(tail.data()), static_cast<std::streamsize>(tailSize));
    if (!in) {
        throw archiveError(path_, "read failed");
    }

    size_t eocdPos = tailSize;
    for (size_t i = tailSize - END_OF_CENTRAL_DIR_SIZE + 1; i-- > 0;) {
        if (readU32(&tail[i]) == END_OF_CENTRAL_DIR_SIGNATURE) {
            eocdPos = i;
            break;
        }
    }
    if (eocdPos == tailSize) {
        throw archiveError(path_, "end of central directory not found");
    }

    const unsigned char* eocd = &tail[eocdPos];
    uint64_t entryCount = readU16(eocd + 10);
    uint64_t centralSize = readU32(eocd + 12);
    uint64_t centralOffset = readU32(eocd + 16);

    if (eocdPos >= ZIP64_LOCATOR_SIZE &&
        readU32(&tail[eocdPos - ZIP64_LOCATOR_SIZE]) == ZIP64_LOCATOR_SIGNATURE) {
        uint64_t zip64EndOffset = readU64(&tail[eocdPos - ZIP64_LOCATOR_SIZE + 8]);
        if (zip64EndOffset + ZIP64_END_SIZE > fileSize) {
            throw archiveError(path_, "zip64 end record out of bounds");
        }
        unsigned char record[ZIP64_END_SIZE];
        in.seekg(static_cast<std::streamoff>(zip64EndOffset));
        in.read(reinterpret_cast<char*>(record), ZIP64_END_SIZE);
        if (!in || readU32(record) != ZIP64_END_SIGNATURE) {
            throw archiveError(path_, "corrupt zip64 end record");
        }
        entryCount = readU64(record + 32);
        centralSize = readU64(record + 40);
        centralOffset = readU64(record + 48);
    }

    if (centralOffset > fileSize || centralSize > fileSize - centralOffset) {
        throw archiveError(path_, "central directory out of bounds");
    }

    std::vector<unsigned char> central(centralSize);
    in.seekg(static_cast<std::streamoff>(centralOffset));
    in.read(reinterpret_cast<char*>(central.data()), static_cast<std::streamsize>(centralSize));
    if (!in) {
        throw archiveError(path_, "read failed");
    }

    size_t pos = 0;
    for (uint64_t i = 0; i < entryCount; ++i) {
        if (pos + CENTRAL_HEADER_SIZE > central.size() ||
            readU32(&central[pos]) != CENTRAL_HEADER_SIGNATURE) {
            throw archiveError(path_, "corrupt central directory");
        }
        const unsigned char* h = &central[pos];
        ZipEntryInfo info;
        info.method = readU16(h + 10);
        info.crc32 = readU32(h + 16);
        uint32_t compressedSize = readU32(h + 20);
        uint32_t uncompressedSize = readU32(h + 24);
        uint16_t nameLength = readU16(h + 28);
        uint16_t extraLength = readU16(h + 30);
        uint16_t commentLength = readU16(h + 32);
        uint32_t localHeaderOffset = readU32(h + 42);
        info.compressedSize = compressedSize;
        info.uncompressedSize = uncompressedSize;
        info.localHeaderOffset = localHeaderOffset;

        if (pos + CENTRAL_HEADER_SIZE + nameLength + extraLength > central.size()) {
            throw archiveError(path_, "corrupt central directory");
        }
        info.name.assign(reinterpret_cast<const char*>(h + CENTRAL_HEADER_SIZE), nameLength);

        // Zip64 extra field: only the overflowed values, in this order
        const unsigned char* extra = h + CENTRAL_HEADER_SIZE + nameLength;
        for (size_t at = 0; at + 4 <= extraLength;) {
            uint16_t tag = readU16(extra + at);
            uint16_t size = readU16(extra + at + 2);
            if (at + 4 + size > extraLength) {
                throw archiveError(path_, "corrupt extra field for '" + info.name + "'");
            }
            if (tag == ZIP64_EXTRA_TAG) {
                const unsigned char* field = extra + at + 4;
                size_t left = size;
                auto take = [&](uint64_t& target) {
                    if (left < 8) {
                        throw archiveError(path_, "short zip64 field for '" + info.name + "'");
                    }
                    target = readU64(field);
                    field += 8;
                    left -= 8;
                };
                if (uncompressedSize == MAX_U32) {
                    take(info.uncompressedSize);
                }
                if (compressedSize == MAX_U32) {
                    take(info.compressedSize);
                }
                if (localHeaderOffset == MAX_U32) {
                    take(info.localHeaderOffset);
                }
            }
            at += 4 + size;
        }

        entries_.push_back(std::move(info));
        pos += CENTRAL_HEADER_SIZE + nameLength + extraLength + commentLength;
    }
}

bool ZipReader::contains(const std::string& name) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&name](const ZipEntryInfo& e) { return e.name == name; });
}

const ZipEntryInfo& ZipReader::entry(const std::string& name) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&name](const ZipEntryInfo& e) { return e.name == name; });
    if (it == entries_.end()) {
        throw archiveError(path_, "no entry '" + name + "'");
    }
    return *it;
}

std::string ZipReader::read(const std::string& name) const {
    std::string content;
    content.reserve(entry(name).uncompressedSize);
    stream(name, [&content](std::string_view chunk) { content.append(chunk); });
    return content;
}

void ZipReader::stream(const std::string& name, const ZipChunkHandler& onChunk) const {
    const auto& info = entry(name);

    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        throw SystemException(ErrorCode::FILE_ERROR, "cannot open archive: " + path_,
                              "ZipArchive", {{"path", path_}});
    }

    unsigned char header[LOCAL_HEADER_SIZE];
    in.seekg(static_cast<std::streamoff>(info.localHeaderOffset));
    in.read(reinterpret_cast<char*>(header), LOCAL_HEADER_SIZE);
    if (!in || readU32(header) != LOCAL_HEADER_SIGNATURE) {
        throw archiveError(path_, "corrupt local header for '" + name + "'");
    }
    in.seekg(readU16(header + 26) + readU16(header + 28), std::ios::cur);

    std::vector<char> input(CHUNK_SIZE);
    uint64_t remaining = info.compressedSize;
    auto fill = [&]() -> size_t {
        size_t take = static_cast<size_t>(std::min<uint64_t>(remaining, input.size()));
        in.read(input.data(), static_cast<std::streamsize>(take));
        if (!in) {
            throw archiveError(path_, "truncated entry '" + name + "'");
        }
        remaining -= take;
        return take;
    };

    auto crc = static_cast<uint32_t>(crc32(0L, Z_NULL, 0));
    uint64_t produced = 0;
    auto deliver = [&](const char* data, size_t size) {
        crc = static_cast<uint32_t>(
            crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(size)));
        produced += size;
        onChunk(std::string_view(data, size));
    };

    if (info.method == METHOD_STORED) {
        while (remaining > 0) {
            size_t size = fill();
            deliver(input.data(), size);
        }
    } else if (info.method == METHOD_DEFLATED) {
        InflateStream stream;
        if (inflateInit2(&stream.zs, -MAX_WBITS) != Z_OK) {
            throw archiveError(path_, "inflateInit2 failed");
        }
        stream.initialized = true;

        std::vector<char> output(CHUNK_SIZE);
        auto& zs = stream.zs;
        int rc = Z_OK;
        while (rc != Z_STREAM_END) {
            if (zs.avail_in == 0 && remaining > 0) {
                zs.avail_in = static_cast<uInt>(fill());
                zs.next_in = reinterpret_cast<Bytef*>(input.data());
            }
            zs.next_out = reinterpret_cast<Bytef*>(output.data());
            zs.avail_out = static_cast<uInt>(output.size());
            rc = inflate(&zs, Z_NO_FLUSH);
            // Z_BUF_ERROR: input exhausted before the end of the stream
            if (rc != Z_OK && rc != Z_STREAM_END) {
                throw archiveError(path_, "corrupt data in '" + name + "'");
            }
            size_t size = output.size() - zs.avail_out;
            if (size > 0) {
                deliver(output.data(), size);
            }
        }
    } else {
        throw archiveError(path_, "unsupported compression method in '" + name + "'");
    }

    if (produced != info.uncompressedSize) {
        throw archiveError(path_, "corrupt data in '" + name + "'");
    }
    if (crc != info.crc32) {
        throw archiveError(path_, "checksum mismatch in '" + name + "'");
    }
}

} // namespace xfer
