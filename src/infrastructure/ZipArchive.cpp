/**
 * @file ZipArchive.cpp
 * @brief Implementation of ZipArchive.
 */

#include "infrastructure/ZipArchive.hpp"
#include <cstring>
#include <fstream>
#include <zlib.h>

namespace fs = std::filesystem;

namespace solverify::infrastructure {

namespace {

constexpr uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSignature = 0x06054b50;

constexpr size_t kLocalHeaderSize = 30;
constexpr size_t kCentralHeaderSize = 46;
constexpr size_t kEndOfCentralDirSize = 22;
constexpr size_t kMaxCommentSize = 0xFFFF;
constexpr size_t kInflateChunkSize = 16384;

constexpr uint16_t kMethodStored = 0;
constexpr uint16_t kMethodDeflated = 8;
constexpr uint16_t kFlagEncrypted = 0x0001;

uint16_t ReadU16(std::string_view data, size_t offset) {
    return static_cast<uint16_t>(static_cast<uint8_t>(data[offset]) |
                                 (static_cast<uint8_t>(data[offset + 1]) << 8));
}

uint32_t ReadU32(std::string_view data, size_t offset) {
    return static_cast<uint32_t>(static_cast<uint8_t>(data[offset])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 2])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 3])) << 24);
}

size_t FindEndOfCentralDirectory(std::string_view data) {
    if (data.size() < kEndOfCentralDirSize) {
        throw ZipError("buffer too small for a zip archive");
    }
    size_t pos = data.size() - kEndOfCentralDirSize;
    size_t lowest = pos > kMaxCommentSize ? pos - kMaxCommentSize : 0;
    while (true) {
        if (ReadU32(data, pos) == kEndOfCentralDirSignature &&
            pos + kEndOfCentralDirSize + ReadU16(data, pos + 20) <= data.size()) {
            return pos;
        }
        if (pos == lowest) break;
        --pos;
    }
    throw ZipError("end of central directory not found");
}

std::string Inflate(std::string_view compressed, uint32_t expectedSize) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    if (inflateInit2(&strm, -15) != Z_OK) {
        throw ZipError("inflateInit2 failed");
    }

    // Output grows with the data actually decoded, never with the declared size.
    std::string out;
    char chunk[kInflateChunkSize];
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
    strm.avail_in = static_cast<uInt>(compressed.size());

    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        strm.next_out = reinterpret_cast<Bytef*>(chunk);
        strm.avail_out = static_cast<uInt>(sizeof(chunk));
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            throw ZipError("corrupt deflate stream");
        }
        const size_t produced = sizeof(chunk) - strm.avail_out;
        if (out.size() + produced > expectedSize) {
            inflateEnd(&strm);
            throw ZipError("deflate stream longer than declared");
        }
        out.append(chunk, produced);
        if (ret == Z_OK && produced == 0 && strm.avail_in == 0) {
            inflateEnd(&strm);
            throw ZipError("truncated deflate stream");
        }
    }
    inflateEnd(&strm);

    if (out.size() != expectedSize) {
        throw ZipError("deflate stream shorter than declared");
    }
    return out;
}

// Rejects absolute names and names that climb out of the extraction root.
bool IsSafeMemberPath(const fs::path& relative) {
    if (relative.empty() || relative.is_absolute() || relative.has_root_name() || relative.has_root_directory()) {
        return false;
    }
    for (const auto& part : relative) {
        if (part == "..") return false;
    }
    return true;
}

} // namespace

ZipArchive ZipArchive::Open(std::string_view buffer) {
    ZipArchive archive(buffer);
    const size_t eocd = FindEndOfCentralDirectory(buffer);

    const uint16_t diskNumber = ReadU16(buffer, eocd + 4);
    const uint16_t centralDirDisk = ReadU16(buffer, eocd + 6);
    const uint16_t entriesOnDisk = ReadU16(buffer, eocd + 8);
    const uint16_t totalEntries = ReadU16(buffer, eocd + 10);
    const uint32_t centralDirSize = ReadU32(buffer, eocd + 12);
    const uint32_t centralDirOffset = ReadU32(buffer, eocd + 16);

    if (diskNumber != 0 || centralDirDisk != 0 || entriesOnDisk != totalEntries) {
        throw ZipError("multi-disk archives are not supported");
    }
    if (totalEntries == 0xFFFF || centralDirOffset == 0xFFFFFFFF || centralDirSize == 0xFFFFFFFF) {
        throw ZipError("zip64 archives are not supported");
    }
    if (static_cast<uint64_t>(centralDirOffset) + centralDirSize > eocd) {
        throw ZipError("central directory out of range");
    }

    size_t pos = centralDirOffset;
    const size_t end = static_cast<size_t>(centralDirOffset) + centralDirSize;
    for (uint16_t i = 0; i < totalEntries; ++i) {
        if (pos + kCentralHeaderSize > end || ReadU32(buffer, pos) != kCentralHeaderSignature) {
            throw ZipError("bad central directory header");
        }
        Entry entry;
        entry.flags = ReadU16(buffer, pos + 8);
        entry.method = ReadU16(buffer, pos + 10);
        entry.crc = ReadU32(buffer, pos + 16);
        entry.compressedSize = ReadU32(buffer, pos + 20);
        entry.uncompressedSize = ReadU32(buffer, pos + 24);
        const uint16_t nameLength = ReadU16(buffer, pos + 28);
        const uint16_t extraLength = ReadU16(buffer, pos + 30);
        const uint16_t commentLength = ReadU16(buffer, pos + 32);
        entry.localHeaderOffset = ReadU32(buffer, pos + 42);

        const size_t next = pos + kCentralHeaderSize + nameLength + extraLength + commentLength;
        if (next > end) {
            throw ZipError("central directory entry out of range");
        }
        entry.name = std::string(buffer.substr(pos + kCentralHeaderSize, nameLength));

        if (entry.flags & kFlagEncrypted) {
            throw ZipError("encrypted member: " + entry.name);
        }
        if (entry.method != kMethodStored && entry.method != kMethodDeflated) {
            throw ZipError("unsupported compression method " + std::to_string(entry.method) + ": " + entry.name);
        }
        if (entry.compressedSize == 0xFFFFFFFF || entry.uncompressedSize == 0xFFFFFFFF ||
            entry.localHeaderOffset == 0xFFFFFFFF) {
            throw ZipError("zip64 member: " + entry.name);
        }
        if (static_cast<uint64_t>(entry.localHeaderOffset) + kLocalHeaderSize > centralDirOffset) {
            throw ZipError("local header out of range: " + entry.name);
        }

        archive.m_entries.push_back(std::move(entry));
        pos = next;
    }

    return archive;
}

bool ZipArchive::IsArchive(std::string_view buffer) {
    try {
        Open(buffer);
        return true;
    } catch (const ZipError&) {
        return false;
    }
}

std::string ZipArchive::read(const Entry& entry) const {
    const size_t header = entry.localHeaderOffset;
    if (header + kLocalHeaderSize > m_data.size() || ReadU32(m_data, header) != kLocalHeaderSignature) {
        throw ZipError("bad local header: " + entry.name);
    }
    const size_t dataStart = header + kLocalHeaderSize + ReadU16(m_data, header + 26) + ReadU16(m_data, header + 28);
    if (dataStart + entry.compressedSize > m_data.size()) {
        throw ZipError("truncated member: " + entry.name);
    }
    std::string_view compressed = m_data.substr(dataStart, entry.compressedSize);

    std::string content;
    if (entry.method == kMethodStored) {
        if (entry.compressedSize != entry.uncompressedSize) {
            throw ZipError("stored member size mismatch: " + entry.name);
        }
        content = std::string(compressed);
    } else {
        content = Inflate(compressed, entry.uncompressedSize);
    }

    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(content.data()), static_cast<uInt>(content.size()));
    if (static_cast<uint32_t>(crc) != entry.crc) {
        throw ZipError("crc mismatch: " + entry.name);
    }
    return content;
}

size_t ZipArchive::extractTo(const fs::path& root,
                             const std::function<void(const std::string&)>& onSkipped) const {
    size_t written = 0;
    for (const auto& entry : m_entries) {
        fs::path relative = fs::path(entry.name).lexically_normal();
        if (!IsSafeMemberPath(relative)) {
            if (onSkipped) onSkipped(entry.name);
            continue;
        }

        fs::path target = root / relative;
        if (entry.isDirectory()) {
            fs::create_directories(target);
            continue;
        }

        std::string content = read(entry);
        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path());
        }
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ZipError("cannot write member: " + target.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out) {
            throw ZipError("write failed for member: " + target.string());
        }
        ++written;
    }
    return written;
}

} // namespace solverify::infrastructure
