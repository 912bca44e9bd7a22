/**
 * @file ZipArchive.hpp
 * @brief Read-only zip container reader backed by zlib.
 *
 * Supports stored and deflated members. Encrypted members, Zip64 and
 * multi-disk archives are rejected at open time.
 */

#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace solverify::infrastructure {

/**
 * @class ZipError
 * @brief The buffer is not a zip archive this reader can handle.
 */
class ZipError : public std::runtime_error {
public:
    explicit ZipError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class ZipArchive
 * @brief View over an in-memory zip archive.
 *
 * The archive does not copy the buffer; the buffer must outlive it.
 */
class ZipArchive {
public:
    struct Entry {
        std::string name;
        uint16_t flags = 0;
        uint16_t method = 0;
        uint32_t crc = 0;
        uint32_t compressedSize = 0;
        uint32_t uncompressedSize = 0;
        uint32_t localHeaderOffset = 0;

        bool isDirectory() const { return !name.empty() && name.back() == '/'; }
    };

    /**
     * @brief Reads the central directory of a buffer.
     * @throws ZipError if the buffer cannot be listed as a zip archive.
     */
    static ZipArchive Open(std::string_view buffer);

    /** @brief True when Open() would succeed. */
    static bool IsArchive(std::string_view buffer);

    const std::vector<Entry>& getEntries() const { return m_entries; }

    /**
     * @brief Decompresses one member and checks its CRC.
     * @throws ZipError on truncated or corrupt data.
     */
    std::string read(const Entry& entry) const;

    /**
     * @brief Writes every member below root, recreating the member's relative path.
     * @param root Existing destination directory.
     * @param onSkipped Called with the name of members whose path would escape root.
     * @return Number of files written.
     * @throws ZipError on corrupt member data.
     */
    size_t extractTo(const std::filesystem::path& root,
                     const std::function<void(const std::string&)>& onSkipped = nullptr) const;

private:
    explicit ZipArchive(std::string_view data) : m_data(data) {}

    std::string_view m_data;
    std::vector<Entry> m_entries;
};

} // namespace solverify::infrastructure
