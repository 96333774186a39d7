#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief File helpers shared by the loader, ELA output and HTTP layer
 */
class FileUtils
{
public:
    /**
     * @brief Lowercase extension without the dot ("INVOICE.PDF" -> "pdf")
     * @return Empty string when the name has no extension
     */
    static std::string getFileExtension(const std::string &file_path);

    /**
     * @brief Read a whole file into memory
     * @throws std::runtime_error if the file cannot be opened or read
     */
    static std::vector<uint8_t> readFileBytes(const std::string &file_path);

    /**
     * @brief Create a directory (and parents) if missing
     * @throws std::runtime_error if the directory cannot be created
     */
    static void ensureDirectory(const std::string &dir_path);

    /**
     * @brief Filesystem-safe UTC timestamp with microseconds, e.g. "20240102_101500_123456"
     */
    static std::string utcTimestampCompact();

    /**
     * @brief Hex string of cryptographically random bytes
     * @param num_bytes Number of random bytes (output is twice as long)
     * @throws std::runtime_error if the random source fails
     */
    static std::string randomHex(size_t num_bytes);

    /**
     * @brief Collision-resistant artifact name: "<prefix>_<timestamp>_<random>.<extension>"
     */
    static std::string uniqueArtifactName(const std::string &prefix, const std::string &extension);
};
