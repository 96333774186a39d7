#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    const std::string filename = fs::path(file_path).filename().string();
    const size_t dot_pos = filename.find_last_of('.');
    if (dot_pos == std::string::npos || dot_pos + 1 >= filename.size())
    {
        return "";
    }

    std::string ext = filename.substr(dot_pos + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::vector<uint8_t> FileUtils::readFileBytes(const std::string &file_path)
{
    std::ifstream file(file_path, std::ios::binary | std::ios::ate);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open file: " + file_path);
    }

    const std::streamsize size = file.tellg();
    if (size < 0)
    {
        throw std::runtime_error("Could not determine file size: " + file_path);
    }

    std::vector<uint8_t> data(static_cast<size_t>(size));
    file.seekg(0, std::ios::beg);
    if (size > 0 && !file.read(reinterpret_cast<char *>(data.data()), size))
    {
        throw std::runtime_error("Could not read file: " + file_path);
    }

    Logger::debug("Read " + std::to_string(data.size()) + " bytes from " + file_path);
    return data;
}

void FileUtils::ensureDirectory(const std::string &dir_path)
{
    std::error_code ec;
    fs::create_directories(dir_path, ec);
    if (ec || !fs::is_directory(dir_path))
    {
        throw std::runtime_error("Failed to create directory: " + dir_path +
                                 (ec ? " (" + ec.message() + ")" : ""));
    }
}

std::string FileUtils::utcTimestampCompact()
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_time_t = std::chrono::system_clock::to_time_t(now);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                            now.time_since_epoch()) %
                        1000000;

    std::tm utc{};
    gmtime_r(&now_time_t, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y%m%d_%H%M%S")
       << '_' << std::setfill('0') << std::setw(6) << micros.count();
    return ss.str();
}

std::string FileUtils::randomHex(size_t num_bytes)
{
    std::vector<unsigned char> buffer(num_bytes);
    if (num_bytes > 0 && RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1)
    {
        throw std::runtime_error("RAND_bytes failed to produce random data");
    }

    std::stringstream ss;
    for (unsigned char byte : buffer)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    return ss.str();
}

std::string FileUtils::uniqueArtifactName(const std::string &prefix, const std::string &extension)
{
    return prefix + "_" + utcTimestampCompact() + "_" + randomHex(4) + "." + extension;
}
