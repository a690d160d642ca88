// File: common/io/io.hpp

#ifndef IO_HPP
#define IO_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "common/logging/logger.hpp"

namespace common::io {

    /**
     * @brief Creates a directory and all necessary parent directories.
     *
     * @param dir_path Path to the directory. Existing directories are left alone.
     * @throws std::runtime_error if the directory could not be created.
     */
    inline void createDirectory(const std::string &dir_path) {
        if (dir_path.empty() || std::filesystem::is_directory(dir_path)) {
            return;
        }

        LOG_DEBUG("Creating directory: {}", dir_path);
        try {
            if (!std::filesystem::create_directories(dir_path)) {
                LOG_ERROR("Could not create directory: {}", dir_path);
                throw std::runtime_error(fmt::format("Could not create directory: {}", dir_path));
            }
        } catch (const std::filesystem::filesystem_error &e) {
            LOG_ERROR("Filesystem error: {}", e.what());
            throw std::runtime_error(fmt::format("Could not create directory: {}", dir_path));
        }
    }

    /**
     * @brief Reads a whole file as raw bytes.
     *
     * @param file_path Path to the file.
     * @return std::vector<std::uint8_t> File contents.
     * @throws std::runtime_error if the file could not be opened or read.
     */
    inline std::vector<std::uint8_t> readBytes(std::string_view file_path) {
        std::ifstream file(std::filesystem::path(file_path), std::ios::binary);
        if (!file) {
            LOG_ERROR("Could not open file: {}", file_path);
            throw std::runtime_error(fmt::format("Could not open file: {}", file_path));
        }

        std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
            LOG_ERROR("Could not read file: {}", file_path);
            throw std::runtime_error(fmt::format("Could not read file: {}", file_path));
        }

        LOG_TRACE("Read {} bytes from {}", bytes.size(), file_path);
        return bytes;
    }

    /**
     * @brief Writes raw bytes to a file, replacing it.
     *
     * @param file_path Path to the file.
     * @param bytes Data to write.
     * @param create_directories Whether to create missing parent directories.
     * @throws std::runtime_error if the file could not be written.
     */
    inline void writeBytes(std::string_view file_path, const std::vector<std::uint8_t> &bytes,
                           const bool create_directories = true) {
        const std::filesystem::path path(file_path);
        if (create_directories) {
            createDirectory(path.parent_path().string());
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!file) {
            LOG_ERROR("Could not write file: {}", file_path);
            throw std::runtime_error(fmt::format("Could not write file: {}", file_path));
        }
        LOG_TRACE("Wrote {} bytes to {}", bytes.size(), file_path);
    }

} // namespace common::io

#endif // IO_HPP
