// =================================================================
// src/Rewind/FileIO.cpp
// =================================================================
// Implementation for whole-file reads and atomic writes.

#include "Rewind/FileIO.hpp"
#include "Rewind/Logger.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace Rewind {

namespace {

const std::string TEMP_INFIX = ".tmp.";

std::string temporaryPathFor(const std::string& file_path) {
    static std::atomic<unsigned long> counter{0};
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::ostringstream oss;
    oss << file_path << TEMP_INFIX << now << "_" << counter.fetch_add(1);
    return oss.str();
}

} // anonymous namespace

std::optional<std::string> FileIO::readFile(const std::string& file_path) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    if (file_stream.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

bool FileIO::writeFileAtomic(const std::string& file_path, const std::string& content) {
    std::string temp_path = temporaryPathFor(file_path);
    
    {
        std::ofstream file_stream(temp_path, std::ios::binary | std::ios::trunc);
        if (!file_stream) {
            LOG_ERROR("FileIO", "Failed to open temporary file: " + temp_path);
            return false;
        }
        file_stream << content;
        file_stream.flush();
        if (!file_stream.good()) {
            LOG_ERROR("FileIO", "Failed to write temporary file: " + temp_path);
            file_stream.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return false;
        }
    }
    
    std::error_code ec;
    std::filesystem::rename(temp_path, file_path, ec);
    if (ec) {
        LOG_ERROR("FileIO", "Failed to rename " + temp_path + " to " + file_path + ": " + ec.message());
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return false;
    }
    return true;
}

bool FileIO::fileExists(const std::string& file_path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(file_path, ec);
}

bool FileIO::createDirectories(const std::string& dir_path) {
    std::error_code ec;
    std::filesystem::create_directories(dir_path, ec);
    if (ec) {
        LOG_ERROR("FileIO", "Failed to create directory " + dir_path + ": " + ec.message());
        return false;
    }
    return std::filesystem::is_directory(dir_path, ec);
}

bool FileIO::removeFile(const std::string& file_path) {
    std::error_code ec;
    std::filesystem::remove(file_path, ec);
    if (ec) {
        LOG_WARNING("FileIO", "Failed to remove " + file_path + ": " + ec.message());
        return false;
    }
    return true;
}

bool FileIO::isTemporaryName(const std::string& file_name) {
    size_t pos = file_name.rfind(TEMP_INFIX);
    return pos != std::string::npos && pos > 0 && pos + TEMP_INFIX.size() < file_name.size();
}

} // namespace Rewind
