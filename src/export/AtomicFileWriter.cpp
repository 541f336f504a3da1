/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of write-then-rename output
 */

#include "AtomicFileWriter.hpp"
#include "../core/Logger.hpp"
#include "ShadeErrors.hpp"
#include <filesystem>
#include <fstream>

namespace shade {

void AtomicFileWriter::write(const std::string& path, const std::string& content) {
    Logger logger("AtomicFileWriter");
    const std::string temp_path = path + ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw SerializationError("cannot create " + temp_path);
        }
        file << content;
        file.flush();
        if (!file.good()) {
            file.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw SerializationError("failed while writing " + temp_path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        throw SerializationError("cannot move " + temp_path + " to " + path + ": " + ec.message());
    }

    logger.debug("Wrote " + std::to_string(content.size()) + " bytes to " + path);
}

} // namespace shade
