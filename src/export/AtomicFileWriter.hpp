/**
 * @file AtomicFileWriter.hpp
 * @brief Write-then-rename file output
 */

#pragma once

#include <string>

namespace shade {

/**
 * @brief Replaces a file only once its new content is completely written
 *
 * Content goes to "<path>.tmp", which is then renamed over the target, so
 * readers never observe a partially written file.
 */
class AtomicFileWriter {
public:
    /**
     * @throws SerializationError if the temporary file cannot be written or renamed
     */
    static void write(const std::string& path, const std::string& content);
};

} // namespace shade
