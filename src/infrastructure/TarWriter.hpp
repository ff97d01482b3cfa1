/**
 * @file TarWriter.hpp
 * @brief In-memory USTAR archive builder.
 */

#pragma once
#include <string>
#include <utility>
#include <vector>

namespace docgen::infrastructure {

class TarWriter {
public:
    /** @brief Queues a regular file. Throws std::invalid_argument for an empty, duplicate or over-99-byte name. */
    void addFile(const std::string& name, const std::string& data);

    /** @brief Serialized archive, terminated by two zero blocks. */
    std::string finish() const;

    std::size_t fileCount() const { return m_entries.size(); }

private:
    std::vector<std::pair<std::string, std::string>> m_entries;
};

} // namespace docgen::infrastructure
