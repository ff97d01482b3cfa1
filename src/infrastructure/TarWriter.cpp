#include "infrastructure/TarWriter.hpp"

#include <cstdio>
#include <cstring>
#include <ctime>
#include <stdexcept>

namespace docgen::infrastructure {

namespace {

constexpr std::size_t kBlockSize = 512;
constexpr std::size_t kMaxNameLength = 99;

std::string BuildHeader(const std::string& name, std::size_t size, std::time_t mtime) {
    char header[kBlockSize];
    std::memset(header, 0, sizeof(header));

    std::memcpy(header, name.data(), name.size());
    std::snprintf(header + 100, 8, "%07o", 0644u);
    std::snprintf(header + 108, 8, "%07o", 0u);
    std::snprintf(header + 116, 8, "%07o", 0u);
    std::snprintf(header + 124, 12, "%011llo", static_cast<unsigned long long>(size));
    std::snprintf(header + 136, 12, "%011llo", static_cast<unsigned long long>(mtime));
    header[156] = '0';
    std::memcpy(header + 257, "ustar", 6);
    std::memcpy(header + 263, "00", 2);
    std::strncpy(header + 265, "docgen", 31);
    std::strncpy(header + 297, "docgen", 31);

    // Checksum is computed with its own field filled with spaces.
    std::memset(header + 148, ' ', 8);
    unsigned int sum = 0;
    for (unsigned char byte : header) {
        sum += byte;
    }
    std::snprintf(header + 148, 8, "%06o", sum);
    header[155] = ' ';

    return std::string(header, sizeof(header));
}

} // namespace

void TarWriter::addFile(const std::string& name, const std::string& data) {
    if (name.empty() || name.size() > kMaxNameLength) {
        throw std::invalid_argument("tar entry name must be 1-99 bytes: '" + name + "'");
    }
    for (const auto& entry : m_entries) {
        if (entry.first == name) {
            throw std::invalid_argument("duplicate tar entry name: '" + name + "'");
        }
    }
    m_entries.emplace_back(name, data);
}

std::string TarWriter::finish() const {
    std::string out;
    std::time_t now = std::time(nullptr);
    for (const auto& [name, data] : m_entries) {
        out += BuildHeader(name, data.size(), now);
        out += data;
        std::size_t remainder = data.size() % kBlockSize;
        if (remainder != 0) {
            out.append(kBlockSize - remainder, '\0');
        }
    }
    out.append(2 * kBlockSize, '\0');
    return out;
}

} // namespace docgen::infrastructure
