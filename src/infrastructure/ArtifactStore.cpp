/**
 * @file ArtifactStore.cpp
 * @brief Implementation of ArtifactStore.
 */

#include "infrastructure/ArtifactStore.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "domain/Errors.hpp"
#include "infrastructure/IdGenerator.hpp"

namespace docgen::infrastructure {

namespace fs = std::filesystem;

namespace {

bool IsPlainComponent(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

} // namespace

ArtifactStore::ArtifactStore(fs::path basePath, std::chrono::milliseconds ttl)
    : m_basePath(std::move(basePath)), m_ttl(ttl) {
    fs::create_directories(m_basePath);
}

ArtifactStore::~ArtifactStore() {
    stopJanitor();
}

Artifact ArtifactStore::createNew() {
    Artifact artifact;
    artifact.id = IdGenerator::NewUuid();
    artifact.path = m_basePath / artifact.id;

    std::error_code ec;
    if (!fs::create_directory(artifact.path, ec)) {
        if (!ec) {
            ec = std::make_error_code(std::errc::file_exists);
        }
        throw fs::filesystem_error("failed to create artifact directory", artifact.path, ec);
    }
    return artifact;
}

fs::path ArtifactStore::writeFile(const Artifact& artifact, const std::string& filename, const std::string& data) {
    if (!IsPlainComponent(filename)) {
        throw std::invalid_argument("invalid artifact filename: " + filename);
    }

    fs::path target = artifact.path / filename;
    std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        throw fs::filesystem_error("failed to open artifact file", target,
                                   std::make_error_code(std::errc::io_error));
    }
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (ofs.fail()) {
        throw fs::filesystem_error("failed to write artifact file", target,
                                   std::make_error_code(std::errc::io_error));
    }
    return target;
}

fs::path ArtifactStore::getArtifactPath(const std::string& id, const std::string& filename) const {
    if (!IsPlainComponent(id) || !IsPlainComponent(filename)) {
        throw domain::ArtifactNotFound(id, filename);
    }
    fs::path path = m_basePath / id / filename;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw domain::ArtifactNotFound(id, filename);
    }
    return path;
}

bool ArtifactStore::remove(const Artifact& artifact) {
    std::error_code ec;
    auto removed = fs::remove_all(artifact.path, ec);
    if (ec) {
        std::cerr << "[ArtifactStore] Failed to remove " << artifact.path << ": " << ec.message() << std::endl;
        return false;
    }
    return removed > 0;
}

int ArtifactStore::sweep() {
    std::cout << "[ArtifactStore] Running artifact cleanup janitor..." << std::endl;

    std::error_code ec;
    fs::directory_iterator it(m_basePath, ec);
    if (ec) {
        std::cerr << "[ArtifactStore] Failed to read artifact directory: " << ec.message() << std::endl;
        return 0;
    }

    int removedCount = 0;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            std::cerr << "[ArtifactStore] Directory listing interrupted: " << ec.message() << std::endl;
            break;
        }
        const fs::directory_entry& entry = *it;
        std::error_code entryEc;
        bool isDirectory = entry.is_directory(entryEc);
        if (entryEc) {
            // Entries removed since the listing was read need no report.
            if (entryEc != std::errc::no_such_file_or_directory) {
                std::cerr << "[ArtifactStore] Skipping " << entry.path() << ": " << entryEc.message() << std::endl;
            }
            continue;
        }
        if (!isDirectory) {
            continue;
        }

        auto modified = fs::last_write_time(entry.path(), entryEc);
        if (entryEc) {
            std::cerr << "[ArtifactStore] Failed to stat " << entry.path() << ": " << entryEc.message() << std::endl;
            continue;
        }

        auto age = fs::file_time_type::clock::now() - modified;
        if (age <= m_ttl) {
            continue;
        }

        std::cout << "[ArtifactStore] Deleting expired artifact directory " << entry.path() << std::endl;
        fs::remove_all(entry.path(), entryEc);
        if (entryEc) {
            std::cerr << "[ArtifactStore] Failed to delete " << entry.path() << ": " << entryEc.message() << std::endl;
            continue;
        }
        ++removedCount;
    }
    return removedCount;
}

void ArtifactStore::startJanitor(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) return;
    m_running = true;
    m_janitor = std::thread(&ArtifactStore::janitorLoop, this, interval);
    std::cout << "[ArtifactStore] Janitor started (interval " << interval.count() << "ms, ttl "
              << m_ttl.count() << "ms) at " << m_basePath << std::endl;
}

void ArtifactStore::stopJanitor() {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_janitor.joinable()) {
        m_janitor.join();
    }
}

bool ArtifactStore::isJanitorRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

void ArtifactStore::janitorLoop(std::chrono::milliseconds interval) {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_cv.wait_for(lock, interval, [this] { return !m_running; })) {
                return;
            }
        }

        // Lock is released while sweeping.
        try {
            sweep();
        } catch (const std::exception& e) {
            std::cerr << "[ArtifactStore] Janitor sweep failed: " << e.what() << std::endl;
        }
    }
}

} // namespace docgen::infrastructure
