/**
 * @file ArtifactStore.hpp
 * @brief Ephemeral, filesystem-backed store of generated files with a background janitor.
 */

#pragma once
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>

namespace docgen::infrastructure {

/**
 * @struct Artifact
 * @brief One directory of caller-named files under the store base path.
 */
struct Artifact {
    std::string id;
    std::filesystem::path path;
};

/**
 * @class ArtifactStore
 * @brief Creates artifact directories and reclaims them once they outlive the TTL.
 *
 * Layout is basePath/<artifact-id>/<filename>. Age is measured from the
 * directory's last-modification time. Every artifact gets a distinct UUID, so
 * concurrent requests never need to coordinate on the base directory.
 */
class ArtifactStore {
public:
    static constexpr std::chrono::minutes kDefaultTtl{15};

    /** @throws std::filesystem::filesystem_error if the base path cannot be created. */
    explicit ArtifactStore(std::filesystem::path basePath,
                           std::chrono::milliseconds ttl = kDefaultTtl);
    ~ArtifactStore();

    ArtifactStore(const ArtifactStore&) = delete;
    ArtifactStore& operator=(const ArtifactStore&) = delete;

    /** @brief Allocates a fresh id and creates its directory. */
    Artifact createNew();

    /**
     * @brief Writes @p data to basePath/id/filename, replacing any existing file.
     * @return Full path of the written file.
     * @throws std::invalid_argument for filenames that are not a single path component.
     */
    std::filesystem::path writeFile(const Artifact& artifact, const std::string& filename, const std::string& data);

    /** @throws domain::ArtifactNotFound when the file is missing, expired, or the name is not plain. */
    std::filesystem::path getArtifactPath(const std::string& id, const std::string& filename) const;

    /** @brief Deletes an artifact directory. Returns false if nothing was removed. */
    bool remove(const Artifact& artifact);

    /**
     * @brief Single janitor pass over the base directory.
     * @return Number of expired directories removed.
     */
    int sweep();

    /** @brief Starts the janitor thread. Calling it while running is a no-op. Thread-safe against stopJanitor(). */
    void startJanitor(std::chrono::milliseconds interval);

    /** @brief Signals the janitor, wakes it and joins. Safe to call repeatedly. */
    void stopJanitor();

    bool isJanitorRunning() const;

    const std::filesystem::path& basePath() const { return m_basePath; }
    std::chrono::milliseconds ttl() const { return m_ttl; }

private:
    void janitorLoop(std::chrono::milliseconds interval);

    std::filesystem::path m_basePath;
    std::chrono::milliseconds m_ttl;

    // Held across a whole start or stop so a restart never overtakes a pending join.
    std::mutex m_lifecycleMutex;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_janitor;
    bool m_running = false;
};

} // namespace docgen::infrastructure
