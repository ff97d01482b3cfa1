/**
 * @file ConfigLoader.hpp
 * @brief Loads service configuration from defaults, an optional JSON file and the environment.
 *
 * Precedence is defaults < settings file < environment variables.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace docgen::infrastructure {

/**
 * @struct ServiceConfig
 * @brief Everything the composition root needs to wire the service.
 */
struct ServiceConfig {
    // Upstream
    std::string apiKey;
    std::string apiUrl = "https://openrouter.ai/api/v1/chat/completions";
    std::string referer;
    std::string title;
    std::string defaultModel = "openrouter/auto";
    std::chrono::seconds upstreamTimeout{30};
    int upstreamRetries = 1;
    std::chrono::milliseconds upstreamBackoff{2000};

    // Artifacts
    std::filesystem::path artifactDir = "/tmp/docgen";
    std::chrono::seconds artifactTtl{15 * 60};
    std::chrono::seconds janitorInterval{5 * 60};

    // HTTP
    std::string host = "0.0.0.0";
    int port = 8080;
    std::string routePrefix = "/v1/docgen";
};

class ConfigLoader {
public:
    /** @brief Returns the value of an environment variable, or nullopt when unset or empty. */
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /** @brief EnvLookup backed by the process environment. */
    static EnvLookup ProcessEnvironment();

    /**
     * @brief Builds the configuration and validates it.
     * @param settingsFile Optional JSON settings file (keys such as "api_key", "artifact_dir", "port").
     * @throws domain::ConfigError when the credential is missing or a value is malformed.
     */
    static ServiceConfig Load(const std::optional<std::filesystem::path>& settingsFile,
                              const EnvLookup& env = ProcessEnvironment());

    /** @brief Overlays values from a JSON settings file. */
    static void ApplyFile(ServiceConfig& config, const std::filesystem::path& settingsFile);

    /** @brief Overlays values from environment variables. */
    static void ApplyEnvironment(ServiceConfig& config, const EnvLookup& env);
};

} // namespace docgen::infrastructure
