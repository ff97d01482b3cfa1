/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

#include "domain/Errors.hpp"

namespace docgen::infrastructure {

namespace {

constexpr long long kMaxUpstreamRetries = 10;
constexpr long long kMaxPort = 65535;
constexpr long long kMaxBackoffMs = 60 * 1000;
constexpr long long kMaxSeconds = 7 * 24 * 60 * 60;

void CheckRange(const std::string& name, long long value, long long minValue, long long maxValue) {
    if (value < minValue) {
        throw domain::ConfigError(name + " must be >= " + std::to_string(minValue));
    }
    if (value > maxValue) {
        throw domain::ConfigError(name + " must be <= " + std::to_string(maxValue));
    }
}

long long ParseInteger(const std::string& name, const std::string& value, long long minValue,
                       long long maxValue = std::numeric_limits<long long>::max()) {
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw domain::ConfigError(name + " must be an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw domain::ConfigError(name + " must be an integer, got '" + value + "'");
    }
    CheckRange(name, parsed, minValue, maxValue);
    return parsed;
}

long long JsonInteger(const nlohmann::json& j, const char* key, long long minValue,
                      long long maxValue = std::numeric_limits<long long>::max()) {
    const auto& value = j.at(key);
    if (value.is_string()) {
        return ParseInteger(key, value.get<std::string>(), minValue, maxValue);
    }
    if (value.is_number_unsigned() && value.get<unsigned long long>() >
                                          static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        throw domain::ConfigError(std::string(key) + " must be <= " + std::to_string(maxValue));
    }
    if (!value.is_number_integer()) {
        throw domain::ConfigError(std::string(key) + " must be an integer");
    }
    long long parsed = value.get<long long>();
    CheckRange(key, parsed, minValue, maxValue);
    return parsed;
}

std::string JsonString(const nlohmann::json& j, const char* key) {
    const auto& value = j.at(key);
    if (!value.is_string()) {
        throw domain::ConfigError(std::string(key) + " must be a string");
    }
    return value.get<std::string>();
}

} // namespace

ConfigLoader::EnvLookup ConfigLoader::ProcessEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value && *value) {
            return std::string(value);
        }
        return std::nullopt;
    };
}

void ConfigLoader::ApplyFile(ServiceConfig& config, const std::filesystem::path& settingsFile) {
    std::ifstream f(settingsFile);
    if (!f.is_open()) {
        throw domain::ConfigError("cannot open settings file " + settingsFile.string());
    }

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::exception& e) {
        throw domain::ConfigError("invalid settings file " + settingsFile.string() + ": " + e.what());
    }
    if (!j.is_object()) {
        throw domain::ConfigError("settings file " + settingsFile.string() + " must hold a JSON object");
    }

    if (j.contains("api_key")) config.apiKey = JsonString(j, "api_key");
    if (j.contains("api_url")) config.apiUrl = JsonString(j, "api_url");
    if (j.contains("http_referer")) config.referer = JsonString(j, "http_referer");
    if (j.contains("x_title")) config.title = JsonString(j, "x_title");
    if (j.contains("model")) config.defaultModel = JsonString(j, "model");
    if (j.contains("upstream_timeout_seconds")) {
        config.upstreamTimeout = std::chrono::seconds(JsonInteger(j, "upstream_timeout_seconds", 1, kMaxSeconds));
    }
    if (j.contains("upstream_retries")) {
        config.upstreamRetries = static_cast<int>(JsonInteger(j, "upstream_retries", 0, kMaxUpstreamRetries));
    }
    if (j.contains("upstream_backoff_ms")) {
        config.upstreamBackoff = std::chrono::milliseconds(JsonInteger(j, "upstream_backoff_ms", 0, kMaxBackoffMs));
    }
    if (j.contains("artifact_dir")) config.artifactDir = JsonString(j, "artifact_dir");
    if (j.contains("artifact_ttl_seconds")) {
        config.artifactTtl = std::chrono::seconds(JsonInteger(j, "artifact_ttl_seconds", 1, kMaxSeconds));
    }
    if (j.contains("janitor_interval_seconds")) {
        config.janitorInterval = std::chrono::seconds(JsonInteger(j, "janitor_interval_seconds", 1, kMaxSeconds));
    }
    if (j.contains("host")) config.host = JsonString(j, "host");
    if (j.contains("port")) config.port = static_cast<int>(JsonInteger(j, "port", 0, kMaxPort));
    if (j.contains("route_prefix")) config.routePrefix = JsonString(j, "route_prefix");

    std::cout << "[ConfigLoader] Loaded settings from " << settingsFile << std::endl;
}

void ConfigLoader::ApplyEnvironment(ServiceConfig& config, const EnvLookup& env) {
    if (auto v = env("OPENROUTER_API_KEY")) config.apiKey = *v;
    if (auto v = env("OPENROUTER_API_URL")) config.apiUrl = *v;
    if (auto v = env("HTTP_REFERER")) config.referer = *v;
    if (auto v = env("X_TITLE")) config.title = *v;
    if (auto v = env("DOCGEN_MODEL")) config.defaultModel = *v;
    if (auto v = env("DOCGEN_UPSTREAM_TIMEOUT_SECONDS")) {
        config.upstreamTimeout = std::chrono::seconds(ParseInteger("DOCGEN_UPSTREAM_TIMEOUT_SECONDS", *v, 1, kMaxSeconds));
    }
    if (auto v = env("DOCGEN_UPSTREAM_RETRIES")) {
        config.upstreamRetries = static_cast<int>(ParseInteger("DOCGEN_UPSTREAM_RETRIES", *v, 0, kMaxUpstreamRetries));
    }
    if (auto v = env("DOCGEN_UPSTREAM_BACKOFF_MS")) {
        config.upstreamBackoff = std::chrono::milliseconds(ParseInteger("DOCGEN_UPSTREAM_BACKOFF_MS", *v, 0, kMaxBackoffMs));
    }
    if (auto v = env("DOCGEN_ARTIFACT_DIR")) config.artifactDir = *v;
    if (auto v = env("DOCGEN_ARTIFACT_TTL_SECONDS")) {
        config.artifactTtl = std::chrono::seconds(ParseInteger("DOCGEN_ARTIFACT_TTL_SECONDS", *v, 1, kMaxSeconds));
    }
    if (auto v = env("DOCGEN_JANITOR_INTERVAL_SECONDS")) {
        config.janitorInterval = std::chrono::seconds(ParseInteger("DOCGEN_JANITOR_INTERVAL_SECONDS", *v, 1, kMaxSeconds));
    }
    if (auto v = env("DOCGEN_HOST")) config.host = *v;
    if (auto v = env("DOCGEN_PORT")) config.port = static_cast<int>(ParseInteger("DOCGEN_PORT", *v, 0, kMaxPort));
    if (auto v = env("DOCGEN_ROUTE_PREFIX")) config.routePrefix = *v;
}

ServiceConfig ConfigLoader::Load(const std::optional<std::filesystem::path>& settingsFile, const EnvLookup& env) {
    ServiceConfig config;
    if (settingsFile) {
        ApplyFile(config, *settingsFile);
    }
    ApplyEnvironment(config, env);

    if (config.apiKey.empty()) {
        throw domain::ConfigError("OPENROUTER_API_KEY environment variable not set");
    }
    return config;
}

} // namespace docgen::infrastructure
