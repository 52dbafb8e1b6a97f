/**
 * @file meshing_config.cpp
 * @brief MeshingConfig YAML loading and validation
 */

#include "meshing_config.h"

#include <exception>

bool MeshingConfig::loadFromFile(const std::string& filepath) {
    try {
        YAML::Node root = YAML::LoadFile(filepath);
        return loadFromNode(root, filepath);
    } catch (const YAML::Exception& e) {
        Logger::error() << "YAML parsing error in " << filepath << ": " << e.what();
        return false;
    } catch (const std::exception& e) {
        Logger::error() << "Error loading meshing config from " << filepath << ": " << e.what();
        return false;
    }
}

bool MeshingConfig::loadFromString(const std::string& text) {
    try {
        YAML::Node root = YAML::Load(text);
        return loadFromNode(root, "<string>");
    } catch (const YAML::Exception& e) {
        Logger::error() << "YAML parsing error in meshing config: " << e.what();
        return false;
    }
}

bool MeshingConfig::loadFromNode(const YAML::Node& root, const std::string& source) {
    // Parse into locals first so a bad file changes nothing
    int meshesPerTick = m_meshesPerTick;
    int workerThreads = static_cast<int>(m_workerThreads);
    float unitScale = m_unitScale;
    float texelScale = m_texelScale;
    LogLevel logLevel = m_logLevel;
    bool logColors = m_logColors;

    if (root.IsNull()) {
        Logger::warning() << "Meshing config " << source << " is empty, keeping defaults";
        return true;
    }
    if (!root.IsMap()) {
        Logger::error() << "Meshing config " << source << " must be a mapping";
        return false;
    }

    const YAML::Node meshing = root["meshing"];
    if (meshing) {
        if (meshing["meshes_per_tick"]) {
            meshesPerTick = meshing["meshes_per_tick"].as<int>();
        }
        if (meshing["worker_threads"]) {
            workerThreads = meshing["worker_threads"].as<int>();
        }
        if (meshing["unit_scale"]) {
            unitScale = meshing["unit_scale"].as<float>();
        }
        if (meshing["texel_scale"]) {
            texelScale = meshing["texel_scale"].as<float>();
        }
    }

    const YAML::Node logging = root["logging"];
    if (logging) {
        if (logging["level"]) {
            const std::string levelName = logging["level"].as<std::string>();
            if (!parseLogLevel(levelName, logLevel)) {
                Logger::error() << "Unknown log level '" << levelName << "' in: " << source;
                return false;
            }
        }
        if (logging["colors"]) {
            logColors = logging["colors"].as<bool>();
        }
    }

    // Validate ranges
    if (meshesPerTick <= 0) {
        Logger::error() << "meshes_per_tick must be positive (got " << meshesPerTick << ") in: " << source;
        return false;
    }
    if (workerThreads < 0) {
        Logger::error() << "worker_threads must not be negative (got " << workerThreads << ") in: " << source;
        return false;
    }
    if (!(unitScale > 0.0f)) {
        Logger::error() << "unit_scale must be positive (got " << unitScale << ") in: " << source;
        return false;
    }
    if (!(texelScale > 0.0f)) {
        Logger::error() << "texel_scale must be positive (got " << texelScale << ") in: " << source;
        return false;
    }

    m_meshesPerTick = meshesPerTick;
    m_workerThreads = static_cast<size_t>(workerThreads);
    m_unitScale = unitScale;
    m_texelScale = texelScale;
    m_logLevel = logLevel;
    m_logColors = logColors;

    Logger::debug() << "Loaded meshing config from " << source << " (budget " << m_meshesPerTick
                    << ", workers " << m_workerThreads << ")";
    return true;
}

void MeshingConfig::apply() const {
    Logger::setMinLevel(m_logLevel);
    Logger::setUseColors(m_logColors);
}

SchedulerSettings MeshingConfig::schedulerSettings() const {
    SchedulerSettings settings;
    settings.meshesPerTick = m_meshesPerTick;
    settings.unitScale = m_unitScale;
    settings.texelScale = m_texelScale;
    return settings;
}

MeshingParams MeshingConfig::meshingParams() const {
    MeshingParams params;
    params.unitScale = m_unitScale;
    params.texelScale = m_texelScale;
    return params;
}
