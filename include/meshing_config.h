/**
 * @file meshing_config.h
 * @brief YAML configuration for the meshing pipeline and logging
 *
 * Example file (every key optional, defaults shown):
 * @code
 * meshing:
 *   meshes_per_tick: 16   # frame budget, > 0
 *   worker_threads: 0     # 0 = hardware_concurrency - 1
 *   unit_scale: 1.0       # world units per voxel, > 0
 *   texel_scale: 1.0      # UV units per voxel, > 0
 * logging:
 *   level: info           # debug | info | warning | error
 *   colors: true
 * @endcode
 *
 * A failed load logs the reason and leaves the previous values untouched.
 */

#pragma once

#include <cstddef>
#include <string>
#include <yaml-cpp/yaml.h>   // for YAML::Node
#include "chunk_mesh_scheduler.h"
#include "greedy_mesher.h"
#include "logger.h"

class MeshingConfig {
public:
    MeshingConfig() = default;

    /**
     * @brief Loads settings from a YAML file
     * @return False if the file can't be read or holds invalid values
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Loads settings from YAML text
     * @return False on a syntax error or invalid values
     */
    bool loadFromString(const std::string& text);

    /**
     * @brief Pushes the logging settings into Logger
     */
    void apply() const;

    SchedulerSettings schedulerSettings() const;
    MeshingParams meshingParams() const;

    int meshesPerTick() const { return m_meshesPerTick; }
    size_t workerThreads() const { return m_workerThreads; }
    float unitScale() const { return m_unitScale; }
    float texelScale() const { return m_texelScale; }
    LogLevel logLevel() const { return m_logLevel; }
    bool logColors() const { return m_logColors; }

private:
    bool loadFromNode(const YAML::Node& root, const std::string& source);

    int m_meshesPerTick = 16;
    size_t m_workerThreads = 0;
    float m_unitScale = 1.0f;
    float m_texelScale = 1.0f;
    LogLevel m_logLevel = LogLevel::INFO;
    bool m_logColors = true;
};
