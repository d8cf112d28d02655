#pragma once
/**
 * @file config.h
 * @brief Configuration loading and management
 */

#include "obbcollide/bvh/builder.h"
#include "obbcollide/geometry/overlap.h"

#include <string>

namespace obbcollide::config {

/**
 * @brief Collision configuration loaded from XML
 *
 * @code{.xml}
 * <collision_config>
 *   <build>
 *     <fit_mode>principal</fit_mode>
 *     <split_epsilon>1e-6</split_epsilon>
 *   </build>
 *   <collision>
 *     <tolerance>1e-6</tolerance>
 *   </collision>
 *   <logging>
 *     <level>warn</level>
 *   </logging>
 * </collision_config>
 * @endcode
 */
struct CollisionConfig {
    // Tree construction
    geometry::FitMode fit_mode{geometry::FitMode::Principal};
    Real split_epsilon{bvh::SPLIT_EPSILON};

    // Queries
    Real tolerance{geometry::OVERLAP_EPSILON};

    // Logging
    std::string log_level{"warn"};

    /**
     * @brief Load configuration from XML file
     * @throws std::runtime_error on parse failure or a missing root element
     */
    static CollisionConfig load(const std::string& path);

    /**
     * @brief Parse configuration from an XML string
     * @throws std::runtime_error on parse failure or a missing root element
     */
    static CollisionConfig parse(const std::string& xml);

    /**
     * @brief Create default configuration
     */
    static CollisionConfig defaults();

    /**
     * @brief Save configuration to XML file
     */
    bool save(const std::string& path) const;

    /**
     * @brief Builder settings carried by this configuration
     */
    bvh::BuildOptions build_options() const;

    /**
     * @brief Push log_level to the library logger
     * @return false if log_level is not a known level name
     */
    bool apply_logging() const;
};

const char* to_string(geometry::FitMode mode);

} // namespace obbcollide::config
