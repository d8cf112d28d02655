#pragma once
/**
 * @file obbcollide.h
 * @brief Main include file for obbcollide
 *
 * obbcollide - OBB-tree collision detection for rigid triangulated bodies
 *
 * Include this single header to access all public obbcollide APIs.
 */

#include "obbcollide/core/types.h"
#include "obbcollide/core/frame.h"
#include "obbcollide/core/log.h"

#include "obbcollide/geometry/face.h"
#include "obbcollide/geometry/obb.h"
#include "obbcollide/geometry/overlap.h"

#include "obbcollide/bvh/tree.h"
#include "obbcollide/bvh/traversal.h"
#include "obbcollide/bvh/builder.h"
#include "obbcollide/bvh/inspect.h"

#include "obbcollide/collision/body.h"

#include "obbcollide/interface/config.h"
#include "obbcollide/interface/tree_xml.h"

/**
 * @namespace obbcollide
 * @brief Root namespace for all obbcollide components
 */
namespace obbcollide {

/**
 * @brief Library version information
 */
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/**
 * @brief Get version string
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* GetVersionString() noexcept {
    return "0.1.0";
}

} // namespace obbcollide
