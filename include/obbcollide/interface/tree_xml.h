#pragma once
/**
 * @file tree_xml.h
 * @brief Lossless XML encoding of OBB trees, bodies and face lists
 *
 * Tree layout:
 * @code{.xml}
 * <obb_tree version="1">
 *   <node>
 *     <obb a="..." b="..." c="...">
 *       <frame px="..." py="..." pz="..." qw="..." qx="..." qy="..." qz="..."/>
 *     </obb>
 *     <leaf>
 *       <face>
 *         <p x="..." y="..." z="..."/><q .../><r .../>
 *       </face>
 *     </leaf>
 *     <node>...</node>
 *   </node>
 * </obb_tree>
 * @endcode
 *
 * Reals are written with 17 significant digits, so decoding an encoded
 * tree reproduces every field bit for bit.
 */

#include "obbcollide/bvh/builder.h"
#include "obbcollide/collision/body.h"

#include <string>
#include <vector>

namespace obbcollide::io {

/**
 * @brief Encode a tree as an <obb_tree> document
 */
std::string tree_to_string(const bvh::ObbTree& tree);

/**
 * @brief Decode an <obb_tree> document
 * @throws std::runtime_error on parse failure or malformed structure
 */
bvh::ObbTree tree_from_string(const std::string& xml);

bool save_tree(const bvh::ObbTree& tree, const std::string& path);

/**
 * @throws std::runtime_error on read/parse failure or malformed structure
 */
bvh::ObbTree load_tree(const std::string& path);

/**
 * @brief Encode a body as <body> with its frame and tree
 */
std::string body_to_string(const collision::Body& body);

/**
 * @throws std::runtime_error on parse failure or malformed structure
 */
collision::Body body_from_string(const std::string& xml);

bool save_body(const collision::Body& body, const std::string& path);

/**
 * @throws std::runtime_error on read/parse failure or malformed structure
 */
collision::Body load_body(const std::string& path);

/**
 * @brief Read a <mesh> document of <face> elements
 * @throws std::runtime_error on read/parse failure or malformed faces
 */
std::vector<geometry::Face> load_faces(const std::string& path);

/**
 * @throws std::runtime_error on parse failure or malformed faces
 */
std::vector<geometry::Face> faces_from_string(const std::string& xml);

} // namespace obbcollide::io
