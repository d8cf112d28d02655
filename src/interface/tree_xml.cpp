/**
 * @file tree_xml.cpp
 * @brief XML encoding of trees, bodies and meshes using pugixml
 */

#include "obbcollide/interface/tree_xml.h"
#include "obbcollide/core/log.h"

#include <pugixml.hpp>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace obbcollide::io {

using bvh::ObbTree;
using geometry::Face;
using geometry::OBB;

namespace {

constexpr int FORMAT_VERSION = 1;

// ============================================================================
// Encoding Helpers
// ============================================================================

void set_real(pugi::xml_node node, const char* name, Real value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.17g", value);
    node.append_attribute(name).set_value(buffer);
}

void encode_point(pugi::xml_node parent, const char* name, const Vec3& v) {
    auto node = parent.append_child(name);
    set_real(node, "x", v.x);
    set_real(node, "y", v.y);
    set_real(node, "z", v.z);
}

void encode_frame(pugi::xml_node parent, const Frame& frame) {
    auto node = parent.append_child("frame");
    set_real(node, "px", frame.position.x);
    set_real(node, "py", frame.position.y);
    set_real(node, "pz", frame.position.z);
    set_real(node, "qw", frame.orientation.w);
    set_real(node, "qx", frame.orientation.x);
    set_real(node, "qy", frame.orientation.y);
    set_real(node, "qz", frame.orientation.z);
}

void encode_face(pugi::xml_node parent, const Face& face) {
    auto node = parent.append_child("face");
    encode_point(node, "p", face.p);
    encode_point(node, "q", face.q);
    encode_point(node, "r", face.r);
}

void encode_obb(pugi::xml_node parent, const OBB& box) {
    auto node = parent.append_child("obb");
    set_real(node, "a", box.half_extents.x);
    set_real(node, "b", box.half_extents.y);
    set_real(node, "c", box.half_extents.z);
    encode_frame(node, box.frame);
}

void encode_subtree(pugi::xml_node parent, const ObbTree& tree) {
    if (const auto* leaf = tree.as_leaf()) {
        encode_face(parent.append_child("leaf"), leaf->payload);
        return;
    }
    auto node = parent.append_child("node");
    encode_obb(node, tree.node_payload());
    encode_subtree(node, tree.left());
    encode_subtree(node, tree.right());
}

void encode_tree(pugi::xml_node parent, const ObbTree& tree) {
    auto root = parent.append_child("obb_tree");
    root.append_attribute("version").set_value(FORMAT_VERSION);
    encode_subtree(root, tree);
}

std::string document_to_string(const pugi::xml_document& doc) {
    std::ostringstream out;
    doc.save(out, "  ");
    return out.str();
}

// ============================================================================
// Decoding Helpers
// ============================================================================

[[noreturn]] void malformed(const std::string& what) {
    log::logger()->error("Malformed obbcollide XML: {}", what);
    throw std::runtime_error("Malformed obbcollide XML: " + what);
}

Real require_real(const pugi::xml_node& node, const char* name) {
    pugi::xml_attribute attr = node.attribute(name);
    if (!attr) {
        malformed(std::string("<") + node.name() + "> missing attribute '" + name + "'");
    }
    return attr.as_double();
}

pugi::xml_node require_child(const pugi::xml_node& node, const char* name) {
    pugi::xml_node child = node.child(name);
    if (!child) {
        malformed(std::string("<") + node.name() + "> missing <" + name + ">");
    }
    return child;
}

Vec3 decode_point(const pugi::xml_node& node) {
    return {require_real(node, "x"), require_real(node, "y"), require_real(node, "z")};
}

Frame decode_frame(const pugi::xml_node& node) {
    Vec3 position{require_real(node, "px"), require_real(node, "py"), require_real(node, "pz")};
    Quat orientation{require_real(node, "qw"), require_real(node, "qx"),
                     require_real(node, "qy"), require_real(node, "qz")};
    return {position, orientation};
}

Face decode_face(const pugi::xml_node& node) {
    return {decode_point(require_child(node, "p")),
            decode_point(require_child(node, "q")),
            decode_point(require_child(node, "r"))};
}

OBB decode_obb(const pugi::xml_node& node) {
    Vec3 half_extents{require_real(node, "a"), require_real(node, "b"), require_real(node, "c")};
    return {half_extents, decode_frame(require_child(node, "frame"))};
}

bool is_subtree(const pugi::xml_node& node) {
    return node.type() == pugi::node_element &&
           (std::string(node.name()) == "node" || std::string(node.name()) == "leaf");
}

ObbTree decode_subtree(const pugi::xml_node& element) {
    const std::string name = element.name();
    if (name == "leaf") {
        return ObbTree::leaf(decode_face(require_child(element, "face")));
    }
    if (name != "node") {
        malformed("unexpected element <" + name + ">");
    }

    OBB box = decode_obb(require_child(element, "obb"));

    std::vector<pugi::xml_node> children;
    for (auto child : element.children()) {
        if (is_subtree(child)) {
            children.push_back(child);
        }
    }
    if (children.size() != 2) {
        malformed("<node> must have exactly two children, found " +
                  std::to_string(children.size()));
    }

    ObbTree left = decode_subtree(children[0]);
    ObbTree right = decode_subtree(children[1]);
    return ObbTree::node(box, std::move(left), std::move(right));
}

ObbTree decode_tree(const pugi::xml_node& root) {
    int version = root.attribute("version").as_int(FORMAT_VERSION);
    if (version != FORMAT_VERSION) {
        malformed("unsupported obb_tree version " + std::to_string(version));
    }
    for (auto child : root.children()) {
        if (is_subtree(child)) {
            return decode_subtree(child);
        }
    }
    malformed("<obb_tree> is empty");
}

std::vector<Face> decode_faces(const pugi::xml_node& mesh) {
    std::vector<Face> faces;
    for (auto face : mesh.children("face")) {
        faces.push_back(decode_face(face));
    }
    return faces;
}

void load_document(pugi::xml_document& doc, const std::string& path) {
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        log::logger()->error("Failed to load '{}': {}", path, result.description());
        throw std::runtime_error("Failed to load " + path + ": " + result.description());
    }
}

void parse_document(pugi::xml_document& doc, const std::string& xml) {
    pugi::xml_parse_result result = doc.load_string(xml.c_str());
    if (!result) {
        throw std::runtime_error("Failed to parse XML: " + std::string(result.description()));
    }
}

void write_body(pugi::xml_document& doc, const collision::Body& body) {
    auto root = doc.append_child("body");
    encode_frame(root, body.frame());
    encode_tree(root, body.bounds());
}

collision::Body read_body(const pugi::xml_document& doc) {
    auto root = doc.child("body");
    if (!root) {
        malformed("no <body> root element");
    }
    Frame frame = decode_frame(require_child(root, "frame"));
    auto tree = std::make_shared<const ObbTree>(decode_tree(require_child(root, "obb_tree")));
    return collision::Body(frame, std::move(tree));
}

} // anonymous namespace

// ============================================================================
// Trees
// ============================================================================

std::string tree_to_string(const ObbTree& tree) {
    pugi::xml_document doc;
    encode_tree(doc, tree);
    return document_to_string(doc);
}

ObbTree tree_from_string(const std::string& xml) {
    pugi::xml_document doc;
    parse_document(doc, xml);
    return decode_tree(require_child(doc, "obb_tree"));
}

bool save_tree(const ObbTree& tree, const std::string& path) {
    pugi::xml_document doc;
    encode_tree(doc, tree);
    return doc.save_file(path.c_str(), "  ");
}

ObbTree load_tree(const std::string& path) {
    pugi::xml_document doc;
    load_document(doc, path);
    ObbTree tree = decode_tree(require_child(doc, "obb_tree"));
    log::logger()->info("Loaded tree from {} ({} nodes)", path, tree.size());
    return tree;
}

// ============================================================================
// Bodies
// ============================================================================

std::string body_to_string(const collision::Body& body) {
    pugi::xml_document doc;
    write_body(doc, body);
    return document_to_string(doc);
}

collision::Body body_from_string(const std::string& xml) {
    pugi::xml_document doc;
    parse_document(doc, xml);
    return read_body(doc);
}

bool save_body(const collision::Body& body, const std::string& path) {
    pugi::xml_document doc;
    write_body(doc, body);
    return doc.save_file(path.c_str(), "  ");
}

collision::Body load_body(const std::string& path) {
    pugi::xml_document doc;
    load_document(doc, path);
    collision::Body body = read_body(doc);
    log::logger()->info("Loaded body from {} ({} nodes)", path, body.bounds().size());
    return body;
}

// ============================================================================
// Meshes
// ============================================================================

std::vector<Face> load_faces(const std::string& path) {
    pugi::xml_document doc;
    load_document(doc, path);
    std::vector<Face> faces = decode_faces(require_child(doc, "mesh"));
    log::logger()->info("Loaded {} faces from {}", faces.size(), path);
    return faces;
}

std::vector<Face> faces_from_string(const std::string& xml) {
    pugi::xml_document doc;
    parse_document(doc, xml);
    return decode_faces(require_child(doc, "mesh"));
}

} // namespace obbcollide::io
