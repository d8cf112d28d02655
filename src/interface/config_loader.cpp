/**
 * @file config_loader.cpp
 * @brief XML configuration loading implementation
 *
 * Reads and writes CollisionConfig using pugixml.
 */

#include "obbcollide/interface/config.h"
#include "obbcollide/core/log.h"

#include <pugixml.hpp>
#include <stdexcept>

namespace obbcollide::config {

namespace {

geometry::FitMode parse_fit_mode(const std::string& name, geometry::FitMode fallback) {
    if (name == "principal" || name == "oriented") return geometry::FitMode::Principal;
    if (name == "axis_aligned" || name == "aabb") return geometry::FitMode::AxisAligned;
    if (!name.empty()) {
        log::logger()->warn("Unknown fit_mode '{}', keeping {}", name, to_string(fallback));
    }
    return fallback;
}

CollisionConfig from_document(const pugi::xml_document& doc) {
    CollisionConfig config = CollisionConfig::defaults();

    auto root = doc.child("collision_config");
    if (!root) {
        root = doc.child("config");
    }
    if (!root) {
        log::logger()->error("Invalid collision config XML: no root element");
        throw std::runtime_error("Invalid collision config XML: no root element");
    }

    // Construction settings
    if (auto build = root.child("build")) {
        config.fit_mode = parse_fit_mode(build.child("fit_mode").text().as_string(),
                                         config.fit_mode);
        config.split_epsilon = build.child("split_epsilon").text().as_double(config.split_epsilon);
    }

    // Query settings
    if (auto collision = root.child("collision")) {
        config.tolerance = collision.child("tolerance").text().as_double(config.tolerance);
    }

    // Logging settings
    if (auto logging = root.child("logging")) {
        config.log_level = logging.child("level").text().as_string(config.log_level.c_str());
    }

    if (config.split_epsilon < 0.0 || config.tolerance < 0.0) {
        throw std::runtime_error("Invalid collision config: tolerances must be non-negative");
    }

    return config;
}

} // anonymous namespace

// ============================================================================
// CollisionConfig Implementation
// ============================================================================

CollisionConfig CollisionConfig::load(const std::string& path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());

    if (!result) {
        log::logger()->error("Failed to load config '{}': {}", path, result.description());
        throw std::runtime_error("Failed to load config: " + std::string(result.description()));
    }

    CollisionConfig config = from_document(doc);
    log::logger()->info("Loaded collision config from {}", path);
    return config;
}

CollisionConfig CollisionConfig::parse(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml.c_str());

    if (!result) {
        throw std::runtime_error("Failed to parse config: " + std::string(result.description()));
    }

    return from_document(doc);
}

CollisionConfig CollisionConfig::defaults() {
    return CollisionConfig{};
}

bool CollisionConfig::save(const std::string& path) const {
    pugi::xml_document doc;

    auto decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("collision_config");

    auto build = root.append_child("build");
    build.append_child("fit_mode").text().set(to_string(fit_mode));
    build.append_child("split_epsilon").text().set(split_epsilon);

    auto collision = root.append_child("collision");
    collision.append_child("tolerance").text().set(tolerance);

    auto logging = root.append_child("logging");
    logging.append_child("level").text().set(log_level.c_str());

    return doc.save_file(path.c_str());
}

bvh::BuildOptions CollisionConfig::build_options() const {
    bvh::BuildOptions options;
    options.fit_mode = fit_mode;
    options.split_epsilon = split_epsilon;
    return options;
}

bool CollisionConfig::apply_logging() const {
    return log::set_level(log_level);
}

const char* to_string(geometry::FitMode mode) {
    switch (mode) {
        case geometry::FitMode::Principal: return "principal";
        case geometry::FitMode::AxisAligned: return "axis_aligned";
    }
    return "principal";
}

} // namespace obbcollide::config
