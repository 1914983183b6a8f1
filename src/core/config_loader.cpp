/**
 * @file config_loader.cpp
 * @brief XML configuration loading implementation
 *
 * Combat configuration is stored as a <combat_config> document read and
 * written with pugixml. Length values accept a unit attribute and are
 * converted to meters.
 */

#include "hornet/interface/config.h"
#include <pugixml.hpp>
#include <cmath>
#include <filesystem>
#include <stdexcept>

namespace hornet::config {

namespace {

// ============================================================================
// Unit Conversion Helpers
// ============================================================================

Real convert_length_to_si(Real value, const std::string& unit) {
    if (unit.empty() || unit == "m") return value;
    if (unit == "ft") return value * constants::FT_TO_M;
    if (unit == "km") return value * 1000.0;
    if (unit == "nm" || unit == "nmi") return value * constants::NMI_TO_M;
    throw std::runtime_error("Unsupported length unit: " + unit);
}

Real parse_length(const pugi::xml_node& node, Real fallback) {
    if (!node) {
        return fallback;
    }
    const Real value = node.text().as_double(fallback);
    return convert_length_to_si(value, node.attribute("unit").as_string(""));
}

void require_finite(Real value, const char* field) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument(std::string("CombatConfig: ") + field + " must be finite");
    }
}

void require_non_negative(Real value, const char* field) {
    require_finite(value, field);
    if (value < 0.0) {
        throw std::invalid_argument(std::string("CombatConfig: ") + field + " must be non-negative");
    }
}

void require_positive(Real value, const char* field) {
    require_finite(value, field);
    if (value <= 0.0) {
        throw std::invalid_argument(std::string("CombatConfig: ") + field + " must be positive");
    }
}

CombatConfig parse_document(const pugi::xml_document& doc) {
    auto root = doc.child("combat_config");
    if (!root) {
        throw std::runtime_error("Invalid combat config XML: no <combat_config> root element");
    }

    CombatConfig config = CombatConfig::defaults();

    if (auto arena = root.child("arena")) {
        config.team_size = arena.child("team_size").text().as_uint(config.team_size);

        if (auto bounds = arena.child("bounds")) {
            config.bounds.min_xy = parse_length(bounds.child("min_xy"), config.bounds.min_xy);
            config.bounds.max_xy = parse_length(bounds.child("max_xy"), config.bounds.max_xy);
            config.bounds.min_z = parse_length(bounds.child("min_z"), config.bounds.min_z);
            config.bounds.max_z = parse_length(bounds.child("max_z"), config.bounds.max_z);
        }

        config.max_wind = arena.child("max_wind").text().as_double(config.max_wind);
    }

    if (auto sim = root.child("simulation")) {
        config.time_step = sim.child("time_step").text().as_double(config.time_step);
        config.max_steps = sim.child("max_steps").text().as_uint(config.max_steps);
        config.seed = sim.child("seed").text().as_ullong(config.seed);
    }

    if (auto rewards = root.child("rewards")) {
        RewardConfig& r = config.rewards;
        r.damage_reward = rewards.child("damage_reward").text().as_double(r.damage_reward);
        r.kill_reward = rewards.child("kill_reward").text().as_double(r.kill_reward);
        r.damage_penalty = rewards.child("damage_penalty").text().as_double(r.damage_penalty);
        r.death_penalty = rewards.child("death_penalty").text().as_double(r.death_penalty);
        r.survival_reward = rewards.child("survival_reward").text().as_double(r.survival_reward);
    }

    if (auto weapons = root.child("weapons")) {
        config.round_hit_radius = parse_length(weapons.child("round_hit_radius"),
                                               config.round_hit_radius);
        config.homing_hit_radius = parse_length(weapons.child("homing_hit_radius"),
                                                config.homing_hit_radius);
    }

    return config;
}

} // anonymous namespace

// ============================================================================
// CombatConfig Implementation
// ============================================================================

void CombatConfig::validate() const {
    if (team_size == 0) {
        throw std::invalid_argument("CombatConfig: team_size must be at least 1");
    }

    require_finite(bounds.min_xy, "bounds.min_xy");
    require_finite(bounds.max_xy, "bounds.max_xy");
    require_finite(bounds.min_z, "bounds.min_z");
    require_finite(bounds.max_z, "bounds.max_z");
    if (bounds.max_xy <= bounds.min_xy) {
        throw std::invalid_argument("CombatConfig: bounds.max_xy must exceed bounds.min_xy");
    }
    if (bounds.max_z <= bounds.min_z) {
        throw std::invalid_argument("CombatConfig: bounds.max_z must exceed bounds.min_z");
    }

    require_positive(time_step, "time_step");
    if (max_steps == 0) {
        throw std::invalid_argument("CombatConfig: max_steps must be at least 1");
    }

    require_non_negative(rewards.damage_reward, "rewards.damage_reward");
    require_non_negative(rewards.kill_reward, "rewards.kill_reward");
    require_non_negative(rewards.damage_penalty, "rewards.damage_penalty");
    require_non_negative(rewards.death_penalty, "rewards.death_penalty");
    require_non_negative(rewards.survival_reward, "rewards.survival_reward");

    require_positive(round_hit_radius, "round_hit_radius");
    require_positive(homing_hit_radius, "homing_hit_radius");
    require_non_negative(max_wind, "max_wind");
}

CombatConfig CombatConfig::load(const std::string& path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());

    if (!result) {
        throw std::runtime_error("Failed to load combat config '" + path + "': " +
                                 std::string(result.description()));
    }

    return parse_document(doc);
}

CombatConfig CombatConfig::load_from_string(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml.c_str());

    if (!result) {
        throw std::runtime_error("Failed to parse combat config: " + std::string(result.description()));
    }

    return parse_document(doc);
}

CombatConfig CombatConfig::defaults() {
    return CombatConfig{};
}

bool CombatConfig::save(const std::string& path) const {
    pugi::xml_document doc;

    auto decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("combat_config");

    auto arena = root.append_child("arena");
    arena.append_child("team_size").text().set(team_size);
    auto bounds_node = arena.append_child("bounds");
    bounds_node.append_child("min_xy").text().set(bounds.min_xy);
    bounds_node.append_child("max_xy").text().set(bounds.max_xy);
    bounds_node.append_child("min_z").text().set(bounds.min_z);
    bounds_node.append_child("max_z").text().set(bounds.max_z);
    arena.append_child("max_wind").text().set(max_wind);

    auto sim = root.append_child("simulation");
    sim.append_child("time_step").text().set(time_step);
    sim.append_child("max_steps").text().set(max_steps);
    sim.append_child("seed").text().set(static_cast<unsigned long long>(seed));

    auto reward_node = root.append_child("rewards");
    reward_node.append_child("damage_reward").text().set(rewards.damage_reward);
    reward_node.append_child("kill_reward").text().set(rewards.kill_reward);
    reward_node.append_child("damage_penalty").text().set(rewards.damage_penalty);
    reward_node.append_child("death_penalty").text().set(rewards.death_penalty);
    reward_node.append_child("survival_reward").text().set(rewards.survival_reward);

    auto weapons = root.append_child("weapons");
    weapons.append_child("round_hit_radius").text().set(round_hit_radius);
    weapons.append_child("homing_hit_radius").text().set(homing_hit_radius);

    return doc.save_file(path.c_str());
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::ConfigLoader() {
    // Add default search paths
    search_paths_.push_back(".");
    search_paths_.push_back("./data");
    search_paths_.push_back("./config");
}

ConfigLoader::~ConfigLoader() = default;

CombatConfig ConfigLoader::load_combat_config(const std::string& path) {
    std::string resolved = find_file(path);
    if (resolved.empty()) {
        throw std::runtime_error("Combat config file not found: " + path);
    }
    return CombatConfig::load(resolved);
}

void ConfigLoader::add_search_path(const std::string& path) {
    search_paths_.push_back(path);
}

std::string ConfigLoader::find_file(const std::string& filename) const {
    if (std::filesystem::exists(filename)) {
        return filename;
    }

    for (const auto& search_path : search_paths_) {
        std::filesystem::path full_path = std::filesystem::path(search_path) / filename;
        if (std::filesystem::exists(full_path)) {
            return full_path.string();
        }
    }

    return "";
}

} // namespace hornet::config
