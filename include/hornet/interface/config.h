#pragma once
/**
 * @file config.h
 * @brief Combat configuration loading and management
 */

#include "hornet/core/types.h"
#include <string>
#include <vector>

namespace hornet::config {

/**
 * @brief Arena extent: square horizontal bounds and a height band
 */
struct ArenaBounds {
    Real min_xy{-500.0};
    Real max_xy{500.0};
    Real min_z{0.0};
    Real max_z{300.0};

    Real horizontal_extent() const noexcept { return max_xy - min_xy; }
    Real height_extent() const noexcept { return max_z - min_z; }

    /**
     * @brief True if a point lies inside the bounds (inclusive)
     */
    bool contains(const Vec3& p) const noexcept {
        return p.x >= min_xy && p.x <= max_xy &&
               p.y >= min_xy && p.y <= max_xy &&
               p.z >= min_z && p.z <= max_z;
    }
};

/**
 * @brief Reward and penalty weights
 */
struct RewardConfig {
    /// Attacker reward per point of damage dealt
    Real damage_reward{0.5};

    /// Attacker bonus for a lethal hit
    Real kill_reward{50.0};

    /// Target penalty per point of damage taken
    Real damage_penalty{0.3};

    /// Target penalty for being killed
    Real death_penalty{30.0};

    /// Per-tick reward for every living agent
    Real survival_reward{0.1};
};

/**
 * @brief Combat environment configuration loaded from XML
 */
struct CombatConfig {
    /// Drones per team
    UInt32 team_size{3};

    ArenaBounds bounds;

    /// Tick duration (seconds)
    Real time_step{0.1};

    /// Step horizon after which episodes are truncated
    UInt32 max_steps{3000};

    RewardConfig rewards;

    Real round_hit_radius{12.0};
    Real homing_hit_radius{15.0};

    /// Wind components are drawn uniformly from [-max_wind, max_wind)
    Real max_wind{5.0};

    /// Seed used when reset() is first called without one
    UInt64 seed{0};

    /**
     * @brief Check every field
     * @throws std::invalid_argument naming the first offending field
     */
    void validate() const;

    /**
     * @brief Load configuration from XML file
     * @throws std::runtime_error on I/O or parse failure
     */
    static CombatConfig load(const std::string& path);

    /**
     * @brief Parse configuration from an XML string
     * @throws std::runtime_error on parse failure
     */
    static CombatConfig load_from_string(const std::string& xml);

    /**
     * @brief Create default configuration
     */
    static CombatConfig defaults();

    /**
     * @brief Save configuration to XML file
     */
    bool save(const std::string& path) const;
};

/**
 * @brief Configuration loader service
 */
class ConfigLoader {
public:
    ConfigLoader();
    ~ConfigLoader();

    /**
     * @brief Resolve and load a combat configuration
     * @throws std::runtime_error if the file is not found in any search path
     */
    CombatConfig load_combat_config(const std::string& path);

    /**
     * @brief Add search path for configuration files
     */
    void add_search_path(const std::string& path);

    /**
     * @brief Find file in search paths
     * @return Resolved path, empty if not found
     */
    std::string find_file(const std::string& filename) const;

    const std::vector<std::string>& search_paths() const noexcept { return search_paths_; }

private:
    std::vector<std::string> search_paths_;
};

} // namespace hornet::config
