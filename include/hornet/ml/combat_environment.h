#pragma once
/**
 * @file combat_environment.h
 * @brief Gym-style multi-agent drone combat environment
 *
 * The environment owns one WorldState and one RandomStream and exposes the
 * reset / step / render_snapshot boundary consumed by learning loops and
 * scripted controllers. Callers never touch entity state directly.
 *
 * Key features:
 * - Per-agent observation, reward, terminated and truncated maps
 * - Deterministic replay: same seed + same actions = same trajectory
 * - Episode lifecycle reported through CombatResult codes
 * - Episode outcome statistics across resets
 */

#include "hornet/core/types.h"
#include "hornet/interface/config.h"
#include "hornet/physics/drone.h"
#include "hornet/physics/munitions.h"
#include "hornet/sim/tick_phases.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hornet::ml {

// ============================================================================
// Result Codes
// ============================================================================

/**
 * @brief Result codes for combat environment operations
 */
enum class CombatResult : UInt8 {
    Success = 0,

    /// step() called before the first reset()
    NotReset,

    /// step() called after the episode terminated or was truncated
    EpisodeDone
};

inline const char* combat_result_to_string(CombatResult result) {
    switch (result) {
        case CombatResult::Success: return "Success";
        case CombatResult::NotReset: return "NotReset";
        case CombatResult::EpisodeDone: return "EpisodeDone";
        default: return "Unknown";
    }
}

/**
 * @brief Episode lifecycle
 */
enum class EpisodePhase : UInt8 {
    Uninitialized = 0,  ///< No reset yet
    Ready,              ///< Reset, no tick yet
    Running,            ///< At least one tick, not finished
    Finished            ///< Terminated or truncated; ticks are no-ops
};

inline const char* episode_phase_to_string(EpisodePhase phase) {
    switch (phase) {
        case EpisodePhase::Uninitialized: return "Uninitialized";
        case EpisodePhase::Ready: return "Ready";
        case EpisodePhase::Running: return "Running";
        case EpisodePhase::Finished: return "Finished";
        default: return "Unknown";
    }
}

// ============================================================================
// Space Definition
// ============================================================================

enum class SpaceType : UInt8 {
    /// Single discrete value from 0 to n-1
    Discrete = 0,

    /// Continuous bounded/unbounded n-dimensional space
    Box
};

/**
 * @brief Structure and constraints of an observation or action space
 */
struct Space {
    SpaceType type{SpaceType::Box};

    /// Number of dimensions (Box) or 1 (Discrete)
    SizeT dimension{0};

    /// Per-dimension bounds (Box only; empty means unbounded)
    std::vector<Real> low;
    std::vector<Real> high;

    /// Number of discrete values (Discrete only)
    Int64 n{0};

    /**
     * @brief Check if a value is within this space
     */
    bool contains(const std::vector<Real>& value) const;

    static Space discrete(Int64 n_values) {
        Space space;
        space.type = SpaceType::Discrete;
        space.dimension = 1;
        space.n = n_values;
        return space;
    }

    static Space box(SizeT dim, Real lo, Real hi) {
        Space space;
        space.type = SpaceType::Box;
        space.dimension = dim;
        space.low.assign(dim, lo);
        space.high.assign(dim, hi);
        return space;
    }

    static Space unbounded_box(SizeT dim) {
        Space space;
        space.type = SpaceType::Box;
        space.dimension = dim;
        return space;
    }
};

// ============================================================================
// Step Records
// ============================================================================

/**
 * @brief Episode info returned by reset and step
 */
struct EpisodeStatus {
    UInt32 step{0};
    SizeT red_alive{0};
    SizeT blue_alive{0};

    /// Set once exactly one team has survivors
    std::optional<physics::Team> winner;
};

struct ResetResult {
    AgentMap<std::vector<Float32>> observations;
    EpisodeStatus info;
};

struct StepResult {
    AgentMap<std::vector<Float32>> observations;
    AgentMap<Real> rewards;
    AgentMap<bool> terminated;
    AgentMap<bool> truncated;
    EpisodeStatus info;

    /**
     * @brief True if the episode ended on (or before) this step
     */
    bool is_done() const noexcept;
};

// ============================================================================
// Render Snapshot
// ============================================================================

struct DroneView {
    std::string id;
    physics::Team team{physics::Team::Red};
    Vec3 position;
    Vec3 velocity;
    EulerAngles orientation;
    Real hp{0.0};
    Real shield{0.0};
    bool is_alive{false};
};

struct ProjectileView {
    EntityId id{INVALID_ENTITY_ID};
    physics::MunitionKind kind{physics::MunitionKind::Round};
    Vec3 position;
};

/**
 * @brief Read-only renderer-facing view of the world
 *
 * Drones appear in arena order, projectiles in list order.
 */
struct RenderSnapshot {
    UInt32 step{0};
    std::vector<DroneView> drones;
    std::vector<ProjectileView> projectiles;
};

// ============================================================================
// Statistics
// ============================================================================

/**
 * @brief Outcome statistics over finished episodes
 */
struct EpisodeStats {
    UInt64 episodes{0};
    UInt64 total_steps{0};
    UInt64 red_wins{0};
    UInt64 blue_wins{0};
    UInt64 draws{0};
    UInt64 truncated_episodes{0};
    Real average_episode_length{0.0};

    void reset() noexcept {
        *this = EpisodeStats{};
    }

    /**
     * @brief Incorporate a finished episode
     */
    void update(const sim::TerminationStatus& status, UInt32 steps) noexcept;
};

// ============================================================================
// Combat Environment
// ============================================================================

class CombatEnvironment {
public:
    /**
     * @brief Construct environment with configuration
     * @throws std::invalid_argument if the configuration is invalid
     */
    explicit CombatEnvironment(const config::CombatConfig& config = config::CombatConfig{});

    ~CombatEnvironment();

    // Non-copyable, movable
    CombatEnvironment(const CombatEnvironment&) = delete;
    CombatEnvironment& operator=(const CombatEnvironment&) = delete;
    CombatEnvironment(CombatEnvironment&&) noexcept;
    CombatEnvironment& operator=(CombatEnvironment&&) noexcept;

    // ========================================================================
    // Episode Lifecycle
    // ========================================================================

    /**
     * @brief Start a new episode
     * @param seed Reseeds the random stream; nullopt continues the current
     *        stream (seeded from the configuration on first use)
     * @param result Output parameter for initial observations and info
     */
    CombatResult reset(std::optional<UInt64> seed, ResetResult& result);

    /**
     * @brief Advance the world by one tick
     * @param actions Per-agent actions; absent agents are not advanced
     * @param result Output parameter for the step result
     * @return NotReset (result untouched), EpisodeDone (current state, no
     *         advance, zero rewards) or Success
     */
    CombatResult step(const AgentMap<physics::DroneAction>& actions, StepResult& result);

    /**
     * @brief Renderer-facing view of the current world
     */
    RenderSnapshot render_snapshot() const;

    /**
     * @brief Log a one-line status at info level
     */
    void render() const;

    // ========================================================================
    // Queries
    // ========================================================================

    EpisodePhase phase() const noexcept;
    const config::CombatConfig& config() const noexcept;

    /// Observation length for the configured team size
    SizeT observation_size() const noexcept;

    /// Agent ids in arena order (red first)
    std::vector<std::string> agent_ids() const;

    std::optional<physics::DroneStatus> drone_status(const std::string& id) const;

    /// Hit events of the most recent tick
    const std::vector<sim::HitEvent>& last_hit_events() const noexcept;

    EpisodeStatus episode_status() const;

    Space observation_space() const;
    Space discrete_action_space() const;
    Space continuous_action_space() const;

    EpisodeStats episode_stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hornet::ml
