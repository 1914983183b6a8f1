/**
 * @file combat_environment.cpp
 * @brief Implementation of the multi-agent combat environment
 */

#include "hornet/ml/combat_environment.h"
#include "hornet/core/logging.h"
#include "hornet/core/random.h"
#include "hornet/sim/observation_encoder.h"
#include "hornet/sim/world_state.h"
#include <cmath>
#include <utility>

namespace hornet::ml {

using physics::Team;

// ============================================================================
// Space Implementation
// ============================================================================

bool Space::contains(const std::vector<Real>& value) const {
    switch (type) {
        case SpaceType::Discrete: {
            if (value.size() != 1 || n <= 0) return false;
            if (!std::isfinite(value[0]) || std::floor(value[0]) != value[0]) return false;
            Int64 val = static_cast<Int64>(value[0]);
            return val >= 0 && val < n;
        }

        case SpaceType::Box: {
            if (value.size() != dimension) return false;
            if (low.empty() || high.empty()) return true; // Unbounded

            for (SizeT i = 0; i < value.size(); ++i) {
                if (!(value[i] >= low[i] && value[i] <= high[i])) {
                    return false;
                }
            }
            return true;
        }

        default:
            return false;
    }
}

// ============================================================================
// Step Records
// ============================================================================

bool StepResult::is_done() const noexcept {
    for (const auto& entry : terminated) {
        if (entry.second) return true;
    }
    for (const auto& entry : truncated) {
        if (entry.second) return true;
    }
    return false;
}

void EpisodeStats::update(const sim::TerminationStatus& status, UInt32 steps) noexcept {
    episodes++;
    total_steps += steps;

    if (status.winner == Team::Red) {
        red_wins++;
    } else if (status.winner == Team::Blue) {
        blue_wins++;
    } else {
        draws++;
    }

    if (status.truncated) {
        truncated_episodes++;
    }

    // Incremental average update
    Real alpha = 1.0 / static_cast<Real>(episodes);
    average_episode_length = average_episode_length * (1.0 - alpha) +
                             static_cast<Real>(steps) * alpha;
}

// ============================================================================
// CombatEnvironment::Impl
// ============================================================================

struct CombatEnvironment::Impl {
    config::CombatConfig config;
    sim::ObservationEncoder encoder;

    // Episode state
    sim::WorldState world;
    EpisodePhase phase{EpisodePhase::Uninitialized};
    std::vector<sim::HitEvent> last_hits;
    sim::TerminationStatus last_status;

    // Random number generation
    RandomStream rng;
    bool rng_seeded{false};

    // Statistics
    EpisodeStats stats;

    explicit Impl(const config::CombatConfig& cfg)
        : config(cfg)
        , encoder(cfg)
        , world(cfg.team_size) {
    }

    EpisodeStatus make_status() const {
        EpisodeStatus info;
        info.step = world.step_count;
        info.red_alive = last_status.red_alive;
        info.blue_alive = last_status.blue_alive;
        info.winner = last_status.winner;
        return info;
    }

    void fill_flags(StepResult& result) const {
        result.terminated.clear();
        result.truncated.clear();
        for (const auto& drone : world.arena) {
            result.terminated[drone.id()] = last_status.terminated;
            result.truncated[drone.id()] = last_status.truncated;
        }
    }

    void finish_episode() {
        phase = EpisodePhase::Finished;
        stats.update(last_status, world.step_count);

        const char* outcome = last_status.winner
            ? physics::team_to_string(*last_status.winner)
            : "draw";
        log::get_logger()->info("Episode finished after {} steps: winner={} (red {}, blue {}){}",
                                world.step_count, outcome,
                                last_status.red_alive, last_status.blue_alive,
                                last_status.truncated ? " [truncated]" : "");
    }
};

// ============================================================================
// CombatEnvironment Implementation
// ============================================================================

CombatEnvironment::CombatEnvironment(const config::CombatConfig& config) {
    config.validate();
    impl_ = std::make_unique<Impl>(config);

    log::get_logger()->debug("CombatEnvironment created: team_size={}, dt={}, max_steps={}, obs_size={}",
                             config.team_size, config.time_step, config.max_steps,
                             impl_->encoder.size());
}

CombatEnvironment::~CombatEnvironment() = default;

CombatEnvironment::CombatEnvironment(CombatEnvironment&&) noexcept = default;
CombatEnvironment& CombatEnvironment::operator=(CombatEnvironment&&) noexcept = default;

CombatResult CombatEnvironment::reset(std::optional<UInt64> seed, ResetResult& result) {
    if (seed) {
        impl_->rng.seed(*seed);
        impl_->rng_seeded = true;
    } else if (!impl_->rng_seeded) {
        impl_->rng.seed(impl_->config.seed);
        impl_->rng_seeded = true;
    }

    sim::populate_teams(impl_->world, impl_->config.team_size);
    impl_->world.wind = impl_->rng.uniform_vec3(-impl_->config.max_wind, impl_->config.max_wind);

    impl_->last_hits.clear();
    impl_->last_status = sim::check_termination(impl_->world, impl_->config.max_steps);
    impl_->phase = EpisodePhase::Ready;

    if (seed) {
        log::get_logger()->debug("Episode reset with seed {}", *seed);
    } else {
        log::get_logger()->debug("Episode reset continuing stream (seed {})",
                                 impl_->rng.current_seed());
    }

    result.observations = impl_->encoder.encode_all(impl_->world);
    result.info = impl_->make_status();
    return CombatResult::Success;
}

CombatResult CombatEnvironment::step(const AgentMap<physics::DroneAction>& actions,
                                     StepResult& result) {
    if (impl_->phase == EpisodePhase::Uninitialized) {
        return CombatResult::NotReset;
    }

    if (impl_->phase == EpisodePhase::Finished) {
        result.observations = impl_->encoder.encode_all(impl_->world);
        result.rewards.clear();
        for (const auto& drone : impl_->world.arena) {
            result.rewards[drone.id()] = 0.0;
        }
        impl_->fill_flags(result);
        result.info = impl_->make_status();
        return CombatResult::EpisodeDone;
    }

    sim::TickOutcome outcome = sim::run_tick(impl_->world, actions, impl_->config, impl_->rng);

    impl_->last_hits = std::move(outcome.hits);
    impl_->last_status = outcome.status;
    impl_->phase = EpisodePhase::Running;

    result.observations = impl_->encoder.encode_all(impl_->world);
    result.rewards = std::move(outcome.rewards);
    impl_->fill_flags(result);
    result.info = impl_->make_status();

    if (impl_->last_status.terminated || impl_->last_status.truncated) {
        impl_->finish_episode();
    }

    return CombatResult::Success;
}

RenderSnapshot CombatEnvironment::render_snapshot() const {
    RenderSnapshot snapshot;
    snapshot.step = impl_->world.step_count;

    snapshot.drones.reserve(impl_->world.arena.size());
    for (const auto& drone : impl_->world.arena) {
        DroneView view;
        view.id = drone.id();
        view.team = drone.team();
        view.position = drone.position();
        view.velocity = drone.velocity();
        view.orientation = drone.orientation();
        view.hp = drone.hp();
        view.shield = drone.shield();
        view.is_alive = drone.is_alive();
        snapshot.drones.push_back(std::move(view));
    }

    snapshot.projectiles.reserve(impl_->world.projectiles.size());
    for (const auto& proj : impl_->world.projectiles) {
        snapshot.projectiles.push_back({proj.id, proj.kind, proj.position});
    }

    return snapshot;
}

void CombatEnvironment::render() const {
    log::get_logger()->info("Step {}: Red({}) vs Blue({})",
                            impl_->world.step_count,
                            impl_->world.arena.alive_count(Team::Red),
                            impl_->world.arena.alive_count(Team::Blue));
}

EpisodePhase CombatEnvironment::phase() const noexcept {
    return impl_->phase;
}

const config::CombatConfig& CombatEnvironment::config() const noexcept {
    return impl_->config;
}

SizeT CombatEnvironment::observation_size() const noexcept {
    return impl_->encoder.size();
}

std::vector<std::string> CombatEnvironment::agent_ids() const {
    std::vector<std::string> ids;
    if (impl_->world.arena.empty()) {
        // Before the first reset the layout is still known
        for (Team team : {Team::Red, Team::Blue}) {
            for (SizeT i = 0; i < impl_->config.team_size; ++i) {
                ids.push_back(sim::agent_id(team, i));
            }
        }
        return ids;
    }

    ids.reserve(impl_->world.arena.size());
    for (const auto& drone : impl_->world.arena) {
        ids.push_back(drone.id());
    }
    return ids;
}

std::optional<physics::DroneStatus> CombatEnvironment::drone_status(const std::string& id) const {
    const physics::Drone* drone = impl_->world.arena.find(id);
    if (!drone) {
        return std::nullopt;
    }
    return drone->status();
}

const std::vector<sim::HitEvent>& CombatEnvironment::last_hit_events() const noexcept {
    return impl_->last_hits;
}

EpisodeStatus CombatEnvironment::episode_status() const {
    return impl_->make_status();
}

Space CombatEnvironment::observation_space() const {
    return Space::unbounded_box(impl_->encoder.size());
}

Space CombatEnvironment::discrete_action_space() const {
    return Space::discrete(physics::DISCRETE_ACTION_COUNT);
}

Space CombatEnvironment::continuous_action_space() const {
    return Space::box(4, -1.0, 1.0);
}

EpisodeStats CombatEnvironment::episode_stats() const {
    return impl_->stats;
}

} // namespace hornet::ml
