/**
 * @file main.cpp
 * @brief Scripted duel example
 *
 * Every drone pursues its nearest living enemy and fires the gun once the
 * enemy is close and near the nose. Usage:
 *
 *   hornet_scripted_duel [config.xml]
 */

#include "hornet/hornet.h"
#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>

namespace {

constexpr hornet::Real YAW_GAIN = 1.5;
constexpr hornet::Real PITCH_GAIN = 1.2;
constexpr hornet::Real GUN_RANGE = 200.0;
constexpr hornet::Real GUN_CONE = 0.4;  // rad

hornet::Real clamp_unit(hornet::Real v) {
    return std::clamp(v, -1.0, 1.0);
}

/**
 * @brief Pursue-and-shoot controller for one drone
 */
hornet::physics::DroneAction pursue(const hornet::ml::DroneView& self,
                                    const hornet::ml::RenderSnapshot& snapshot) {
    using namespace hornet;

    const ml::DroneView* target = nullptr;
    Real best = std::numeric_limits<Real>::infinity();
    for (const auto& other : snapshot.drones) {
        if (!other.is_alive || other.team == self.team) {
            continue;
        }
        Real dist = math::distance(self.position, other.position);
        if (dist < best) {
            best = dist;
            target = &other;
        }
    }

    if (!target) {
        return physics::DroneAction::idle();
    }

    const Vec3 to_target = target->position - self.position;
    const Real dist = best;

    const Real desired_yaw = std::atan2(to_target.y, to_target.x);
    const Real desired_pitch = dist > 1e-6 ? std::asin(std::clamp(to_target.z / dist, -1.0, 1.0)) : 0.0;

    const Real yaw_error = math::wrap_angle(desired_yaw - self.orientation.yaw);
    const Real pitch_error = desired_pitch - self.orientation.pitch;

    Real throttle = 0.5;
    if (dist > 200.0) {
        throttle = 1.0;
    } else if (dist > 100.0) {
        throttle = 0.7;
    }

    const Vec3 heading = math::heading_from(self.orientation.pitch, self.orientation.yaw);
    const Real off_nose = dist > 1e-6
        ? std::acos(std::clamp(heading.dot(to_target / dist), -1.0, 1.0))
        : 0.0;

    const auto code = (dist < GUN_RANGE && off_nose < GUN_CONE)
        ? physics::DiscreteAction::FireGun
        : physics::DiscreteAction::Idle;

    return physics::DroneAction::make(code, throttle,
                                      clamp_unit(PITCH_GAIN * pitch_error),
                                      clamp_unit(YAW_GAIN * yaw_error),
                                      0.0);
}

void print_snapshot(const hornet::ml::RenderSnapshot& snapshot) {
    std::cout << "Step " << snapshot.step << "  (" << snapshot.projectiles.size()
              << " projectiles in flight)\n";
    for (const auto& d : snapshot.drones) {
        std::cout << "  " << std::setw(7) << std::left << d.id << std::right
                  << std::setw(9) << d.position.x << "  "
                  << std::setw(9) << d.position.y << "  "
                  << std::setw(8) << d.position.z << "  "
                  << std::setw(7) << d.hp << "  "
                  << std::setw(6) << d.shield << "  "
                  << (d.is_alive ? "alive" : "down") << "\n";
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::cout << "HornetArena Scripted Duel Example\n";
    std::cout << "Version: " << hornet::GetVersionString() << "\n\n";

    hornet::config::CombatConfig config;
    config.team_size = 1;
    config.max_steps = 1500;

    if (argc > 1) {
        try {
            hornet::config::ConfigLoader loader;
            config = loader.load_combat_config(argv[1]);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load configuration: " << e.what() << "\n";
            return 1;
        }
    }

    std::unique_ptr<hornet::ml::CombatEnvironment> env;
    try {
        env = std::make_unique<hornet::ml::CombatEnvironment>(config);
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    hornet::ml::ResetResult reset;
    env->reset(config.seed, reset);

    std::cout << "Running " << config.team_size << "v" << config.team_size
              << " for up to " << config.max_steps << " steps...\n\n";
    std::cout << std::fixed << std::setprecision(1);

    hornet::ml::StepResult result;
    while (true) {
        const auto snapshot = env->render_snapshot();
        if (snapshot.step % 50 == 0) {
            print_snapshot(snapshot);
        }

        hornet::AgentMap<hornet::physics::DroneAction> actions;
        for (const auto& drone : snapshot.drones) {
            if (drone.is_alive) {
                actions[drone.id] = pursue(drone, snapshot);
            }
        }

        if (env->step(actions, result) != hornet::ml::CombatResult::Success || result.is_done()) {
            break;
        }
    }

    print_snapshot(env->render_snapshot());
    env->render();

    const auto status = env->episode_status();
    std::cout << "\nEpisode finished after " << status.step << " steps: ";
    if (status.winner) {
        std::cout << hornet::physics::team_to_string(*status.winner) << " wins";
    } else {
        std::cout << "no winner";
    }
    std::cout << " (red " << status.red_alive << ", blue " << status.blue_alive << ")\n";

    return 0;
}
