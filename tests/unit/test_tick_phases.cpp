/**
 * @file test_tick_phases.cpp
 * @brief Unit tests for the world state and the tick phase functions
 */

#include <gtest/gtest.h>
#include "hornet/sim/tick_phases.h"
#include "hornet/sim/world_state.h"
#include <cmath>
#include <stdexcept>

using namespace hornet;
using namespace hornet::physics;
using namespace hornet::sim;

// ============================================================================
// Test Fixture
// ============================================================================

class TickPhaseTest : public ::testing::Test {
protected:
    static constexpr Real DT = 0.1;

    config::CombatConfig config;
    RandomStream rng{42};

    /// Empty world with room for n drones per team
    WorldState make_world(SizeT team_size) {
        return WorldState(team_size);
    }

    Projectile make_projectile(MunitionKind kind, EntityId owner, Team team,
                               const Vec3& position, const Vec3& velocity = Vec3::Zero()) {
        Projectile p;
        p.id = 100;
        p.kind = kind;
        p.owner = owner;
        p.owner_team = team;
        p.position = position;
        p.velocity = velocity;
        p.damage = kind == MunitionKind::Homing ? constants::HOMING_DAMAGE : constants::ROUND_DAMAGE;
        p.lifetime = 1.0;
        p.tracking = constants::HOMING_TRACKING;
        return p;
    }
};

// ============================================================================
// DroneArena / Layout
// ============================================================================

TEST_F(TickPhaseTest, ArenaPreservesInsertionOrder) {
    DroneArena arena(3);
    EXPECT_EQ(arena.spawn("b", Team::Blue, Vec3::Zero(), EulerAngles{}), 0u);
    EXPECT_EQ(arena.spawn("a", Team::Red, Vec3::Zero(), EulerAngles{}), 1u);
    EXPECT_EQ(arena.spawn("c", Team::Red, Vec3::Zero(), EulerAngles{}), 2u);

    std::vector<std::string> ids;
    for (const Drone& d : arena) {
        ids.push_back(d.id());
    }
    EXPECT_EQ(ids, (std::vector<std::string>{"b", "a", "c"}));
    EXPECT_EQ(*arena.handle_of("a"), 1u);
    EXPECT_EQ(arena.find("c")->team(), Team::Red);
    EXPECT_EQ(arena.find("missing"), nullptr);
    EXPECT_FALSE(arena.handle_of("missing").has_value());
}

TEST_F(TickPhaseTest, ArenaRejectsOverflowAndDuplicates) {
    DroneArena arena(1);
    arena.spawn("red_0", Team::Red, Vec3::Zero(), EulerAngles{});
    EXPECT_THROW(arena.spawn("red_1", Team::Red, Vec3::Zero(), EulerAngles{}), std::length_error);

    DroneArena roomy(4);
    roomy.spawn("red_0", Team::Red, Vec3::Zero(), EulerAngles{});
    EXPECT_THROW(roomy.spawn("red_0", Team::Blue, Vec3::Zero(), EulerAngles{}), std::invalid_argument);
    EXPECT_THROW(roomy.at(7), std::out_of_range);
}

TEST_F(TickPhaseTest, PopulateTeamsUsesSymmetricSpawn) {
    WorldState world = make_world(3);
    populate_teams(world, 3);

    ASSERT_EQ(world.arena.size(), 6u);
    const Drone& red0 = world.arena.at(0);
    const Drone& red2 = world.arena.at(2);
    const Drone& blue0 = world.arena.at(3);

    EXPECT_EQ(red0.id(), "red_0");
    EXPECT_EQ(blue0.id(), "blue_0");
    EXPECT_EQ(red0.position(), (Vec3{-120.0, -75.0, 100.0}));
    EXPECT_EQ(red2.position(), (Vec3{-120.0, 25.0, 100.0}));
    EXPECT_EQ(blue0.position(), (Vec3{120.0, -75.0, 100.0}));
    EXPECT_DOUBLE_EQ(red0.orientation().yaw, 0.0);
    EXPECT_DOUBLE_EQ(blue0.orientation().yaw, constants::PI);
    EXPECT_EQ(world.arena.alive_count(Team::Red), 3u);
    EXPECT_EQ(world.arena.alive_count(Team::Blue), 3u);
}

TEST_F(TickPhaseTest, AgentIdFormat) {
    EXPECT_EQ(agent_id(Team::Red, 0), "red_0");
    EXPECT_EQ(agent_id(Team::Blue, 4), "blue_4");
}

// ============================================================================
// Actions and Launches
// ============================================================================

TEST_F(TickPhaseTest, AbsentAgentIsNotAdvanced) {
    WorldState world = make_world(1);
    populate_teams(world, 1);

    // Blue fires a homing munition so it has a cooldown to watch
    AgentMap<DroneAction> first{{"blue_0", DroneAction::make(DiscreteAction::FireMissile, 1.0)}};
    apply_actions(world, first, DT);
    const DroneStatus before = world.arena.at(1).status();
    ASSERT_GT(before.missile_cooldown, 0.0);

    AgentMap<DroneAction> second{{"red_0", DroneAction::make(DiscreteAction::Idle, 1.0)}};
    apply_actions(world, second, DT);

    const DroneStatus after = world.arena.at(1).status();
    EXPECT_EQ(after.position, before.position);
    EXPECT_EQ(after.velocity, before.velocity);
    EXPECT_DOUBLE_EQ(after.missile_cooldown, before.missile_cooldown);
    EXPECT_DOUBLE_EQ(after.energy, before.energy);

    // Red did advance
    EXPECT_GT(world.arena.at(0).velocity().x, 0.0);
}

TEST_F(TickPhaseTest, UnknownAgentIsIgnored) {
    WorldState world = make_world(1);
    populate_teams(world, 1);

    AgentMap<DroneAction> actions{{"ghost_9", DroneAction::make(DiscreteAction::FireGun)}};
    auto launches = apply_actions(world, actions, DT);
    EXPECT_TRUE(launches.empty());
    EXPECT_EQ(world.arena.at(0).ammo(), constants::DRONE_MAX_AMMO);
}

TEST_F(TickPhaseTest, LaunchesFollowArenaOrder) {
    WorldState world = make_world(2);
    populate_teams(world, 2);

    AgentMap<DroneAction> actions{
        {"blue_1", DroneAction::make(DiscreteAction::FireGun)},
        {"red_1", DroneAction::make(DiscreteAction::FireGun)},
        {"red_0", DroneAction::make(DiscreteAction::DeployDecoy)},
        {"blue_0", DroneAction::idle()},
    };
    auto launches = apply_actions(world, actions, DT);

    ASSERT_EQ(launches.size(), 3u);
    EXPECT_EQ(launches[0].shooter, 0u);
    EXPECT_TRUE(launches[0].events.deployed_decoy);
    EXPECT_EQ(launches[1].shooter, 1u);
    EXPECT_EQ(launches[2].shooter, 3u);
}

TEST_F(TickPhaseTest, SpawnMunitionsAssignsMonotonicIds) {
    WorldState world = make_world(1);
    populate_teams(world, 1);

    std::vector<LaunchEvent> launches;
    launches.push_back({0, DroneEvents{true, true, true}});
    launches.push_back({1, DroneEvents{true, false, false}});
    spawn_munitions(world, launches, rng);

    ASSERT_EQ(world.projectiles.size(), 3u);
    EXPECT_EQ(world.projectiles[0].id, 0u);
    EXPECT_EQ(world.projectiles[0].kind, MunitionKind::Round);
    EXPECT_EQ(world.projectiles[1].id, 1u);
    EXPECT_EQ(world.projectiles[1].kind, MunitionKind::Homing);
    ASSERT_TRUE(world.projectiles[1].target.has_value());
    EXPECT_EQ(*world.projectiles[1].target, 1u);
    EXPECT_EQ(world.projectiles[2].owner, 1u);
    EXPECT_EQ(world.projectiles[2].owner_team, Team::Blue);

    ASSERT_EQ(world.decoys.size(), 1u);
    EXPECT_EQ(world.decoys[0].position, world.arena.at(0).position());
    EXPECT_EQ(world.next_projectile_id, 3u);
    EXPECT_EQ(world.next_decoy_id, 1u);
}

TEST_F(TickPhaseTest, NearestEnemyBreaksTiesByArenaOrder) {
    WorldState world = make_world(2);
    world.arena.spawn("red_0", Team::Red, Vec3{0.0, 0.0, 100.0}, EulerAngles{});
    world.arena.spawn("red_1", Team::Red, Vec3{1.0, 0.0, 100.0}, EulerAngles{});
    world.arena.spawn("blue_0", Team::Blue, Vec3{100.0, -25.0, 100.0}, EulerAngles{});
    world.arena.spawn("blue_1", Team::Blue, Vec3{100.0, 25.0, 100.0}, EulerAngles{});

    EXPECT_EQ(find_nearest_enemy(world.arena, 0), std::optional<EntityId>(2));

    world.arena.at(2).take_damage(1000.0);
    EXPECT_EQ(find_nearest_enemy(world.arena, 0), std::optional<EntityId>(3));

    world.arena.at(3).take_damage(1000.0);
    EXPECT_FALSE(find_nearest_enemy(world.arena, 0).has_value());
}

// ============================================================================
// Projectiles
// ============================================================================

TEST_F(TickPhaseTest, HomingTracksLivingTarget) {
    WorldState world = make_world(1);
    world.arena.spawn("red_0", Team::Red, Vec3{0.0, 0.0, 100.0}, EulerAngles{});
    world.arena.spawn("blue_0", Team::Blue, Vec3{200.0, 200.0, 100.0}, EulerAngles{});

    Projectile missile = make_projectile(MunitionKind::Homing, 0, Team::Red,
                                         Vec3{0.0, 0.0, 100.0}, Vec3{150.0, 0.0, 0.0});
    missile.target = 1;
    world.projectiles.push_back(missile);

    advance_projectiles(world, DT);
    ASSERT_EQ(world.projectiles.size(), 1u);
    EXPECT_GT(world.projectiles[0].velocity.y, 0.0);
    EXPECT_NEAR(world.projectiles[0].velocity.length(), 150.0, 1e-9);
}

TEST_F(TickPhaseTest, HomingIgnoresDeadTarget) {
    WorldState world = make_world(1);
    world.arena.spawn("red_0", Team::Red, Vec3{0.0, 0.0, 100.0}, EulerAngles{});
    world.arena.spawn("blue_0", Team::Blue, Vec3{200.0, 200.0, 100.0}, EulerAngles{});
    world.arena.at(1).take_damage(1000.0);

    Projectile missile = make_projectile(MunitionKind::Homing, 0, Team::Red,
                                         Vec3{0.0, 0.0, 100.0}, Vec3{150.0, 0.0, 0.0});
    missile.target = 1;
    world.projectiles.push_back(missile);

    advance_projectiles(world, DT);
    EXPECT_EQ(world.projectiles[0].velocity, (Vec3{150.0, 0.0, 0.0}));
}

TEST_F(TickPhaseTest, DecoyBreaksLockPermanently) {
    WorldState world = make_world(1);
    world.arena.spawn("red_0", Team::Red, Vec3{0.0, 0.0, 100.0}, EulerAngles{});
    world.arena.spawn("blue_0", Team::Blue, Vec3{300.0, 100.0, 100.0}, EulerAngles{});

    Projectile missile = make_projectile(MunitionKind::Homing, 0, Team::Red,
                                         Vec3{0.0, 0.0, 100.0}, Vec3{150.0, 0.0, 0.0});
    missile.target = 1;
    missile.lifetime = 10.0;
    world.projectiles.push_back(missile);

    Decoy decoy;
    decoy.position = Vec3{20.0, 0.0, 100.0};
    world.decoys.push_back(decoy);

    advance_projectiles(world, DT);
    ASSERT_EQ(world.projectiles.size(), 1u);
    EXPECT_FALSE(world.projectiles[0].has_lock());

    // The decoy expires; the munition keeps flying straight
    world.decoys.clear();
    for (int i = 0; i < 10; ++i) {
        advance_projectiles(world, DT);
        ASSERT_EQ(world.projectiles.size(), 1u);
        EXPECT_FALSE(world.projectiles[0].has_lock());
        EXPECT_DOUBLE_EQ(world.projectiles[0].velocity.y, 0.0);
    }
}

TEST_F(TickPhaseTest, ExpiredProjectilesAreDropped) {
    WorldState world = make_world(1);
    populate_teams(world, 1);

    Projectile p = make_projectile(MunitionKind::Round, 0, Team::Red, Vec3::Zero(), Vec3{600.0, 0.0, 0.0});
    p.lifetime = 0.05;
    world.projectiles.push_back(p);
    p.lifetime = 1.0;
    world.projectiles.push_back(p);

    advance_projectiles(world, DT);
    ASSERT_EQ(world.projectiles.size(), 1u);
    EXPECT_NEAR(world.projectiles[0].lifetime, 0.9, 1e-12);
}

// ============================================================================
// Collisions
// ============================================================================

TEST_F(TickPhaseTest, HitAppliesDamageAndCreditsAttacker) {
    WorldState world = make_world(1);
    populate_teams(world, 1);
    const Vec3 blue_pos = world.arena.at(1).position();

    world.projectiles.push_back(make_projectile(MunitionKind::Round, 0, Team::Red,
                                                blue_pos + Vec3{11.0, 0.0, 0.0}));

    auto hits = resolve_collisions(world, config.round_hit_radius, config.homing_hit_radius);

    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].attacker, 0u);
    EXPECT_EQ(hits[0].target, 1u);
    EXPECT_EQ(hits[0].projectile, 100u);
    EXPECT_DOUBLE_EQ(hits[0].damage, constants::ROUND_DAMAGE);
    EXPECT_FALSE(hits[0].killed);
    EXPECT_TRUE(world.projectiles.empty());
    EXPECT_DOUBLE_EQ(world.arena.at(1).shield(), 42.0);
    EXPECT_DOUBLE_EQ(world.arena.at(0).stats().damage_dealt, constants::ROUND_DAMAGE);
}

TEST_F(TickPhaseTest, HitRadiusDependsOnKind) {
    WorldState world = make_world(1);
    populate_teams(world, 1);
    const Vec3 near_blue = world.arena.at(1).position() + Vec3{0.0, 13.0, 0.0};

    world.projectiles.push_back(make_projectile(MunitionKind::Round, 0, Team::Red, near_blue));
    world.projectiles.push_back(make_projectile(MunitionKind::Homing, 0, Team::Red, near_blue));

    auto hits = resolve_collisions(world, config.round_hit_radius, config.homing_hit_radius);

    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].kind, MunitionKind::Homing);
    ASSERT_EQ(world.projectiles.size(), 1u);
    EXPECT_EQ(world.projectiles[0].kind, MunitionKind::Round);
}

TEST_F(TickPhaseTest, NoFriendlyFire) {
    WorldState world = make_world(1);
    populate_teams(world, 1);

    world.projectiles.push_back(make_projectile(MunitionKind::Round, 0, Team::Red,
                                                world.arena.at(0).position()));
    auto hits = resolve_collisions(world, config.round_hit_radius, config.homing_hit_radius);

    EXPECT_TRUE(hits.empty());
    EXPECT_EQ(world.projectiles.size(), 1u);
    EXPECT_DOUBLE_EQ(world.arena.at(0).shield(), constants::DRONE_MAX_SHIELD);
}

TEST_F(TickPhaseTest, FirstDroneInArenaOrderAbsorbsHit) {
    WorldState world = make_world(2);
    world.arena.spawn("red_0", Team::Red, Vec3{-100.0, 0.0, 100.0}, EulerAngles{});
    world.arena.spawn("red_1", Team::Red, Vec3{-100.0, 50.0, 100.0}, EulerAngles{});
    world.arena.spawn("blue_0", Team::Blue, Vec3{5.0, 0.0, 100.0}, EulerAngles{});
    world.arena.spawn("blue_1", Team::Blue, Vec3{-5.0, 0.0, 100.0}, EulerAngles{});

    world.projectiles.push_back(make_projectile(MunitionKind::Round, 0, Team::Red,
                                                Vec3{0.0, 0.0, 100.0}));
    auto hits = resolve_collisions(world, config.round_hit_radius, config.homing_hit_radius);

    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].target, 2u);
    EXPECT_DOUBLE_EQ(world.arena.at(3).shield(), constants::DRONE_MAX_SHIELD);
}

TEST_F(TickPhaseTest, LethalHitCountsKill) {
    WorldState world = make_world(1);
    populate_teams(world, 1);
    world.arena.at(1).take_damage(140.0);

    world.projectiles.push_back(make_projectile(MunitionKind::Homing, 0, Team::Red,
                                                world.arena.at(1).position()));
    auto hits = resolve_collisions(world, config.round_hit_radius, config.homing_hit_radius);

    ASSERT_EQ(hits.size(), 1u);
    EXPECT_TRUE(hits[0].killed);
    EXPECT_FALSE(world.arena.at(1).is_alive());
    EXPECT_EQ(world.arena.at(0).stats().kills, 1u);
}

TEST_F(TickPhaseTest, DeadDronesAreNotHit) {
    WorldState world = make_world(1);
    populate_teams(world, 1);
    world.arena.at(1).take_damage(1000.0);

    world.projectiles.push_back(make_projectile(MunitionKind::Round, 0, Team::Red,
                                                world.arena.at(1).position()));
    EXPECT_TRUE(resolve_collisions(world, 12.0, 15.0).empty());
    EXPECT_EQ(world.projectiles.size(), 1u);
}

// ============================================================================
// Decoys and Bounds
// ============================================================================

TEST_F(TickPhaseTest, DecoysExpire) {
    WorldState world = make_world(1);
    Decoy decoy;
    decoy.lifetime = 0.15;
    decoy.position = Vec3{0.0, 0.0, 100.0};
    world.decoys.push_back(decoy);

    expire_decoys(world, DT);
    ASSERT_EQ(world.decoys.size(), 1u);
    EXPECT_NEAR(world.decoys[0].position.z, 99.5, 1e-12);

    expire_decoys(world, DT);
    EXPECT_TRUE(world.decoys.empty());
}

TEST_F(TickPhaseTest, BoundsReflectAndDamp) {
    WorldState world = make_world(1);
    world.arena.spawn("red_0", Team::Red, Vec3::Zero(), EulerAngles{});
    world.arena.at(0).set_kinematics(Vec3{600.0, -700.0, -10.0}, Vec3{10.0, -20.0, -30.0});

    enforce_bounds(world, config.bounds);

    const Drone& d = world.arena.at(0);
    EXPECT_EQ(d.position(), (Vec3{500.0, -500.0, 0.0}));
    EXPECT_EQ(d.velocity(), (Vec3{-5.0, 10.0, 15.0}));
    // Floor contact damage goes to the shield first
    EXPECT_DOUBLE_EQ(d.shield(), constants::DRONE_MAX_SHIELD - constants::FLOOR_CONTACT_DAMAGE);
    EXPECT_DOUBLE_EQ(d.stats().damage_taken, constants::FLOOR_CONTACT_DAMAGE);
}

TEST_F(TickPhaseTest, CeilingReflectsWithoutDamage) {
    WorldState world = make_world(1);
    world.arena.spawn("red_0", Team::Red, Vec3::Zero(), EulerAngles{});
    world.arena.at(0).set_kinematics(Vec3{0.0, 0.0, 400.0}, Vec3{0.0, 0.0, 20.0});

    enforce_bounds(world, config.bounds);

    const Drone& d = world.arena.at(0);
    EXPECT_DOUBLE_EQ(d.position().z, 300.0);
    EXPECT_DOUBLE_EQ(d.velocity().z, -10.0);
    EXPECT_DOUBLE_EQ(d.shield(), constants::DRONE_MAX_SHIELD);
}

TEST_F(TickPhaseTest, DeadDronesAreNotClamped) {
    WorldState world = make_world(1);
    world.arena.spawn("red_0", Team::Red, Vec3::Zero(), EulerAngles{});
    world.arena.at(0).take_damage(1000.0);
    world.arena.at(0).set_kinematics(Vec3{900.0, 0.0, 100.0}, Vec3::Zero());

    enforce_bounds(world, config.bounds);
    EXPECT_DOUBLE_EQ(world.arena.at(0).position().x, 900.0);
}

// ============================================================================
// Rewards and Termination
// ============================================================================

TEST_F(TickPhaseTest, SurvivalRewardOnly) {
    WorldState world = make_world(2);
    populate_teams(world, 2);

    auto rewards = compute_rewards(world, {}, config.rewards);
    ASSERT_EQ(rewards.size(), 4u);
    for (const auto& [id, reward] : rewards) {
        EXPECT_DOUBLE_EQ(reward, config.rewards.survival_reward) << id;
    }
}

TEST_F(TickPhaseTest, HitRewardsAndPenalties) {
    WorldState world = make_world(1);
    populate_teams(world, 1);

    std::vector<HitEvent> hits{{0, 1, 5, MunitionKind::Round, 8.0, false}};
    auto rewards = compute_rewards(world, hits, config.rewards);

    EXPECT_NEAR(rewards["red_0"], 0.1 + 8.0 * 0.5, 1e-12);
    EXPECT_NEAR(rewards["blue_0"], 0.1 - 8.0 * 0.3, 1e-12);
}

TEST_F(TickPhaseTest, KillRewardsAndDeadTargetPenalty) {
    WorldState world = make_world(1);
    populate_teams(world, 1);
    world.arena.at(1).take_damage(1000.0);

    std::vector<HitEvent> hits{{0, 1, 5, MunitionKind::Homing, 40.0, true}};
    auto rewards = compute_rewards(world, hits, config.rewards);

    EXPECT_NEAR(rewards["red_0"], 0.1 + 40.0 * 0.5 + 50.0, 1e-12);
    // Dead this tick: no survival reward, still penalized
    EXPECT_NEAR(rewards["blue_0"], -(40.0 * 0.3) - 30.0, 1e-12);
}

TEST_F(TickPhaseTest, TerminationAndWinner) {
    WorldState world = make_world(1);
    populate_teams(world, 1);

    TerminationStatus status = check_termination(world, 10);
    EXPECT_FALSE(status.terminated);
    EXPECT_FALSE(status.truncated);
    EXPECT_FALSE(status.winner.has_value());

    world.arena.at(1).take_damage(1000.0);
    status = check_termination(world, 10);
    EXPECT_TRUE(status.terminated);
    EXPECT_EQ(status.red_alive, 1u);
    EXPECT_EQ(status.blue_alive, 0u);
    EXPECT_EQ(status.winner, Team::Red);

    world.arena.at(0).take_damage(1000.0);
    status = check_termination(world, 10);
    EXPECT_TRUE(status.terminated);
    EXPECT_FALSE(status.winner.has_value());
}

TEST_F(TickPhaseTest, TruncationAtHorizon) {
    WorldState world = make_world(1);
    populate_teams(world, 1);

    world.step_count = 9;
    EXPECT_FALSE(check_termination(world, 10).truncated);
    world.step_count = 10;
    EXPECT_TRUE(check_termination(world, 10).truncated);
}

// ============================================================================
// Full Tick
// ============================================================================

TEST_F(TickPhaseTest, RunTickIncrementsStepAndKeepsDronesInBounds) {
    WorldState world = make_world(2);
    populate_teams(world, 2);

    AgentMap<DroneAction> actions;
    for (const Drone& d : world.arena) {
        actions[d.id()] = DroneAction::make(DiscreteAction::Boost, 1.0, -1.0, 0.3, 0.0);
    }

    for (int i = 0; i < 200; ++i) {
        TickOutcome outcome = run_tick(world, actions, config, rng);
        EXPECT_EQ(world.step_count, static_cast<UInt32>(i + 1));
        EXPECT_EQ(outcome.rewards.size(), 4u);
        for (const Drone& d : world.arena) {
            if (d.is_alive()) {
                EXPECT_TRUE(config.bounds.contains(d.position())) << d.id();
            }
        }
    }
}
