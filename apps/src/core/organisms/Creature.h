#pragma once

#include "CreatureTypes.h"
#include "core/Vector2.h"
#include "core/physics/PhysicsTypes.h"
#include "core/organisms/genetics/Genome.h"

#include <memory>
#include <optional>
#include <vector>

namespace Biomorph {

class EventSink;
class PhysicsWorld;

/**
 * A live creature: one physics body per genome segment, one distance
 * constraint per joint, plus metabolism, senses and combat bookkeeping.
 *
 * The creature registers its bodies and constraints on construction and
 * removes whatever is left of them on destruction, so the world must outlive it.
 */
class Creature {
public:
    static constexpr double MaxVitals = 200.0;
    static constexpr double InitialVitals = 100.0;
    // Food burned per second: a full 100 lasts exactly one hour.
    static constexpr double FoodBurnRate = 100.0 / 3600.0;
    static constexpr double DeathHoldSeconds = 2.0;
    static constexpr double FadeRate = 0.5; // Alpha per second.

    static constexpr double BaseFriction = 0.8;
    static constexpr double StickyFriction = 0.95;
    static constexpr double SlipperyFriction = 0.1;

    struct SegmentBody {
        BodyId bodyId;
        int segmentIndex = 0;
    };

    // Live motor state of one joint.
    struct JointMotor {
        ConstraintId constraintId;
        int jointIndex = 0;
        double amplitude = 0.0;
        double frequency = 1.0;
        double phase = 0.0;
    };

    // Transform and look of one segment, for renderers.
    struct SegmentState {
        Vector2d position;
        double angle = 0.0;
        SegmentShape shape;
        Rgb color;
        bool isHeart = false;
        bool isMouth = false;
        bool isGripper = false;
    };

    Creature(
        CreatureId id,
        std::shared_ptr<Genome> genome,
        PhysicsWorld& world,
        const Vector2d& spawnPosition,
        EventSink* events = nullptr);
    ~Creature();

    Creature(const Creature&) = delete;
    Creature& operator=(const Creature&) = delete;

    /**
     * Advance by dt seconds. Dead creatures only run their fade timer.
     */
    void update(double dt);

    // Candidates for sensing. Pointers must stay valid until the next call.
    void setVisibleCreatures(std::vector<const Creature*> others);

    void takeDamage(double amount, Creature* attacker = nullptr);
    void restoreHealth(double amount);
    void die(Creature* killer, DeathCause cause);

    double calculateFitness() const;

    // Mass-weighted centroid of the remaining bodies, spawn point if none.
    Vector2d getCenterPosition() const;

    // Last mouth-flagged body, falling back to the last body.
    std::optional<BodyId> getMouthBody() const;
    // First heart-flagged body, falling back to the first body.
    std::optional<BodyId> getHeartBody() const;

    std::vector<BodyId> getGripperBodies() const;
    std::vector<SegmentState> getSegmentStates() const;

    // True while every body this creature registered is still in the world.
    bool isInWorld() const;

    // Remove bodies and constraints from the world now instead of at destruction.
    void detachFromWorld();

    bool isAlive() const { return state_ == CreatureState::Alive; }
    bool canDestroy() const { return canDestroy_; }
    void markDestructible() { canDestroy_ = true; }

    CreatureId getId() const { return id_; }
    const PhysicsWorld& getWorld() const { return world_; }
    const std::shared_ptr<Genome>& getGenome() const { return genome_; }
    void setGenome(std::shared_ptr<Genome> genome);

    CreatureState getState() const { return state_; }
    DeathCause getDeathCause() const { return deathCause_; }
    double getFood() const { return food_; }
    double getHealth() const { return health_; }
    double getAge() const { return age_; }
    double getSimTime() const { return simTime_; }
    double getFadeAlpha() const { return fadeAlpha_; }
    double getDamageDealt() const { return damageDealt_; }
    double getDamageTaken() const { return damageTaken_; }
    int getKills() const { return kills_; }
    int getPowerUpsCollected() const { return powerUpsCollected_; }
    double getLastReproductionTime() const { return lastReproductionTime_; }
    const Vector2d& getSpawnPosition() const { return spawnPosition_; }
    const std::vector<double>& getSensorActivations() const { return sensorActivations_; }
    const std::vector<double>& getMemory() const { return memory_; }
    const std::vector<SegmentBody>& getBodies() const { return bodies_; }
    const std::vector<JointMotor>& getJointMotors() const { return motors_; }

    void setFood(double food) { food_ = food; }
    void setHealth(double health) { health_ = health; }
    void setAge(double age) { age_ = age; }
    void setLastReproductionTime(double time) { lastReproductionTime_ = time; }
    void recordPowerUpCollected() { powerUpsCollected_++; }

private:
    void build();
    void pruneInvalidJoints();
    void updateSensors();
    double readSensor(const Sensor& sensor) const;
    void modulateMotors();
    void updateMotors();
    void updateStickyFeet();
    void updateMemory();
    void updateFade(double dt);

    CreatureId id_;
    std::shared_ptr<Genome> genome_;
    PhysicsWorld& world_;
    EventSink* events_;
    Vector2d spawnPosition_;

    std::vector<SegmentBody> bodies_;
    std::vector<JointMotor> motors_;
    std::vector<const Creature*> visible_;
    std::vector<double> sensorActivations_;
    std::vector<double> memory_;

    CreatureState state_ = CreatureState::Alive;
    DeathCause deathCause_ = DeathCause::None;
    double food_ = InitialVitals;
    double health_ = InitialVitals;
    double age_ = 0.0;
    double simTime_ = 0.0;
    double deathTime_ = 0.0;
    double fadeAlpha_ = 1.0;
    bool canDestroy_ = false;
    double lastReproductionTime_ = 0.0;
    double damageDealt_ = 0.0;
    double damageTaken_ = 0.0;
    int kills_ = 0;
    int powerUpsCollected_ = 0;
};

} // namespace Biomorph
