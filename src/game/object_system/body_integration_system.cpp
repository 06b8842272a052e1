/// @file body_integration_system.cpp
/// @brief BodyIntegrationSystem implementation.

#include "gpk/game/body_integration_system.hpp"

#include "gpk/ecs/query.hpp"

namespace gpk::game {

BodyIntegrationSystem::BodyIntegrationSystem(ecs::ComponentStorage<Transform>& transforms,
                                             ecs::ComponentStorage<RigidBody>& bodies)
    : transforms_(transforms), bodies_(bodies) {}

void BodyIntegrationSystem::Execute(float deltaTime) {
    ecs::Query<RigidBody, Transform> query(bodies_, transforms_);

    query.ForEach([deltaTime](ecs::Entity /*entity*/, RigidBody& body, Transform& transform) {
        transform.position += body.velocity * deltaTime;
    });
}

} // namespace gpk::game
