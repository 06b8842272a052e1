/// @file system_scheduler.cpp
/// @brief SystemScheduler: Kahn ordering per stage and staged execution.

#include "gpk/ecs/system_scheduler.hpp"

#include <algorithm>
#include <cassert>

namespace gpk::ecs {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

// ── Dependencies ────────────────────────────────────────────────────────

bool SystemScheduler::AddDependency(SystemTypeId before, SystemTypeId after) {
    auto b = systems_.find(before);
    auto a = systems_.find(after);
    if (b == systems_.end() || a == systems_.end()) {
        return false;
    }
    if (b->second.stage != a->second.stage) {
        return false;
    }
    edges_[before].push_back(after);
    built_ = false;
    return true;
}

// ── Enable / disable ────────────────────────────────────────────────────

void SystemScheduler::SetEnabled(SystemTypeId system, bool enabled) {
    auto it = systems_.find(system);
    if (it != systems_.end()) {
        it->second.enabled = enabled;
    }
}

bool SystemScheduler::IsEnabled(SystemTypeId system) const {
    auto it = systems_.find(system);
    return it != systems_.end() && it->second.enabled;
}

// ── Build ───────────────────────────────────────────────────────────────

GameResult<void> SystemScheduler::Build() {
    for (std::size_t s = 0; s < kSystemStageCount; ++s) {
        const auto stage = static_cast<SystemStage>(s);

        std::vector<SystemTypeId> ids;
        for (const auto& [id, entry] : systems_) {
            if (entry.stage == stage) {
                ids.push_back(id);
            }
        }
        std::sort(ids.begin(), ids.end(), [this](SystemTypeId l, SystemTypeId r) {
            return systems_.at(l).registrationIndex < systems_.at(r).registrationIndex;
        });

        std::unordered_map<SystemTypeId, std::size_t> inDegree;
        for (auto id : ids) {
            inDegree[id] = 0;
        }
        for (auto id : ids) {
            auto e = edges_.find(id);
            if (e == edges_.end()) {
                continue;
            }
            for (auto next : e->second) {
                ++inDegree[next];
            }
        }

        // Repeatedly take the earliest-registered ready system.
        std::vector<SystemTypeId> sorted;
        sorted.reserve(ids.size());
        std::vector<bool> taken(ids.size(), false);
        while (sorted.size() < ids.size()) {
            bool progressed = false;
            for (std::size_t i = 0; i < ids.size(); ++i) {
                if (taken[i] || inDegree[ids[i]] != 0) {
                    continue;
                }
                taken[i] = true;
                sorted.push_back(ids[i]);
                auto e = edges_.find(ids[i]);
                if (e != edges_.end()) {
                    for (auto next : e->second) {
                        --inDegree[next];
                    }
                }
                progressed = true;
                break;
            }

            if (!progressed) {
                std::string names;
                for (std::size_t i = 0; i < ids.size(); ++i) {
                    if (taken[i]) {
                        continue;
                    }
                    if (!names.empty()) {
                        names += ", ";
                    }
                    names += systems_.at(ids[i]).instance->GetName();
                }
                return GameResult<void>::err(GameError(
                    ErrorCode::CircularDependency, "circular system dependency: " + names));
            }
        }

        order_[s] = std::move(sorted);
    }

    built_ = true;
    return GameResult<void>::ok();
}

// ── Execution ───────────────────────────────────────────────────────────

void SystemScheduler::Execute(float deltaTime) {
    assert(built_ && "SystemScheduler::Build() must succeed before Execute()");

    for (const auto& stageOrder : order_) {
        for (auto id : stageOrder) {
            auto& entry = systems_.at(id);
            if (entry.enabled) {
                entry.instance->Execute(deltaTime);
            }
        }
    }
}

} // namespace gpk::ecs
