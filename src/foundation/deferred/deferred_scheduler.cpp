/// @file deferred_scheduler.cpp
/// @brief DeferredScheduler implementation.

#include "gpk/foundation/deferred_scheduler.hpp"

#include <vector>

namespace gpk::foundation {

GameResult<DeferredScheduler::ActionId> DeferredScheduler::schedule(double delaySeconds,
                                                                    Action action) {
    if (delaySeconds < 0.0) {
        return GameResult<ActionId>::err(
            GameError(ErrorCode::InvalidArgument, "deferred action delay must not be negative"));
    }
    if (!action) {
        return GameResult<ActionId>::err(
            GameError(ErrorCode::InvalidArgument, "deferred action is empty"));
    }

    const auto id = nextId_++;
    const double fireAt = now_ + delaySeconds;
    actions_.emplace(Key{fireAt, id}, std::move(action));
    fireTimes_.emplace(id, fireAt);
    return GameResult<ActionId>::ok(id);
}

GameResult<void> DeferredScheduler::cancel(ActionId id) {
    auto it = fireTimes_.find(id);
    if (it == fireTimes_.end()) {
        return GameResult<void>::err(
            GameError(ErrorCode::JobNotFound, "no pending deferred action " + std::to_string(id)));
    }
    actions_.erase(Key{it->second, id});
    fireTimes_.erase(it);
    return GameResult<void>::ok();
}

void DeferredScheduler::advance(double deltaSeconds) {
    if (deltaSeconds > 0.0) {
        now_ += deltaSeconds;
    }

    // Collect first: an action may schedule or cancel others.
    std::vector<ActionId> due;
    for (const auto& [key, action] : actions_) {
        if (key.first > now_) {
            break;
        }
        due.push_back(key.second);
    }

    for (auto id : due) {
        auto it = fireTimes_.find(id);
        if (it == fireTimes_.end()) {
            continue;  // cancelled by an earlier action
        }
        auto node = actions_.extract(Key{it->second, id});
        fireTimes_.erase(it);
        node.mapped()();
    }
}

void DeferredScheduler::clear() {
    actions_.clear();
    fireTimes_.clear();
}

}  // namespace gpk::foundation
