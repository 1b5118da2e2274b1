#include "storq/changes.hpp"
#include "storq/log.hpp"
#include <vector>

namespace storq {

bool change_event::affects_any_of(const table_set& tables) const {
    // Both sides are ordered: walk them together
    auto a = affected_tables.begin();
    auto b = tables.begin();
    while (a != affected_tables.end() && b != tables.end()) {
        if (*a < *b) {
            ++a;
        } else if (*b < *a) {
            ++b;
        } else {
            return true;
        }
    }
    return false;
}

notification_token change_notifier::subscribe(table_set tables, callback_t callback) {
    observer_id id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_observer_id_++;
        observers_[id] = registration{std::move(tables), std::make_shared<callback_t>(std::move(callback))};
    }
    LOG_DEBUG("changes", "Observer %llu registered", static_cast<unsigned long long>(id));

    return notification_token([weak = weak_from_this(), id] {
        if (auto self = weak.lock()) {
            self->remove(id);
        }
    });
}

void change_notifier::remove(observer_id id) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(id);
    LOG_DEBUG("changes", "Observer %llu removed", static_cast<unsigned long long>(id));
}

void change_notifier::notify(const change_event& event) {
    if (event.affected_tables.empty()) return;

    // Collect matching callbacks, then dispatch without holding the lock
    std::vector<std::shared_ptr<callback_t>> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, reg] : observers_) {
            if (event.affects_any_of(reg.tables)) {
                callbacks.push_back(reg.callback);
            }
        }
    }

    LOG_DEBUG("changes", "Change in %zu table(s) matched %zu observer(s)",
              event.affected_tables.size(), callbacks.size());

    for (const auto& cb : callbacks) {
        (*cb)(event);
    }
}

size_t change_notifier::observer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return observers_.size();
}

} // namespace storq
