#pragma once

#include "types.hpp"
#include "observation.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace storq {

/// One committed change, described by the tables it touched.
struct change_event {
    table_set affected_tables;

    [[nodiscard]] bool affects_any_of(const table_set& tables) const;

    bool operator==(const change_event& other) const { return affected_tables == other.affected_tables; }
    bool operator!=(const change_event& other) const { return !(*this == other); }
};

// ============================================================================
// change_notifier - table-filtered fan-out of change events
// ============================================================================
//
// A registration receives every event whose affected tables intersect its
// table set. Callbacks run on the notifying thread, outside the registry
// lock, in registration order; a callback may subscribe or unsubscribe.

class change_notifier : public std::enable_shared_from_this<change_notifier> {
public:
    using observer_id = uint64_t;
    using callback_t = std::function<void(const change_event&)>;

    /// Register for events touching any of `tables`. An empty set never
    /// matches. The registration lives as long as the returned token.
    [[nodiscard]] notification_token subscribe(table_set tables, callback_t callback);

    /// Deliver an event to every matching registration. Events with no
    /// affected tables are ignored.
    void notify(const change_event& event);

    /// Number of live registrations.
    [[nodiscard]] size_t observer_count() const;

private:
    struct registration {
        table_set tables;
        std::shared_ptr<callback_t> callback;
    };

    void remove(observer_id id);

    mutable std::mutex mutex_;
    observer_id next_observer_id_ = 1;
    std::map<observer_id, registration> observers_;
};

} // namespace storq
