#pragma once

#include <functional>
#include <string>
#include <vector>
#include "types.hpp"
#include "../data/seen_store.hpp"
#include "../notification/notification_dispatcher.hpp"
#include "../source/source_adapter.hpp"
#include "../utils/config_types.hpp"

namespace webhunter {

class AppState;

// One poll cycle for one source: fetch, diff against the store, deliver new
// listings in adapter order and commit each seen-mark right after its
// terminal delivery outcome. Never throws for adapter or delivery faults;
// those end up in the CycleReport.
class SourceWorker {
public:
    using StateObserver = std::function<void(SourceState)>;

    SourceWorker(SourceAdapter& adapter,
                 SeenStore& store,
                 NotificationDispatcher& dispatcher,
                 const AppState* app_state = nullptr);

    CycleReport run_cycle(const SourceConfig& config);

    // Records every unseen candidate as SEEDED without notifying
    CycleReport seed(const SourceConfig& config);

    void set_state_observer(StateObserver observer);

private:
    bool fetch_candidates(const SourceConfig& config, std::vector<Listing>& candidates, CycleReport& report);
    std::vector<Listing> select_new(const SourceConfig& config, std::vector<Listing>& candidates) const;
    void publish(SourceState state) const;
    bool stop_requested() const;

    SourceAdapter& adapter_;
    SeenStore& store_;
    NotificationDispatcher& dispatcher_;
    const AppState* app_state_;
    StateObserver observer_;
};

} // namespace webhunter
