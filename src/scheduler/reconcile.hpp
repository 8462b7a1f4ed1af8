#pragma once

#include <string>

#include "scheduler/dispatcher.hpp"
#include "scheduler/schedule_registry.hpp"

namespace filecron::scheduler {

enum class AdmissionAction {
    kSkip,
    kFireNow,
    kSchedule
};

struct AdmissionDecision {
    AdmissionAction action = AdmissionAction::kSkip;
    // The registry holds an older revision of this task whose timer must go first.
    bool cancel_existing = false;
};

// Discovery of a valid record, as a function of what the registry already holds.
AdmissionDecision DecideAdmission(const ScheduledEntry* existing,
                                  bool firing,
                                  const std::string& revision,
                                  Clock::time_point due,
                                  Clock::time_point now);

enum class ChangeAction {
    kDiscover,
    kCancel,
    kIgnore
};

// A notification only says "look at this name again".
ChangeAction DecideChange(bool file_exists, bool has_pending_entry);

const char* ToString(AdmissionAction action);
const char* ToString(ChangeAction action);

}  // namespace filecron::scheduler
