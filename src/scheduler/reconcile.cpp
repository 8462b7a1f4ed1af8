#include "scheduler/reconcile.hpp"

namespace filecron::scheduler {

AdmissionDecision DecideAdmission(const ScheduledEntry* existing,
                                  bool firing,
                                  const std::string& revision,
                                  Clock::time_point due,
                                  Clock::time_point now) {
    AdmissionDecision decision{};
    if (firing) {
        return decision;
    }
    if (existing != nullptr) {
        if (existing->revision == revision) {
            return decision;
        }
        decision.cancel_existing = true;
    }
    decision.action = due <= now ? AdmissionAction::kFireNow : AdmissionAction::kSchedule;
    return decision;
}

ChangeAction DecideChange(bool file_exists, bool has_pending_entry) {
    if (file_exists) {
        return ChangeAction::kDiscover;
    }
    return has_pending_entry ? ChangeAction::kCancel : ChangeAction::kIgnore;
}

const char* ToString(AdmissionAction action) {
    switch (action) {
        case AdmissionAction::kSkip: return "skip";
        case AdmissionAction::kFireNow: return "fire_now";
        case AdmissionAction::kSchedule: return "schedule";
    }
    return "unknown";
}

const char* ToString(ChangeAction action) {
    switch (action) {
        case ChangeAction::kDiscover: return "discover";
        case ChangeAction::kCancel: return "cancel";
        case ChangeAction::kIgnore: return "ignore";
    }
    return "unknown";
}

}  // namespace filecron::scheduler
