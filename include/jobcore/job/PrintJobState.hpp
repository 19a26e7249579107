#pragma once

#include <string>

namespace jobcore::job {
    enum class JobState {
        Idle,
        Processing,
        Done,
        Cancelled,
        Failed
    };

    inline bool isTerminal(JobState state) {
        return state == JobState::Done || state == JobState::Cancelled || state == JobState::Failed;
    }

    inline std::string jobStateToString(JobState state) {
        switch (state) {
            case JobState::Idle: return "Idle";
            case JobState::Processing: return "Processing";
            case JobState::Done: return "Done";
            case JobState::Cancelled: return "Cancelled";
            case JobState::Failed: return "Failed";
            default: return "Unknown";
        }
    }
}
