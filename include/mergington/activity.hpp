#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace mergington {

/// An extracurricular activity and its roster.
struct Activity {
    std::string name;
    std::string description;
    std::string schedule;
    int32_t max_participants = 0;
    std::vector<std::string> participants;

    bool has_participant(const std::string& email) const {
        return std::find(participants.begin(), participants.end(), email) != participants.end();
    }

    bool is_full() const {
        return static_cast<int64_t>(participants.size()) >= max_participants;
    }
};

} // namespace mergington
