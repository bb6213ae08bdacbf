#include "CombatConfig.h"

namespace Defense {

std::string_view toString(ETargetPriority priority) {
    switch (priority) {
        case ETargetPriority::First:
            return "First";
        case ETargetPriority::Nearest:
            return "Nearest";
        case ETargetPriority::Strongest:
            return "Strongest";
        case ETargetPriority::Weakest:
            return "Weakest";
        case ETargetPriority::Fastest:
        default:
            return "Fastest";
    }
}

std::optional<ETargetPriority> parsePriority(std::string_view text) {
    if (text == "First") return ETargetPriority::First;
    if (text == "Nearest") return ETargetPriority::Nearest;
    if (text == "Strongest") return ETargetPriority::Strongest;
    if (text == "Weakest") return ETargetPriority::Weakest;
    if (text == "Fastest") return ETargetPriority::Fastest;
    return std::nullopt;
}

}  // namespace Defense
