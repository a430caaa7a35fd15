#pragma once

#include "core/StrongType.h"

namespace Biomorph {

using CreatureId = StrongType<struct CreatureIdTag>;

enum class CreatureState { Alive, Dead };

enum class DeathCause {
    None,
    Starvation,
    Combat,  // Health drained by blunt impacts.
    Eaten,   // Mouth reached the heart.
    Evicted, // Removed after an update failure or world recovery.
};

inline const char* toString(DeathCause cause)
{
    switch (cause) {
        case DeathCause::None:
            return "none";
        case DeathCause::Starvation:
            return "starvation";
        case DeathCause::Combat:
            return "combat";
        case DeathCause::Eaten:
            return "eaten";
        case DeathCause::Evicted:
            return "evicted";
    }
    return "none";
}

} // namespace Biomorph
