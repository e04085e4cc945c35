#include "piestack/events.hpp"

namespace ps {

const char* sound_name(SoundCue cue) {
    switch (cue) {
    case SoundCue::EnemyHit: return "enemy_hit";
    case SoundCue::EnemyDeath: return "enemy_death";
    case SoundCue::PlayerHit: return "player_hit";
    case SoundCue::PlayerShoot: return "player_shoot";
    case SoundCue::BossHit: return "boss_hit";
    case SoundCue::PowerUp: return "powerup";
    }
    return "unknown";
}

} // namespace ps
