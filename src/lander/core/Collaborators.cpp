/**
 * Collaborators.cpp
 */

#include "Collaborators.h"

namespace Lander {

const char* effectKindName(EffectKind kind) {
    switch (kind) {
        case EffectKind::Explosion: return "explosion";
        case EffectKind::BombExplosion: return "bomb_explosion";
        case EffectKind::Shockwave: return "shockwave";
        case EffectKind::WaterSplash: return "water_splash";
        case EffectKind::SinkBubbles: return "sink_bubbles";
        case EffectKind::SharkGulp: return "shark_gulp";
        case EffectKind::CoughBubbles: return "cough_bubbles";
        case EffectKind::BurpBubbles: return "burp_bubbles";
        case EffectKind::ToxicFumes: return "toxic_fumes";
        case EffectKind::OilBurst: return "oil_burst";
        case EffectKind::ProjectileBurst: return "projectile_burst";
        case EffectKind::Debris: return "debris";
        case EffectKind::LightningWarning: return "lightning_warning";
        case EffectKind::LightningBolt: return "lightning_bolt";
        default: return "unknown";
    }
}

} // namespace Lander
