#include "Damage.h"

#include <algorithm>

namespace Bulwark::Gameplay {

float calculateDamage(float baseDamage, float armor, float multiplier) {
    return std::max(kMinimumDamage, baseDamage * multiplier - armor);
}

float applyArmorReduction(float damage, float armor, DamageType type) {
    if (!damageUsesArmor(type)) {
        return std::max(kMinimumDamage, damage);
    }
    return std::max(kMinimumDamage, damage - armor);
}

float calculateCriticalDamage(float baseDamage, float critMultiplier) { return baseDamage * critMultiplier; }

bool rollCritical(float critChance, std::mt19937& rng) {
    if (critChance <= 0.0f) return false;
    if (critChance >= 1.0f) return true;
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    return dist(rng) < critChance;
}

CritResult calculateDamageWithCrit(float baseDamage, float armor, float critChance, float critMultiplier,
                                   DamageType type, std::mt19937& rng) {
    CritResult result;
    result.isCritical = rollCritical(critChance, rng);
    const float scaled = result.isCritical ? calculateCriticalDamage(baseDamage, critMultiplier) : baseDamage;
    result.damage = applyArmorReduction(scaled, armor, type);
    return result;
}

std::string_view toString(DamageType type) {
    switch (type) {
        case DamageType::Physical:
            return "Physical";
        case DamageType::Magic:
            return "Magic";
        case DamageType::True:
        default:
            return "True";
    }
}

std::optional<DamageType> parseDamageType(std::string_view text) {
    if (text == "Physical") return DamageType::Physical;
    if (text == "Magic") return DamageType::Magic;
    if (text == "True") return DamageType::True;
    return std::nullopt;
}

}  // namespace Bulwark::Gameplay
