#include "defs/weapon_stats.hpp"

#include <array>
#include <utility>

namespace salvo::defs {

namespace {

constexpr std::array<std::pair<ArchetypeKind, const char*>, 11> KIND_NAMES{{
    {ArchetypeKind::Projectile, "projectile"},
    {ArchetypeKind::Slash, "slash"},
    {ArchetypeKind::Chain, "chain"},
    {ArchetypeKind::ChainThrow, "chainThrow"},
    {ArchetypeKind::Cluster, "cluster"},
    {ArchetypeKind::Burst, "burst"},
    {ArchetypeKind::Ballistic, "ballistic"},
    {ArchetypeKind::Bazooka, "bazooka"},
    {ArchetypeKind::Circular, "circular"},
    {ArchetypeKind::Cross, "cross"},
    {ArchetypeKind::Strike, "strike"},
}};

} // namespace

const char* archetype_kind_name(ArchetypeKind kind) {
    for (const auto& [k, name] : KIND_NAMES) {
        if (k == kind) return name;
    }
    return "unknown";
}

std::optional<ArchetypeKind> parse_archetype_kind(std::string_view name) {
    for (const auto& [k, kind_name] : KIND_NAMES) {
        if (name == kind_name) return k;
    }
    return std::nullopt;
}

ArchetypeKind archetype_kind_of(const ArchetypeStats& stats) {
    // Variant alternatives are declared in ArchetypeKind order
    return static_cast<ArchetypeKind>(stats.index());
}

ArchetypeStats default_archetype_stats(ArchetypeKind kind) {
    switch (kind) {
    case ArchetypeKind::Projectile: return ProjectileArchetype{};
    case ArchetypeKind::Slash: return SlashArchetype{};
    case ArchetypeKind::Chain: return ChainArchetype{};
    case ArchetypeKind::ChainThrow: return ChainThrowArchetype{};
    case ArchetypeKind::Cluster: return ClusterArchetype{};
    case ArchetypeKind::Burst: return BurstArchetype{};
    case ArchetypeKind::Ballistic: return BallisticArchetype{};
    case ArchetypeKind::Bazooka: return BazookaArchetype{};
    case ArchetypeKind::Circular: return CircularArchetype{};
    case ArchetypeKind::Cross: return CrossArchetype{};
    case ArchetypeKind::Strike: return StrikeArchetype{};
    }
    return ProjectileArchetype{};
}

} // namespace salvo::defs
