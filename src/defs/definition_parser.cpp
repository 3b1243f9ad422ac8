#include "defs/definition_parser.hpp"
#include "lua/table_reader.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace salvo::defs {

namespace {

using lua::TableReader;

constexpr f64 INF = std::numeric_limits<f64>::infinity();

template <typename T>
void read_f32(TableReader& t, const char* field, T& out, f64 lo = -INF,
              f64 hi = INF) {
    if (auto v = t.number_in(field, lo, hi)) out = static_cast<T>(*v);
}

void read_i32(TableReader& t, const char* field, i32& out, f64 lo = 0,
              f64 hi = 1e6) {
    if (auto v = t.number_in(field, lo, hi)) {
        if (*v != std::floor(*v)) {
            t.fail(std::string("field '") + field + "' must be an integer");
            return;
        }
        out = static_cast<i32>(*v);
    }
}

void read_bool(TableReader& t, const char* field, bool& out) {
    if (auto v = t.boolean(field)) out = *v;
}

void parse_cadence(TableReader& t, CadenceStats& c) {
    if (!t.has("delayMs")) t.fail("missing required field 'delayMs'");
    read_f32(t, "delayMs", c.delay_ms, 0);
    read_f32(t, "warmupMs", c.warmup_ms, 0);
    read_i32(t, "salvo", c.salvo, 1, 64);
    read_f32(t, "spreadDeg", c.spread_deg, 0, 360);
    read_f32(t, "salvoSpacingMs", c.salvo_spacing_ms, 0);
}

void parse_targeting(TableReader& t, TargetingStats& tg) {
    if (auto mode = t.string("mode")) {
        if (*mode == "nearest") tg.mode = TargetingMode::Nearest;
        else if (*mode == "self") tg.mode = TargetingMode::Self;
        else if (*mode == "facing") tg.mode = TargetingMode::Facing;
        else t.fail("unknown targeting mode '" + *mode + "'");
    }
    read_f32(t, "range", tg.range, 0);
}

void parse_damage(TableReader& t, DamageStats& d) {
    if (!t.has("base")) t.fail("missing required field 'base'");
    read_f32(t, "base", d.base, 0);
    t.table("crit", [&](TableReader& c) {
        read_f32(c, "chance", d.crit.chance, 0, 1);
        read_f32(c, "mult", d.crit.mult, 0);
    });
}

void parse_explosion(TableReader& t, ExplosionStats& e) {
    read_f32(t, "radius", e.radius, 0);
    read_f32(t, "damageMult", e.damage_mult, 0);
    read_i32(t, "maxTargets", e.max_targets);
    read_f32(t, "falloff", e.falloff, 0);
}

void parse_projectile(TableReader& t, ProjectileStats& p) {
    read_f32(t, "speed", p.speed, 0);
    read_i32(t, "pierce", p.pierce);
    read_f32(t, "lifetimeMs", p.lifetime_ms, 0);
    read_f32(t, "maxDistance", p.max_distance, 0);
    read_f32(t, "gravity", p.gravity);
    read_f32(t, "acceleration", p.acceleration);
    read_bool(t, "rotateToVelocity", p.rotate_to_velocity);
    read_i32(t, "poolSize", p.pool_size, 1, 4096);
    read_f32(t, "hitRadius", p.hit_radius, 0);
    t.table("explosion", [&](TableReader& e) {
        ExplosionStats explosion;
        parse_explosion(e, explosion);
        p.explosion = explosion;
    });
}

void parse_aoe(TableReader& t, AoeStats& a) {
    // An aoe block is enabled unless it says otherwise
    a.enabled = true;
    read_bool(t, "enabled", a.enabled);
    read_f32(t, "radius", a.radius, 0);
    read_f32(t, "damageMult", a.damage_mult, 0);
    read_i32(t, "maxTargets", a.max_targets);
    read_f32(t, "falloff", a.falloff, 0);
    read_f32(t, "delayMs", a.delay_ms, 0);
    if (auto timing = t.string("timing")) {
        if (*timing == "impact") a.timing = AoeTiming::Impact;
        else if (*timing == "animation") a.timing = AoeTiming::Animation;
        else t.fail("unknown aoe timing '" + *timing + "'");
    }
}

void parse_cluster(TableReader& t, ClusterArchetype& c) {
    read_i32(t, "count", c.count);
    read_f32(t, "spreadRadius", c.spread_radius, 0);
    read_f32(t, "staggerMs", c.stagger_ms, 0);
}

struct ArchetypeParser {
    TableReader& t;

    void operator()(ProjectileArchetype&) {}
    void operator()(StrikeArchetype&) {}

    void operator()(SlashArchetype& s) {
        read_f32(t, "offsetPx", s.offset_px);
        read_f32(t, "lengthPx", s.length_px, 0);
        read_f32(t, "arcDeg", s.arc_deg, 0, 360);
        read_f32(t, "hitDelayMs", s.hit_delay_ms, 0);
        read_bool(t, "followOwner", s.follow_owner);
    }
    void operator()(ChainArchetype& c) {
        read_i32(t, "maxHops", c.max_hops);
        read_f32(t, "hopRadius", c.hop_radius, 0);
        read_f32(t, "falloffPerHop", c.falloff_per_hop, 0, 1);
    }
    void operator()(ChainThrowArchetype& c) {
        read_i32(t, "maxHops", c.max_hops);
        read_f32(t, "hopRadius", c.hop_radius, 0);
        read_f32(t, "falloffPerHop", c.falloff_per_hop, 0, 1);
        read_f32(t, "perHopDurationMs", c.per_hop_duration_ms, 1);
    }
    void operator()(ClusterArchetype& c) { parse_cluster(t, c); }
    void operator()(BurstArchetype& b) {
        read_i32(t, "count", b.count, 1, 256);
        read_f32(t, "spreadDeg", b.spread_deg, 0, 360);
        read_f32(t, "staggerMs", b.stagger_ms, 0);
        read_f32(t, "baseAngleDeg", b.base_angle_deg);
        if (auto pattern = t.string("pattern")) {
            if (*pattern == "spread") b.pattern = BurstPattern::Spread;
            else if (*pattern == "ring") b.pattern = BurstPattern::Ring;
            else t.fail("unknown burst pattern '" + *pattern + "'");
        }
    }
    void operator()(BallisticArchetype& b) {
        read_f32(t, "launchAngleDeg", b.launch_angle_deg, -180, 180);
        read_f32(t, "launchSpeed", b.launch_speed, 0);
        read_f32(t, "gravity", b.gravity);
    }
    void operator()(BazookaArchetype& b) {
        read_f32(t, "detonateSeconds", b.detonate_seconds, 0);
        read_f32(t, "tickMs", b.tick_ms, 1);
        t.table("cluster", [&](TableReader& c) { parse_cluster(c, b.cluster); });
    }
    void operator()(CircularArchetype& c) {
        read_f32(t, "radius", c.radius, 0);
        read_f32(t, "angularVelocity", c.angular_velocity);
        read_bool(t, "clockwise", c.clockwise);
        read_i32(t, "count", c.count, 1, 64);
        read_f32(t, "startPhase", c.start_phase);
        read_f32(t, "rehitIntervalMs", c.rehit_interval_ms, 0);
    }
    void operator()(CrossArchetype& c) {
        read_f32(t, "stepPxPerFrame", c.step_px_per_frame, 0);
        read_i32(t, "steps", c.steps, 1, 1000);
        read_f32(t, "frameMs", c.frame_ms, 1);
        if (auto axis = t.string("startAxis")) {
            if (*axis == "h") c.start_axis = CrossAxis::Horizontal;
            else if (*axis == "v") c.start_axis = CrossAxis::Vertical;
            else t.fail("unknown cross axis '" + *axis + "'");
        }
    }
};

void parse_modifier(TableReader& t, std::vector<Modifier>& out) {
    auto op = t.string("op");
    auto path = t.string("path");
    auto value = t.number("value");
    if (!op || !path || !value) {
        t.fail("modifier requires op, path and value");
        return;
    }
    auto parsed_op = parse_modifier_op(*op);
    auto parsed_path = parse_stat_path(*path);
    if (!parsed_op) {
        t.fail("unknown modifier op '" + *op + "'");
        return;
    }
    if (!parsed_path) {
        t.fail("unknown modifier path '" + *path + "'");
        return;
    }
    out.push_back(Modifier{*parsed_op, *parsed_path, static_cast<f32>(*value)});
}

void parse_level(TableReader& t, LevelSpec& spec) {
    // Group tables are read in field-table order; each group is visited once.
    const auto& fields = level_fields();
    for (size_t i = 0; i < fields.size();) {
        const char* group = fields[i].group;
        size_t end = i;
        while (end < fields.size() &&
               std::string_view(fields[end].group) == group) {
            end++;
        }
        t.table(group, [&](TableReader& g) {
            for (size_t f = i; f < end; f++) {
                if (auto v = g.number(fields[f].name)) {
                    spec.set(fields[f].field, static_cast<f32>(*v));
                }
            }
        });
        i = end;
    }
}

} // namespace

Result<WeaponDefinition> parse_weapon_definition(lua_State* L, int index) {
    TableReader t(L, index, "WeaponDefinition");
    WeaponDefinition def;

    auto key = t.string("key");
    if (!key || key->empty()) {
        return Error(ErrorKind::InvalidDefinition,
                     "WeaponDefinition: missing required field 'key'");
    }
    def.key = *key;
    t.set_context("weapon '" + def.key + "'");
    def.name = t.string("name").value_or(def.key);

    auto kind_name = t.string("kind");
    std::optional<ArchetypeKind> kind;
    if (!kind_name) {
        t.fail("missing required field 'kind'");
    } else if (!(kind = parse_archetype_kind(*kind_name))) {
        t.fail("unknown archetype kind '" + *kind_name + "'");
    }
    def.base.archetype = default_archetype_stats(kind.value_or(ArchetypeKind::Projectile));

    if (!t.table("cadence", [&](TableReader& c) { parse_cadence(c, def.base.cadence); }))
        t.fail("missing required field 'cadence'");
    t.table("targeting", [&](TableReader& g) { parse_targeting(g, def.base.targeting); });
    if (!t.table("damage", [&](TableReader& d) { parse_damage(d, def.base.damage); }))
        t.fail("missing required field 'damage'");
    t.table("projectile", [&](TableReader& p) { parse_projectile(p, def.base.projectile); });
    t.table("aoe", [&](TableReader& a) { parse_aoe(a, def.base.aoe); });
    t.table("archetype", [&](TableReader& a) {
        std::visit(ArchetypeParser{a}, def.base.archetype);
    });
    t.each_element("modifiers", [&](TableReader& m) { parse_modifier(m, def.base_modifiers); });

    i32 highest_level = 1;
    t.each_indexed("progression", [&](i32 level, TableReader& entry) {
        if (level < 2) {
            entry.fail("progression levels start at 2");
            return;
        }
        parse_level(entry, def.progression[level]);
        highest_level = std::max(highest_level, level);
    });

    def.max_level = highest_level;
    if (auto max_level = t.number_in("maxLevel", 1, 100)) {
        def.max_level = static_cast<i32>(*max_level);
        if (highest_level > def.max_level) {
            t.fail("progression defines levels above maxLevel");
        }
    }

    if (auto result = t.finish(); !result) {
        return result.error();
    }
    return def;
}

} // namespace salvo::defs
