#include "krep/domain/Catalog.hpp"
#include "krep/config/Config.hpp"
#include "krep/core/Error.hpp"
#include "krep/infra/Log.hpp"

#include <algorithm>

namespace krep {

const MicrodoseDefinition* Catalog::findDefinition(const std::string& id) const {
    auto it = microdoses.find(id);
    return it == microdoses.end() ? nullptr : &it->second;
}

const Movement* Catalog::findMovement(const std::string& id) const {
    auto it = movements.find(id);
    return it == movements.end() ? nullptr : &it->second;
}

std::vector<const MicrodoseDefinition*> Catalog::definitionsIn(MicrodoseCategory c) const {
    std::vector<const MicrodoseDefinition*> out;
    for (const auto& [id, def] : microdoses) {
        if (def.category == c) out.push_back(&def);
    }
    std::sort(out.begin(), out.end(),
              [](const MicrodoseDefinition* a, const MicrodoseDefinition* b) {
                  return a->id < b->id;
              });
    return out;
}

std::vector<std::string> Catalog::validate() const {
    std::vector<std::string> errors;

    for (const auto& [key, m] : movements) {
        if (key.empty() || m.id.empty()) {
            errors.push_back("movement has empty id");
        }
        if (key != m.id) {
            errors.push_back("movement key '" + key + "' does not match id '" + m.id + "'");
        }
        if (m.name.empty()) {
            errors.push_back("movement '" + key + "' has empty name");
        }
    }

    for (const auto& [key, def] : microdoses) {
        if (key.empty() || def.id.empty()) {
            errors.push_back("microdose definition has empty id");
        }
        if (key != def.id) {
            errors.push_back("microdose key '" + key + "' does not match id '" + def.id + "'");
        }
        if (def.name.empty()) {
            errors.push_back("microdose '" + key + "' has empty name");
        }
        if (def.blocks.empty()) {
            errors.push_back("microdose '" + key + "' has no blocks");
        }

        for (const auto& block : def.blocks) {
            if (movements.find(block.movement_id) == movements.end()) {
                errors.push_back("microdose '" + key + "' references unknown movement '" +
                                 block.movement_id + "'");
            }

            for (const auto& metric : block.metrics) {
                if (metric.type == MetricSpec::Type::REPS) {
                    if (metric.min > metric.max) {
                        errors.push_back("microdose '" + key + "': min reps " +
                                         std::to_string(metric.min) + " > max " +
                                         std::to_string(metric.max));
                    }
                    if (metric.default_reps < metric.min) {
                        errors.push_back("microdose '" + key + "': default reps " +
                                         std::to_string(metric.default_reps) + " < min " +
                                         std::to_string(metric.min));
                    }
                    if (metric.default_reps > metric.max) {
                        errors.push_back("microdose '" + key + "': default reps " +
                                         std::to_string(metric.default_reps) + " > max " +
                                         std::to_string(metric.max));
                    }
                } else if (metric.default_band.empty()) {
                    errors.push_back("microdose '" + key + "': band metric has empty default");
                }
            }
        }
    }

    for (auto c : {MicrodoseCategory::VO2, MicrodoseCategory::GTG, MicrodoseCategory::MOBILITY}) {
        bool any = std::any_of(microdoses.begin(), microdoses.end(),
                               [c](const auto& kv) { return kv.second.category == c; });
        if (!any) {
            errors.push_back(std::string("catalog has no ") + toString(c) + " microdoses");
        }
    }

    return errors;
}

// ---------------------------------------------------------------------------
// Built-in table
// ---------------------------------------------------------------------------
static void addMovement(Catalog& c, Movement m) {
    std::string id = m.id;
    c.movements.emplace(std::move(id), std::move(m));
}

static void addMicrodose(Catalog& c, MicrodoseDefinition d) {
    std::string id = d.id;
    c.microdoses.emplace(std::move(id), std::move(d));
}

static MicrodoseDefinition mobilityDefinition(const std::string& id,
                                              const std::string& name,
                                              const std::string& movement_id) {
    MicrodoseDefinition d;
    d.id = id;
    d.name = name;
    d.category = MicrodoseCategory::MOBILITY;
    d.suggested_duration_seconds = 120;
    d.gtg_friendly = true;
    d.blocks.push_back({movement_id, MovementStyle::none(), 120,
                        {MetricSpec::reps("reps_per_side", 3, 2, 5, 1, false)}});
    return d;
}

Catalog buildDefaultCatalog() {
    Catalog c;

    addMovement(c, {"kb_swing_2h", "Kettlebell Swing (2-hand)",
                    MovementKind::KETTLEBELL_SWING, MovementStyle::none(),
                    {"vo2", "hinge", "posterior_chain"},
                    std::string("https://www.youtube.com/watch?v=YSxHifyI6s8")});

    addMovement(c, {"burpee", "Burpee",
                    MovementKind::BURPEE, MovementStyle::ofBurpee(BurpeeStyle::FOUR_COUNT),
                    {"vo2", "full_body", "bodyweight"},
                    std::string("https://www.youtube.com/watch?v=TU8QYVW0gDU")});

    addMovement(c, {"pullup", "Pull-up",
                    MovementKind::PULLUP, MovementStyle::ofBand(std::nullopt),
                    {"gtg", "gtg_ok", "upper_body", "pull"},
                    std::string("https://www.youtube.com/watch?v=eGo4IYlbE5g")});

    addMovement(c, {"hip_cars", "Hip Controlled Articular Rotations (CARs)",
                    MovementKind::MOBILITY_DRILL, MovementStyle::none(),
                    {"mobility", "hip", "gtg_ok"},
                    std::string("https://www.youtube.com/watch?v=mJRXBZGRzKg")});

    addMovement(c, {"shoulder_cars", "Shoulder Controlled Articular Rotations (CARs)",
                    MovementKind::MOBILITY_DRILL, MovementStyle::none(),
                    {"mobility", "shoulder", "gtg_ok"},
                    std::string("https://www.youtube.com/watch?v=f9y1lOJ0v4A")});

    {
        MicrodoseDefinition d;
        d.id = "emom_kb_swing_5m";
        d.name = "5-Min EMOM: KB Swings (2-hand)";
        d.category = MicrodoseCategory::VO2;
        d.suggested_duration_seconds = 300;
        d.blocks.push_back({"kb_swing_2h", MovementStyle::none(), 60,
                            {MetricSpec::reps("reps", 5, 3, 15, 1, true)}});
        addMicrodose(c, std::move(d));
    }

    {
        MicrodoseDefinition d;
        d.id = "emom_burpee_5m";
        d.name = "5-Min EMOM: Burpees";
        d.category = MicrodoseCategory::VO2;
        d.suggested_duration_seconds = 300;
        d.blocks.push_back({"burpee", MovementStyle::ofBurpee(BurpeeStyle::FOUR_COUNT), 60,
                            {MetricSpec::reps("reps", 3, 2, 10, 1, true)}});
        addMicrodose(c, std::move(d));
    }

    {
        MicrodoseDefinition d;
        d.id = "gtg_pullup_band";
        d.name = "GTG: Banded Pull-ups";
        d.category = MicrodoseCategory::GTG;
        d.suggested_duration_seconds = 30;
        d.gtg_friendly = true;
        d.blocks.push_back({"pullup", MovementStyle::ofBand(std::string("red")), 30,
                            {MetricSpec::reps("reps", 3, 1, 8, 1, true),
                             MetricSpec::band("band", "red", false)}});
        addMicrodose(c, std::move(d));
    }

    addMicrodose(c, mobilityDefinition("mobility_hip_cars",
                                       "Hip CARs (3 reps each side)", "hip_cars"));
    addMicrodose(c, mobilityDefinition("mobility_shoulder_cars",
                                       "Shoulder CARs (3 reps each side)", "shoulder_cars"));

    return c;
}

const Catalog& defaultCatalog() {
    static const Catalog catalog = buildDefaultCatalog();
    return catalog;
}

Catalog buildCatalog(const Config& cfg) {
    Catalog c = buildDefaultCatalog();

    for (const auto& drill : cfg.custom_mobility) {
        Movement m;
        m.id = "custom_" + drill.id;
        m.name = drill.name.empty() ? drill.id : drill.name;
        m.kind = MovementKind::MOBILITY_DRILL;
        m.tags = {"mobility", "custom", "gtg_ok"};
        m.reference_url = drill.url;

        MicrodoseDefinition d = mobilityDefinition("mobility_custom_" + drill.id, m.name, m.id);
        d.reference_url = drill.url;

        if (c.microdoses.count(d.id) != 0) {
            KREP_LOG_WARN("CATALOG", "duplicate custom mobility drill '" << drill.id << "' ignored");
            continue;
        }
        addMovement(c, std::move(m));
        addMicrodose(c, std::move(d));
    }

    return c;
}

void requireValid(const Catalog& catalog) {
    auto errors = catalog.validate();
    if (!errors.empty()) {
        for (const auto& e : errors) {
            KREP_LOG_ERROR("CATALOG", e);
        }
        throw CatalogValidationError(std::move(errors));
    }
}

std::optional<MicrodoseCategory> inferCategory(const Catalog& catalog,
                                               const std::string& definition_id) {
    if (const auto* def = catalog.findDefinition(definition_id)) {
        return def->category;
    }
    auto has = [&](const char* marker) {
        return definition_id.find(marker) != std::string::npos;
    };
    if (has("vo2") || has("emom")) return MicrodoseCategory::VO2;
    if (has("gtg")) return MicrodoseCategory::GTG;
    if (has("mobility")) return MicrodoseCategory::MOBILITY;
    return std::nullopt;
}

} // namespace krep
