#include "TestSupport.hpp"

#include "krep/config/Config.hpp"
#include "krep/core/Error.hpp"
#include "krep/domain/Catalog.hpp"

#include <algorithm>

using namespace krep;
using namespace krep::test;

// -----------------------------------------------------------------------------
// Catalog
// -----------------------------------------------------------------------------
TEST(Catalog, DefaultCatalogIsValid) {
    Catalog c = buildDefaultCatalog();
    EXPECT_TRUE(c.validate().empty());
    EXPECT_EQ(c.movements.size(), 5u);
    EXPECT_EQ(c.microdoses.size(), 5u);
    EXPECT_NO_THROW(requireValid(c));
}

TEST(Catalog, SingletonIsBuiltOnce) {
    const Catalog& a = defaultCatalog();
    const Catalog& b = defaultCatalog();
    EXPECT_EQ(&a, &b);
    EXPECT_NE(a.findDefinition("gtg_pullup_band"), nullptr);
}

TEST(Catalog, DefinitionsInCategoryAreSortedById) {
    const Catalog& c = defaultCatalog();
    auto vo2 = c.definitionsIn(MicrodoseCategory::VO2);
    ASSERT_EQ(vo2.size(), 2u);
    EXPECT_EQ(vo2[0]->id, "emom_burpee_5m");
    EXPECT_EQ(vo2[1]->id, "emom_kb_swing_5m");

    auto mob = c.definitionsIn(MicrodoseCategory::MOBILITY);
    ASSERT_EQ(mob.size(), 2u);
    EXPECT_EQ(mob[0]->id, "mobility_hip_cars");
    EXPECT_EQ(mob[1]->id, "mobility_shoulder_cars");
}

TEST(Catalog, ValidateReportsEveryProblem) {
    Catalog c = buildDefaultCatalog();

    auto& burpee = c.microdoses.at("emom_burpee_5m");
    burpee.blocks[0].movement_id = "ghost";
    burpee.blocks[0].metrics[0].default_reps = 50;

    c.microdoses.at("gtg_pullup_band").blocks[0].metrics[1].default_band.clear();
    c.movements.at("hip_cars").name.clear();

    auto errors = c.validate();
    auto mentions = [&](const std::string& needle) {
        return std::any_of(errors.begin(), errors.end(), [&](const std::string& e) {
            return e.find(needle) != std::string::npos;
        });
    };
    EXPECT_TRUE(mentions("unknown movement 'ghost'"));
    EXPECT_TRUE(mentions("default reps 50 > max 10"));
    EXPECT_TRUE(mentions("band metric has empty default"));
    EXPECT_TRUE(mentions("'hip_cars' has empty name"));
    EXPECT_THROW(requireValid(c), CatalogValidationError);
}

TEST(Catalog, ValidateRequiresEveryCategory) {
    Catalog c = buildDefaultCatalog();
    c.microdoses.erase("gtg_pullup_band");
    auto errors = c.validate();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "catalog has no gtg microdoses");
}

TEST(Catalog, KeyMustMatchId) {
    Catalog c = buildDefaultCatalog();
    auto def = c.microdoses.at("mobility_hip_cars");
    c.microdoses.emplace("mobility_other", def);
    auto errors = c.validate();
    ASSERT_FALSE(errors.empty());
    EXPECT_NE(errors[0].find("does not match id"), std::string::npos);
}

TEST(Catalog, CustomMobilityDrillsAreAdded) {
    Config cfg = defaultConfig();
    cfg.custom_mobility.push_back({"ankle", "Ankle CARs", std::string("https://example.org/a")});
    cfg.custom_mobility.push_back({"ankle", "Ankle again", std::nullopt});

    Catalog c = buildCatalog(cfg);
    EXPECT_TRUE(c.validate().empty());
    EXPECT_EQ(c.microdoses.size(), 6u);

    const auto* def = c.findDefinition("mobility_custom_ankle");
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def->category, MicrodoseCategory::MOBILITY);
    EXPECT_EQ(def->name, "Ankle CARs");
    EXPECT_EQ(def->blocks[0].movement_id, "custom_ankle");
    EXPECT_EQ(c.findMovement("custom_ankle")->kind, MovementKind::MOBILITY_DRILL);
    EXPECT_EQ(c.definitionsIn(MicrodoseCategory::MOBILITY).size(), 3u);
}

TEST(Catalog, InferCategoryPrefersCatalogThenMarkers) {
    Catalog c = buildDefaultCatalog();
    EXPECT_EQ(inferCategory(c, "emom_burpee_5m"), MicrodoseCategory::VO2);
    EXPECT_EQ(inferCategory(c, "gtg_pullup_band"), MicrodoseCategory::GTG);
    EXPECT_EQ(inferCategory(c, "mobility_hip_cars"), MicrodoseCategory::MOBILITY);

    EXPECT_EQ(inferCategory(c, "old_vo2_intervals"), MicrodoseCategory::VO2);
    EXPECT_EQ(inferCategory(c, "gtg_dips"), MicrodoseCategory::GTG);
    EXPECT_EQ(inferCategory(c, "mobility_ankle"), MicrodoseCategory::MOBILITY);
    EXPECT_FALSE(inferCategory(c, "yoga").has_value());

    MicrodoseDefinition odd = c.microdoses.at("mobility_hip_cars");
    odd.id = "hips_gtg_style";
    c.microdoses.emplace(odd.id, odd);
    EXPECT_EQ(inferCategory(c, "hips_gtg_style"), MicrodoseCategory::MOBILITY);
}

// -----------------------------------------------------------------------------
// Types
// -----------------------------------------------------------------------------
TEST(Types, UuidTextRoundTrip) {
    auto id = newSessionId();
    auto text = toString(id);
    EXPECT_EQ(text.size(), 36u);
    auto back = parseUuid(text);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, id);
    EXPECT_NE(newSessionId(), id);

    EXPECT_FALSE(parseUuid("not-a-uuid").has_value());
    EXPECT_FALSE(parseUuid("zzzzzzzz-zzzz-zzzz-zzzz-zzzzzzzzzzzz").has_value());
}

TEST(Types, ParsesCategoriesCaseInsensitively) {
    EXPECT_EQ(parseCategory("VO2"), MicrodoseCategory::VO2);
    EXPECT_EQ(parseCategory("Gtg"), MicrodoseCategory::GTG);
    EXPECT_EQ(parseCategory("mobility"), MicrodoseCategory::MOBILITY);
    EXPECT_FALSE(parseCategory("cardio").has_value());
    EXPECT_STREQ(toString(MicrodoseCategory::MOBILITY), "mobility");
}

TEST(Types, ParsesStrengthSessionTypes) {
    EXPECT_EQ(parseStrengthSessionType("Lower"), StrengthSessionType::lower());
    EXPECT_EQ(parseStrengthSessionType("upper"), StrengthSessionType::upper());
    EXPECT_EQ(parseStrengthSessionType("FULL_BODY"), StrengthSessionType::full());
    EXPECT_EQ(parseStrengthSessionType("fullbody"), StrengthSessionType::full());
    EXPECT_EQ(parseStrengthSessionType("Olympic"), StrengthSessionType::otherOf("olympic"));
}

TEST(Types, BurpeeStyleNamesRoundTrip) {
    for (auto s : {BurpeeStyle::FOUR_COUNT, BurpeeStyle::SIX_COUNT,
                   BurpeeStyle::SIX_COUNT_TWO_PUMP, BurpeeStyle::SEAL}) {
        EXPECT_EQ(parseBurpeeStyle(toString(s)), s);
    }
    EXPECT_FALSE(parseBurpeeStyle("eight_count").has_value());
    EXPECT_EQ(parseMovementKind("pullup"), MovementKind::PULLUP);
}

TEST(Types, SessionKindAccessors) {
    Session real = makeSession("emom_burpee_5m", fixedNow());
    SessionKind a = real;
    SessionKind b = ShownButSkipped{"gtg_pullup_band", fixedNow() + std::chrono::minutes(1)};

    EXPECT_EQ(definitionIdOf(a), "emom_burpee_5m");
    EXPECT_EQ(timestampOf(a), fixedNow());
    ASSERT_NE(asReal(a), nullptr);
    EXPECT_EQ(*asReal(a), real);

    EXPECT_EQ(definitionIdOf(b), "gtg_pullup_band");
    EXPECT_EQ(timestampOf(b), fixedNow() + std::chrono::minutes(1));
    EXPECT_EQ(asReal(b), nullptr);
}

TEST(Types, StyleEqualityIgnoresInactiveFields) {
    MovementStyle a = MovementStyle::none();
    MovementStyle b = MovementStyle::none();
    b.burpee = BurpeeStyle::SEAL;
    EXPECT_EQ(a, b);
    EXPECT_NE(MovementStyle::ofBand(std::string("red")), MovementStyle::ofBand(std::nullopt));
    EXPECT_EQ(describe(MovementStyle::ofBurpee(BurpeeStyle::SEAL)), "burpee seal");
}
