#include <gtest/gtest.h>
#include <stellabund/AbundanceStore.hpp>
#include <stellabund/Errors.hpp>

#include <initializer_list>
#include <utility>

using namespace stellabund;

namespace {

constexpr double kTol = 1e-12;

AbundanceTable table(std::initializer_list<std::pair<const char*, double>> vals)
{
    AbundanceTable t;
    for (const auto& [el, v] : vals) t.emplace(el, scalar(v));
    return t;
}

SolarComposition test_sun()
{
    return {"TestSun", {{"C", 8.5}, {"Mg", 7.6}, {"Fe", 7.5}}};
}

SolarComposition other_sun()
{
    return {"OtherSun", {{"C", 8.4}, {"Mg", 7.4}, {"Fe", 7.4}}};
}

} // namespace

TEST(AbundanceStoreTest, RejectsEmptyInput) {
    EXPECT_THROW(AbundanceStore(AbundanceTable{}, "logeps"), MissingAbundances);
}

TEST(AbundanceStoreTest, RejectsEmptyValue) {
    AbundanceTable t;
    t.emplace("Fe", Vector());
    EXPECT_THROW(AbundanceStore(t, "logeps"), MissingAbundances);
}

TEST(AbundanceStoreTest, RejectsReferenceNotInInput) {
    auto t = table({{"C", 8.0}, {"Fe", 7.0}});
    EXPECT_THROW(AbundanceStore(t, "Mg"), InvalidReference);
    EXPECT_THROW(AbundanceStore(t, "Xx"), InvalidReference);
}

TEST(AbundanceStoreTest, RejectsUnknownElementKey) {
    EXPECT_THROW(AbundanceStore(table({{"Qq", 1.0}}), "logeps"), UnknownElement);
}

TEST(AbundanceStoreTest, RejectsMismatchedLengths) {
    AbundanceTable t;
    t.emplace("C", Vector::Constant(2, 8.0));
    t.emplace("Fe", Vector::Constant(3, 7.0));
    EXPECT_THROW(AbundanceStore(t, "logeps"), std::invalid_argument);
}

TEST(AbundanceStoreTest, CanonicalisesElementSymbols) {
    AbundanceStore store(table({{"fe", 7.0}, {"MG", 7.2}}), "LOGEPS");

    ASSERT_EQ(store.elements().size(), 2u);
    EXPECT_EQ(store.elements()[0], "Fe");
    EXPECT_EQ(store.elements()[1], "Mg");
    EXPECT_TRUE(store.tracks("fe"));
    EXPECT_FALSE(store.tracks("C"));
    EXPECT_TRUE(store.is_materialized("logeps"));
}

TEST(AbundanceStoreTest, ElementInputAnchorsIntoH) {
    AbundanceStore store(table({{"C", 8.0}, {"Fe", 7.0}}), "Fe");

    auto h = store.export_system("h");
    ASSERT_TRUE(h.has_value());
    EXPECT_DOUBLE_EQ(h->at("Fe")[0], 7.0);
    EXPECT_DOUBLE_EQ(h->at("C")[0], 15.0);

    // the anchor's own row is its [Fe/H] value, not zero
    auto fe = store.export_system("fe");
    ASSERT_TRUE(fe.has_value());
    EXPECT_DOUBLE_EQ(fe->at("C")[0], 8.0);
    EXPECT_DOUBLE_EQ(fe->at("Fe")[0], 7.0);

    EXPECT_TRUE(store.is_materialized("h"));
    EXPECT_TRUE(store.is_materialized("fe"));
    EXPECT_FALSE(store.is_materialized("logeps"));
}

TEST(AbundanceStoreTest, BareLogEpsIsNotReady) {
    AbundanceStore store(table({{"C", 8.0}, {"Fe", 7.0}}), "logeps");

    EXPECT_FALSE(store.export_system("h").has_value());
    EXPECT_FALSE(store.export_system("fe").has_value());
    EXPECT_FALSE(store.materialize("fe"));
    EXPECT_FALSE(store.materialize("h"));
    EXPECT_EQ(store.solar_reference_name(), "None");
    EXPECT_EQ(store.materialized_systems(), std::vector<std::string>{"logeps"});
}

TEST(AbundanceStoreTest, UntrackedReferenceElementIsAnError) {
    AbundanceStore store(table({{"C", 8.0}, {"Fe", 7.0}}), "logeps", test_sun());
    EXPECT_THROW(store.materialize("Mg"), InvalidReference);
    EXPECT_FALSE(store.export_system("mg").has_value());
}

TEST(AbundanceStoreTest, UnparsableTagThrows) {
    AbundanceStore store(table({{"C", 8.0}}), "logeps");
    EXPECT_THROW(store.export_system("notanelement"), UnknownElement);
}

TEST(AbundanceStoreTest, FeMaterialisedAutomatically) {
    AbundanceStore store(table({{"C", 8.0}, {"Fe", 7.0}}), "logeps", test_sun());

    EXPECT_TRUE(store.is_materialized("fe"));
    auto fe = store.export_system("fe");
    ASSERT_TRUE(fe.has_value());
    EXPECT_NEAR(fe->at("C")[0], (8.0 - 8.5) - (7.0 - 7.5), kTol);
}

TEST(AbundanceStoreTest, NoFeSystemWithoutFe) {
    AbundanceStore store(table({{"C", 8.0}, {"Mg", 7.0}}), "logeps", test_sun());
    EXPECT_FALSE(store.is_materialized("fe"));
    EXPECT_EQ(store.materialized_systems(), (std::vector<std::string>{"h", "logeps"}));
}

TEST(AbundanceStoreTest, LogEpsToHUsesSolarValues) {
    AbundanceStore store(table({{"C", 8.0}, {"Mg", 7.1}, {"Fe", 7.0}}), "logeps", test_sun());

    auto h = store.export_system("h");
    ASSERT_TRUE(h.has_value());
    EXPECT_DOUBLE_EQ(h->at("C")[0],  8.0 - 8.5);
    EXPECT_DOUBLE_EQ(h->at("Mg")[0], 7.1 - 7.6);
    EXPECT_DOUBLE_EQ(h->at("Fe")[0], 7.0 - 7.5);
    EXPECT_EQ(store.solar_reference_name(), "TestSun");
}

TEST(AbundanceStoreTest, HRoundTripRecoversLogEps) {
    const auto logeps = table({{"C", 8.03}, {"Mg", 7.38}, {"Fe", 6.93}});
    AbundanceStore forward(logeps, "logeps", test_sun());

    AbundanceStore back(*forward.export_system("h"), "h", test_sun());
    auto lg = back.export_system("logeps");
    ASSERT_TRUE(lg.has_value());
    for (const auto& [el, v] : logeps)
        EXPECT_NEAR(lg->at(el)[0], v[0], kTol) << el;
}

TEST(AbundanceStoreTest, RelativeSystemIsDifferenceOfH) {
    AbundanceStore store(table({{"C", 8.0}, {"Mg", 7.1}, {"Fe", 7.0}}), "logeps", test_sun());

    auto h  = *store.export_system("h");
    auto fe = *store.export_system("fe");
    for (const auto& el : store.elements()) {
        if (el == "Fe") continue;
        EXPECT_NEAR(fe.at(el)[0], h.at(el)[0] - h.at("Fe")[0], kTol) << el;
    }
}

TEST(AbundanceStoreTest, SolarSwitchRederivesRelativeSystems) {
    AbundanceStore store(table({{"C", 8.0}, {"Mg", 7.0}, {"Fe", 7.0}}), "logeps", test_sun());
    ASSERT_TRUE(store.materialize("Mg"));

    const double stale = store.export_system("mg")->at("C")[0];
    EXPECT_NEAR(stale, 0.1, kTol);

    store.set_solar_reference(other_sun());

    auto h  = *store.export_system("h");
    auto mg = *store.export_system("mg");
    EXPECT_NEAR(mg.at("C")[0],  h.at("C")[0] - h.at("Mg")[0], kTol);
    EXPECT_NEAR(mg.at("C")[0],  0.0, kTol);
    EXPECT_NEAR(mg.at("Fe")[0], h.at("Fe")[0] - h.at("Mg")[0], kTol);
    EXPECT_NEAR(mg.at("Mg")[0], h.at("Mg")[0], kTol);
    EXPECT_EQ(store.solar_reference_name(), "OtherSun");
}

TEST(AbundanceStoreTest, HInputDerivesLogEps) {
    AbundanceStore store(table({{"C", 0.1}, {"Fe", -0.2}}), "h", test_sun());

    auto lg = store.export_system("logeps");
    ASSERT_TRUE(lg.has_value());
    EXPECT_NEAR(lg->at("C")[0],  8.6, kTol);
    EXPECT_NEAR(lg->at("Fe")[0], 7.3, kTol);
    EXPECT_TRUE(store.is_materialized("fe"));

    // from here on log eps is the anchor: a new sun moves [X/H]
    store.set_solar_reference(other_sun());
    auto h = *store.export_system("h");
    EXPECT_NEAR(h.at("C")[0],  0.2, kTol);
    EXPECT_NEAR(h.at("Fe")[0], -0.1, kTol);
}

TEST(AbundanceStoreTest, ElementInputWithSolarReference) {
    AbundanceStore store(table({{"C", 0.3}, {"Fe", -1.0}}), "Fe", test_sun());

    auto lg = store.export_system("logeps");
    ASSERT_TRUE(lg.has_value());
    EXPECT_NEAR(lg->at("Fe")[0], 6.5, kTol);
    EXPECT_NEAR(lg->at("C")[0],  7.8, kTol);
}

TEST(AbundanceStoreTest, NamedSolarReference) {
    AbundanceStore store(table({{"Fe", 6.93}, {"C", 8.03}}), "logeps", std::string("asplund2009"));

    EXPECT_EQ(store.solar_reference_name(), "Asplund2009");
    auto h = store.export_system("h");
    ASSERT_TRUE(h.has_value());
    EXPECT_NEAR(h->at("Fe")[0], 6.93 - 7.50, kTol);
    EXPECT_NEAR(h->at("C")[0],  8.03 - 8.43, kTol);
}

TEST(AbundanceStoreTest, UnknownSolarReference) {
    AbundanceStore store(table({{"Fe", 7.0}}), "logeps");
    EXPECT_THROW(store.set_solar_reference(std::string("NoSuchSun")), UnknownReference);
}

TEST(AbundanceStoreTest, IncompleteSolarReferenceLeavesStoreUntouched) {
    AbundanceStore store(table({{"C", 8.0}, {"Fe", 7.0}}), "logeps", test_sun());
    const auto before = *store.export_system("h");

    SolarComposition partial{"Partial", {{"Fe", 7.4}}};
    EXPECT_THROW(store.set_solar_reference(partial), MissingSolarValue);

    const auto after = *store.export_system("h");
    EXPECT_DOUBLE_EQ(after.at("C")[0],  before.at("C")[0]);
    EXPECT_DOUBLE_EQ(after.at("Fe")[0], before.at("Fe")[0]);
    EXPECT_EQ(store.solar_reference_name(), "TestSun");
}

TEST(AbundanceStoreTest, VectorisedValues) {
    AbundanceTable t;
    t.emplace("C", scalar(8.0));
    t.emplace("Fe", (Vector(2) << 7.0, 6.5).finished());

    AbundanceStore store(t, "logeps", test_sun());
    EXPECT_EQ(store.size(), 2);

    auto fe = *store.export_system("fe");
    ASSERT_EQ(fe.at("C").size(), 2);
    EXPECT_NEAR(fe.at("C")[0], -0.5 - (-0.5), kTol);
    EXPECT_NEAR(fe.at("C")[1], -0.5 - (-1.0), kTol);
    EXPECT_NEAR(fe.at("Fe")[1], -1.0, kTol);
}

TEST(AbundanceStoreTest, SingleValueLookup) {
    AbundanceStore store(table({{"C", 8.0}, {"Fe", 7.0}}), "logeps", test_sun());

    auto c_fe = store.value("c", ReferenceSystem::relative_to("Fe"));
    ASSERT_TRUE(c_fe.has_value());
    EXPECT_NEAR((*c_fe)[0], 0.0, kTol);

    auto fe_fe = store.value("Fe", ReferenceSystem::relative_to("Fe"));
    ASSERT_TRUE(fe_fe.has_value());
    EXPECT_NEAR((*fe_fe)[0], -0.5, kTol);

    EXPECT_FALSE(store.value("Mg", ReferenceSystem::h()).has_value());
    EXPECT_FALSE(store.value("C", ReferenceSystem::relative_to("Mg")).has_value());
}

TEST(AbundanceStoreTest, RelativeToHydrogenIsH) {
    AbundanceStore store(table({{"C", 0.1}, {"Fe", 0.2}}), "h");
    EXPECT_TRUE(store.materialize("H"));
    EXPECT_TRUE(store.materialize(ReferenceSystem::relative_to("H")));
    EXPECT_FALSE(store.materialize("logeps"));
}
