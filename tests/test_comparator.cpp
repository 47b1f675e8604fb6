#include <gtest/gtest.h>
#include "../model/comparator.hpp"
#include "test_support.hpp"

static FileContents parse(const Json::Value& root) {
    return model::parse_file_contents(to_json_text(root));
}

static Json::Value base_export() {
    Json::Value root(Json::objectValue);
    root["plc"]["dev-a"]["OUT"] = sample_state("OUT");
    root["plc"]["dev-a"]["IN"]  = sample_state("IN");
    root["plc"]["dev-b"]["T1"]  = sample_state("T1");
    return root;
}

TEST(Comparator, ReflexiveIsEmpty) {
    FileContents a = parse(base_export());
    Diff d = model::compare_contents(a, a);
    EXPECT_TRUE(d.empty());
    EXPECT_TRUE(d.entries.empty());
    EXPECT_EQ(d.difference_count(), 0u);
}

TEST(Comparator, ReportsFieldMismatch) {
    Json::Value b_root = base_export();
    b_root["plc"]["dev-a"]["OUT"]["nTran"] = "0.25";
    Diff d = model::compare_contents(parse(base_export()), parse(b_root));

    ASSERT_EQ(d.entries.size(), 1u);
    const DiffEntry& e = d.entries[0];
    EXPECT_EQ(e.kind, DiffKind::VALUE_MISMATCH);
    EXPECT_EQ(e.path, "dev-a/OUT");
    EXPECT_EQ(e.field, "nTran");
    EXPECT_EQ(e.a_value, "0.5");
    EXPECT_EQ(e.b_value, "0.25");
    EXPECT_FALSE(d.empty());
}

TEST(Comparator, SymmetricWithRolesSwapped) {
    Json::Value b_root = base_export();
    b_root["plc"]["dev-a"]["OUT"]["notes"] = "changed";
    b_root["plc"]["dev-a"].removeMember("IN");
    b_root["plc"]["dev-c"]["X"] = sample_state("X");
    FileContents a = parse(base_export());
    FileContents b = parse(b_root);

    Diff ab = model::compare_contents(a, b);
    Diff ba = model::compare_contents(b, a);
    ASSERT_EQ(ab.entries.size(), ba.entries.size());
    ASSERT_EQ(ab.entries.size(), 3u);

    for (size_t i = 0; i < ab.entries.size(); ++i) {
        const DiffEntry& x = ab.entries[i];
        const DiffEntry& y = ba.entries[i];
        EXPECT_EQ(x.path, y.path);
        EXPECT_EQ(x.field, y.field);
        EXPECT_EQ(x.a_value, y.b_value);
        EXPECT_EQ(x.b_value, y.a_value);
        if (x.kind == DiffKind::ONLY_IN_A) EXPECT_EQ(y.kind, DiffKind::ONLY_IN_B);
        if (x.kind == DiffKind::ONLY_IN_B) EXPECT_EQ(y.kind, DiffKind::ONLY_IN_A);
        if (x.kind == DiffKind::VALUE_MISMATCH) EXPECT_EQ(y.kind, DiffKind::VALUE_MISMATCH);
    }

    // Sorted by path: dev-a/IN, dev-a/OUT, dev-c
    EXPECT_EQ(ab.entries[0].kind, DiffKind::ONLY_IN_A);
    EXPECT_EQ(ab.entries[0].path, "dev-a/IN");
    EXPECT_EQ(ab.entries[1].kind, DiffKind::VALUE_MISMATCH);
    EXPECT_EQ(ab.entries[1].field, "notes");
    EXPECT_EQ(ab.entries[2].kind, DiffKind::ONLY_IN_B);
    EXPECT_EQ(ab.entries[2].path, "dev-c");
}

TEST(Comparator, MasksCompareOnDecodedValue) {
    Json::Value b_root = base_export();
    b_root["plc"]["dev-a"]["OUT"]["nBeamClassRange"] = "1";
    b_root["plc"]["dev-a"]["OUT"]["neVRange"] = "0000011";
    FileContents a = parse(base_export());
    FileContents b = parse(b_root);

    EXPECT_NE(a.devices.at("dev-a").at("OUT").beam_class_range.raw,
              b.devices.at("dev-a").at("OUT").beam_class_range.raw);
    EXPECT_TRUE(model::compare_contents(a, b).empty());

    b_root["plc"]["dev-a"]["OUT"]["nBeamClassRange"] = "11";
    Diff d = model::compare_contents(a, parse(b_root));
    ASSERT_EQ(d.entries.size(), 1u);
    EXPECT_EQ(d.entries[0].field, "nBeamClassRange");
    EXPECT_EQ(d.entries[0].a_value, "0000000000000001");
    EXPECT_EQ(d.entries[0].b_value, "0000000000000011");
}

TEST(Comparator, ReportMatchesListsMatchedStates) {
    FileContents a = parse(base_export());
    Diff d = model::compare_contents(a, a, true);
    EXPECT_EQ(d.entries.size(), 3u);
    for (const auto& e : d.entries) EXPECT_EQ(e.kind, DiffKind::MATCH);
    EXPECT_TRUE(d.empty());
}

TEST(Comparator, PlcNameMismatchAtRoot) {
    Json::Value b_root(Json::objectValue);
    b_root["other-plc"] = base_export()["plc"];
    Diff d = model::compare_contents(parse(base_export()), parse(b_root));
    ASSERT_EQ(d.entries.size(), 1u);
    EXPECT_EQ(d.entries[0].path, "");
    EXPECT_EQ(d.entries[0].field, "plc_name");
    EXPECT_EQ(d.entries[0].a_value, "plc");
    EXPECT_EQ(d.entries[0].b_value, "other-plc");
}

TEST(Comparator, IndependentOfKeyOrderInTheFile) {
    const std::string fields =
        R"("id": 1, "name": "S", "beamline": "L0", "nBeamClassRange": "1",)"
        R"( "neVRange": "1", "nTran": "1", "nRate": "1", "ap_name": "A",)"
        R"( "ap_xgap": 0, "ap_xcenter": 0, "ap_ygap": 0, "ap_ycenter": 0,)"
        R"( "damage_limit": "", "pulse_energy": "", "notes": "", "special": true)";
    std::string one = R"({"p": {"d1": {"S": {)" + fields + R"(}}, "d2": {"S": {)" + fields + "}}}}";
    std::string two = R"({"p": {"d2": {"S": {)" + fields + R"(}}, "d1": {"S": {)" + fields + "}}}}";
    EXPECT_TRUE(model::compare_contents(model::parse_file_contents(one),
                                        model::parse_file_contents(two)).empty());
}

TEST(Comparator, BeamParametersEquality) {
    FileContents a = parse(base_export());
    BeamParameters x = a.devices.at("dev-a").at("OUT");
    BeamParameters y = x;
    EXPECT_TRUE(x == y);
    y.special = true;
    EXPECT_TRUE(x != y);
    auto diffs = model::field_differences(x, y);
    ASSERT_EQ(diffs.size(), 1u);
    EXPECT_EQ(diffs[0].field, "special");
    EXPECT_EQ(diffs[0].a_value, "false");
    EXPECT_EQ(diffs[0].b_value, "true");
}

TEST(Comparator, FormatDiff) {
    Json::Value b_root = base_export();
    b_root["plc"]["dev-a"]["OUT"]["nRate"] = "10";
    std::string text = model::format_diff(model::compare_contents(parse(base_export()),
                                                                  parse(b_root)));
    EXPECT_EQ(text, "mismatch:  dev-a/OUT nRate: 120 != 10\n");
    EXPECT_STREQ(diff_kind_name(DiffKind::ONLY_IN_A), "only_in_a");
}
