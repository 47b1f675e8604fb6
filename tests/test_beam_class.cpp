#include <gtest/gtest.h>
#include "../model/beam_class.hpp"
#include <stdexcept>

using namespace beam_class;

// ============================================================================
// Table
// ============================================================================

TEST(BeamClassTable, HasFourteenOrderedClasses) {
    const auto& table = beam_classes();
    ASSERT_EQ(table.size(), 14u);
    for (size_t i = 0; i < table.size(); ++i) {
        EXPECT_EQ(table[i].index, (int)i);
    }
    EXPECT_EQ(table[0].name, "Beam Off");
    EXPECT_EQ(table[1].name, "Kicker STBY");
    EXPECT_EQ(table[6].name, "Tuning");
    EXPECT_EQ(table[13].name, "Unlimited");
}

TEST(BeamClassTable, AbsentLimitsAreNotZero) {
    const auto& table = beam_classes();
    // Beam Off: zero charge is a value, the pulse period is absent
    ASSERT_TRUE(table[0].charge.has_value());
    EXPECT_EQ(*table[0].charge, 0);
    EXPECT_FALSE(table[0].pulse_period.has_value());

    const BeamClass& unlimited = table[13];
    EXPECT_FALSE(unlimited.charge_time.has_value());
    EXPECT_FALSE(unlimited.charge.has_value());
    EXPECT_FALSE(unlimited.rate_max.has_value());
    EXPECT_FALSE(unlimited.power.has_value());
    EXPECT_FALSE(unlimited.notes.has_value());

    ASSERT_TRUE(table[5].rate_max.has_value());
    EXPECT_EQ(*table[5].rate_max, 120);
    EXPECT_DOUBLE_EQ(*table[5].pulse_period, 0.0083);
}

TEST(BeamClassTable, FindByName) {
    const BeamClass* bc = find_beam_class("Tuning");
    ASSERT_NE(bc, nullptr);
    EXPECT_EQ(bc->index, 6);
    EXPECT_EQ(find_beam_class("Warp Speed"), nullptr);
}

TEST(BeamClassTable, MaskForClassesAndBack) {
    u64 mask = mask_for_classes({0, 2, 13});
    EXPECT_EQ(mask, 0x2005u);

    auto classes = permitted_classes(mask);
    ASSERT_EQ(classes.size(), 3u);
    EXPECT_EQ(classes[0].name, "Beam Off");
    EXPECT_EQ(classes[1].name, "BC1Hz");
    EXPECT_EQ(classes[2].name, "Unlimited");

    EXPECT_THROW(mask_for_classes({14}), std::out_of_range);
    EXPECT_THROW(mask_for_classes({-1}), std::out_of_range);
}

// ============================================================================
// zero_pad_binary
// ============================================================================

TEST(ZeroPadBinary, MinusOneIsAllOnes) {
    EXPECT_EQ(zero_pad_binary(-1, 16), "1111111111111111");
    EXPECT_EQ(zero_pad_binary(-1, 64), std::string(64, '1'));
}

TEST(ZeroPadBinary, PadsToWidth) {
    EXPECT_EQ(zero_pad_binary(5, 8), "00000101");
    EXPECT_EQ(zero_pad_binary(0, 4), "0000");
    EXPECT_EQ(zero_pad_binary(65535, 16), "1111111111111111");
    EXPECT_EQ(zero_pad_binary(-32768, 16), "1000000000000000");
}

TEST(ZeroPadBinary, AlwaysExactWidthOfBits) {
    for (int width : {1, 7, 16, 32, 63}) {
        for (i64 v : {(i64)0, (i64)1, (i64)-1}) {
            std::string s = zero_pad_binary(v, width);
            EXPECT_EQ(s.size(), (size_t)width);
            EXPECT_EQ(s.find_first_not_of("01"), std::string::npos);
        }
    }
}

TEST(ZeroPadBinary, RejectsValuesOutsideTheWidth) {
    EXPECT_THROW(zero_pad_binary(65536, 16), std::out_of_range);
    EXPECT_THROW(zero_pad_binary(-32769, 16), std::out_of_range);
    EXPECT_THROW(zero_pad_binary(1, 0), std::out_of_range);
    EXPECT_THROW(zero_pad_binary(1, 65), std::out_of_range);
}

TEST(ParseBinaryMask, Values) {
    EXPECT_EQ(parse_binary_mask("0011", 16), 3u);
    EXPECT_EQ(parse_binary_mask("1111111111111111", 16), 0xFFFFu);
    EXPECT_THROW(parse_binary_mask("", 16), std::invalid_argument);
    EXPECT_THROW(parse_binary_mask("0120", 16), std::invalid_argument);
    EXPECT_THROW(parse_binary_mask(std::string(17, '0'), 16), std::invalid_argument);
}

// ============================================================================
// Descriptions
// ============================================================================

TEST(DecodeBeamClassMask, LowTwoBitsNameExactlyTwoClasses) {
    std::string desc = decode_beam_class_mask(0b0000000000000011);
    EXPECT_NE(desc.find("Beam Off"), std::string::npos);
    EXPECT_NE(desc.find("Kicker STBY"), std::string::npos);
    for (size_t i = 2; i < beam_classes().size(); ++i) {
        EXPECT_EQ(desc.find(beam_classes()[i].name), std::string::npos)
            << "unexpected " << beam_classes()[i].name;
    }
}

TEST(DecodeBeamClassMask, SingleBit) {
    EXPECT_EQ(decode_beam_class_mask(1), "0: Beam Off");
    EXPECT_EQ(decode_beam_class_mask(1 << 13), "13: Unlimited");
}

TEST(DecodeBeamClassMask, EmptyAndSignedMasks) {
    EXPECT_EQ(decode_beam_class_mask(0), "no beam classes");

    // -1 through a signed channel means every bit, including unused ones
    std::string desc = decode_beam_class_mask(-1);
    EXPECT_NE(desc.find("13: Unlimited"), std::string::npos);
    EXPECT_NE(desc.find("15: undefined beam class"), std::string::npos);
}

TEST(EnergyRanges, BandsAreContiguous) {
    for (char line : {'k', 'l'}) {
        const auto& ranges = energy_ranges(line);
        ASSERT_EQ(ranges.size(), 32u);
        EXPECT_EQ(ranges[0].low_ev, 0.0);
        for (size_t i = 1; i < ranges.size(); ++i) {
            EXPECT_EQ(ranges[i].low_ev, ranges[i - 1].high_ev);
            EXPECT_LT(ranges[i].low_ev, ranges[i].high_ev);
        }
    }
    EXPECT_EQ(energy_ranges('l')[0].high_ev, 100.0);
    EXPECT_EQ(energy_ranges('k')[31].high_ev, 100000.0);
    EXPECT_THROW(energy_ranges('x'), std::invalid_argument);
}

TEST(EnergyRanges, LineForBeamline) {
    EXPECT_EQ(line_for_beamline("K4"), 'k');
    EXPECT_EQ(line_for_beamline("kfe"), 'k');
    EXPECT_EQ(line_for_beamline("L0"), 'l');
    EXPECT_EQ(line_for_beamline(""), 'l');
}

TEST(DecodeEnergyMask, ListsBands) {
    EXPECT_EQ(decode_energy_mask(0b11, 32, 'l'), "0: 0 eV to 100 eV\n1: 100 eV to 250 eV");
    EXPECT_EQ(decode_energy_mask(1, 32, 'k'), "0: 0 eV to 1000 eV");
    EXPECT_EQ(decode_energy_mask(0), "no energy ranges");
    EXPECT_THROW(decode_energy_mask(1, 32, 'q'), std::invalid_argument);
}
