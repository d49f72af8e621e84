#include <gtest/gtest.h>
#include "ondd/ipc/lnb.hpp"

using namespace ondd::ipc::lnb;

TEST(LnbTest, ParseType) {
    EXPECT_EQ(parse_lnb_type("k"), LnbType::KuBand);
    EXPECT_EQ(parse_lnb_type("C"), LnbType::CBand);
    EXPECT_EQ(parse_lnb_type("u"), LnbType::Universal);
    EXPECT_FALSE(parse_lnb_type("x").has_value());
    EXPECT_FALSE(parse_lnb_type("").has_value());
}

TEST(LnbTest, KuBandConversion) {
    EXPECT_EQ(to_l_band(12090, LnbType::KuBand), 1340);
    EXPECT_FALSE(needs_tone(12090, LnbType::KuBand));
}

TEST(LnbTest, CBandConversion) {
    EXPECT_EQ(to_l_band(4000, LnbType::CBand), 1150);
    EXPECT_FALSE(needs_tone(4000, LnbType::CBand));
}

TEST(LnbTest, UniversalLowBand) {
    EXPECT_EQ(to_l_band(11471, LnbType::Universal), 1721);
    EXPECT_FALSE(needs_tone(11471, LnbType::Universal));
    EXPECT_EQ(to_l_band(11700, LnbType::Universal), 1950);
    EXPECT_FALSE(needs_tone(11700, LnbType::Universal));
}

TEST(LnbTest, UniversalHighBand) {
    EXPECT_EQ(to_l_band(12000, LnbType::Universal), 1400);
    EXPECT_TRUE(needs_tone(12000, LnbType::Universal));
}

TEST(LnbTest, Polarization) {
    EXPECT_EQ(voltage_to_polarization(13), 'v');
    EXPECT_EQ(voltage_to_polarization(18), 'h');
    EXPECT_EQ(voltage_to_polarization(0), '0');
    EXPECT_EQ(voltage_to_polarization(14), '0');
}
