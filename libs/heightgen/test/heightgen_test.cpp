#include "relief/heightgen.h"

#include <gtest/gtest.h>

using namespace relief;

TEST(HeightGen, SameSeedSameGrid) {
    heightgen::GenOptions opt;
    opt.width = 40;
    opt.height = 30;
    opt.seed = 1234;
    const auto a = heightgen::generate(opt);
    const auto b = heightgen::generate(opt);
    EXPECT_EQ(a.width(), 40u);
    EXPECT_EQ(a.height(), 30u);
    EXPECT_EQ(a.samples(), b.samples());
}

TEST(HeightGen, DifferentSeedsDiffer) {
    heightgen::GenOptions opt;
    opt.width = 32;
    opt.height = 32;
    opt.frequency = 0.1f;
    opt.seed = 1;
    const auto a = heightgen::generate(opt);
    opt.seed = 2;
    const auto b = heightgen::generate(opt);
    EXPECT_NE(a.samples(), b.samples());
}

TEST(HeightGen, HeightsStayWithinAmplitude) {
    heightgen::GenOptions opt;
    opt.width = 64;
    opt.height = 48;
    opt.frequency = 0.05f;
    opt.amplitude = 20.0f;
    const auto g = heightgen::generate(opt);
    EXPECT_GE(g.bounds().min_height, -20.0f);
    EXPECT_LE(g.bounds().max_height, 20.0f);
    EXPECT_GT(g.bounds().range(), 0.0f);
}

TEST(HeightGen, RidgedIsNonNegative) {
    heightgen::GenOptions opt;
    opt.width = 50;
    opt.height = 50;
    opt.frequency = 0.07f;
    opt.ridged = true;
    const auto g = heightgen::generate(opt);
    EXPECT_GE(g.bounds().min_height, 0.0f);
    EXPECT_LE(g.bounds().max_height, opt.amplitude);
}

TEST(HeightGen, OctavesAreClamped) {
    heightgen::GenOptions low;
    low.width = 16;
    low.height = 16;
    low.octaves = -3;
    heightgen::GenOptions one = low;
    one.octaves = 1;
    EXPECT_EQ(heightgen::generate(low).samples(), heightgen::generate(one).samples());
}

TEST(HeightGen, FbmMatchesGeneratedSample) {
    heightgen::GenOptions opt;
    opt.width = 8;
    opt.height = 8;
    opt.seed = 77;
    const auto g = heightgen::generate(opt);
    EXPECT_FLOAT_EQ(g.at(5, 3), heightgen::fbm(5.0f, 3.0f, opt) * opt.amplitude);
}

TEST(HeightGen, ZeroSizeGivesEmptyGrid) {
    heightgen::GenOptions opt;
    opt.width = 0;
    EXPECT_TRUE(heightgen::generate(opt).empty());
}
