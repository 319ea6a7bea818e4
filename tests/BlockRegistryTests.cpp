#include <gtest/gtest.h>

#include <filesystem>

#include "world/BlockRegistry.hpp"

using namespace Deepvale;

namespace {

BlockType::Properties solidProperties(const char* displayName) {
    BlockType::Properties props;
    props.displayName = displayName;
    return props;
}

} // namespace

TEST(BlockRegistry, AirIsAlwaysRegistered) {
    BlockRegistry blocks;
    ASSERT_NE(blocks.air(), nullptr);
    EXPECT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks.get(BlockIds::AIR), blocks.air());
    EXPECT_TRUE(blocks.air()->isAir());
    EXPECT_FALSE(blocks.air()->isSolid());
    EXPECT_FALSE(blocks.air()->isOpaque());
    EXPECT_FALSE(blocks.air()->isPlaceable());
}

TEST(BlockRegistry, DefaultCatalog) {
    BlockRegistry blocks;
    blocks.registerDefaults();

    EXPECT_EQ(blocks.size(), 12u);

    const BlockType* stone = blocks.get(BlockIds::STONE);
    ASSERT_NE(stone, nullptr);
    EXPECT_TRUE(stone->isOpaque());
    EXPECT_FLOAT_EQ(stone->getHardness(), 1.5f);
    EXPECT_EQ(stone->getDisplayName(), "Stone");

    const BlockType* water = blocks.get(BlockIds::WATER);
    ASSERT_NE(water, nullptr);
    EXPECT_FALSE(water->isSolid());
    EXPECT_TRUE(water->isTransparent());
    EXPECT_FALSE(water->isPlaceable());
    EXPECT_FLOAT_EQ(water->getColor().a, 0.5f);

    const BlockType* leaves = blocks.get(BlockIds::OAK_LEAVES);
    ASSERT_NE(leaves, nullptr);
    EXPECT_TRUE(leaves->isSolid());
    EXPECT_FALSE(leaves->isOpaque());
}

TEST(BlockRegistry, DuplicateIdKeepsFirstDefinition) {
    BlockRegistry blocks;
    const BlockType* first = blocks.registerBlock("marble", solidProperties("Marble"));
    const BlockType* second = blocks.registerBlock("marble", solidProperties("Other Marble"));

    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->getDisplayName(), "Marble");
    EXPECT_EQ(blocks.size(), 2u);
}

TEST(BlockRegistry, RejectsEmptyIdAndFrozenRegistration) {
    BlockRegistry blocks;
    EXPECT_EQ(blocks.registerBlock("", solidProperties("Nameless")), nullptr);

    blocks.freeze();
    EXPECT_TRUE(blocks.isFrozen());
    EXPECT_EQ(blocks.registerBlock("marble", solidProperties("Marble")), nullptr);
    EXPECT_FALSE(blocks.contains("marble"));
}

TEST(BlockRegistry, UnknownIdFallsBackToAir) {
    BlockRegistry blocks;
    EXPECT_EQ(blocks.get("missing"), nullptr);
    EXPECT_EQ(blocks.getOrAir("missing"), blocks.air());
}

TEST(BlockType, NormalisesHardnessAndDisplayName) {
    BlockType::Properties props;
    props.hardness = -3.0f;
    BlockType block("crystal", props);

    EXPECT_FLOAT_EQ(block.getHardness(), 0.0f);
    EXPECT_EQ(block.getDisplayName(), "crystal");
}

TEST(BlockRegistry, LoadsBlocksFromDataDirectory) {
    BlockRegistry blocks;
    ASSERT_TRUE(blocks.loadFromDirectory(std::filesystem::path(DEEPVALE_DATA_DIR) / "blocks"));

    EXPECT_EQ(blocks.size(), 12u);

    const BlockType* water = blocks.get(BlockIds::WATER);
    ASSERT_NE(water, nullptr);
    EXPECT_FALSE(water->isSolid());
    EXPECT_FALSE(water->isPlaceable());

    const BlockType* grass = blocks.get(BlockIds::GRASS);
    ASSERT_NE(grass, nullptr);
    EXPECT_FLOAT_EQ(grass->getColor().g, 0.7f);
    EXPECT_FLOAT_EQ(grass->getColor().a, 1.0f);
}

TEST(BlockRegistry, MissingDirectoryLoadsNothing) {
    BlockRegistry blocks;
    EXPECT_FALSE(blocks.loadFromDirectory("/nonexistent/deepvale/blocks"));
    EXPECT_EQ(blocks.size(), 1u);
}
