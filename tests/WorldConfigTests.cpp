#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "WorldConfig.h"

namespace {

std::string tempPath(const std::string &name)
{
    return ::testing::TempDir() + name;
}

}  // namespace

TEST(WorldConfigTest, DefaultsAreAlreadyValid)
{
    WorldConfig config;
    WorldConfig clamped = config;
    clamped.validateAndClamp();
    EXPECT_EQ(config, clamped);
}

TEST(WorldConfigTest, ClampPullsValuesIntoEditorLimits)
{
    WorldConfig config;
    config.width = 0;
    config.height = 5000;
    config.maxResource = 500;
    config.maxRegenRate = -2;
    config.maxAgents = 100000;
    config.maxConsumptionRate = 0;
    config.agentHp = 99;
    config.validateAndClamp();

    EXPECT_EQ(config.width, 3);
    EXPECT_EQ(config.height, WorldConfig::MAX_GRID_SIZE);
    EXPECT_EQ(config.maxResource, WorldConfig::RESOURCE_LIMIT);
    EXPECT_EQ(config.maxRegenRate, 0);
    EXPECT_EQ(config.minRegenRate, 0);
    EXPECT_EQ(config.maxAgents, WorldConfig::AGENT_COUNT_LIMIT);
    EXPECT_EQ(config.maxConsumptionRate, 1);
    EXPECT_EQ(config.minConsumptionRate, 1);
    EXPECT_EQ(config.agentHp, WorldConfig::AGENT_HP_LIMIT);
}

TEST(WorldConfigTest, GridNarrowerThanThreeCellsIsWidened)
{
    WorldConfig config;
    config.width = 1;
    config.height = 2;
    config.validateAndClamp();
    EXPECT_EQ(config.width, 3);
    EXPECT_EQ(config.height, 3);
}

TEST(WorldConfigTest, ClampKeepsEveryMinAtOrBelowItsMax)
{
    WorldConfig config;
    config.minResource = 80;
    config.maxResource = 20;
    config.minRegenRate = 9;
    config.maxRegenRate = 4;
    config.minAgents = 0;
    config.maxAgents = 10;
    config.validateAndClamp();

    EXPECT_EQ(config.minResource, 20);
    EXPECT_EQ(config.maxResource, 20);
    EXPECT_EQ(config.minRegenRate, 4);
    EXPECT_EQ(config.maxRegenRate, 4);
    EXPECT_EQ(config.minAgents, 1);
    EXPECT_EQ(config.maxAgents, 10);
}

TEST(WorldConfigTest, SaveThenLoadRestoresEveryField)
{
    WorldConfig saved;
    saved.width = 33;
    saved.height = 17;
    saved.minResource = 3;
    saved.maxResource = 70;
    saved.minRegenRate = 1;
    saved.maxRegenRate = 6;
    saved.minAgents = 12;
    saved.maxAgents = 300;
    saved.minConsumptionRate = 2;
    saved.maxConsumptionRate = 9;
    saved.agentHp = 21;

    const std::string path = tempPath("ecology_roundtrip.txt");
    ASSERT_TRUE(saved.saveToFile(path));

    WorldConfig loaded;
    ASSERT_TRUE(loaded.loadFromFile(path));
    EXPECT_EQ(loaded, saved);

    std::remove(path.c_str());
}

TEST(WorldConfigTest, LoadSkipsCommentsUnknownKeysAndBadValues)
{
    const std::string path = tempPath("ecology_messy.txt");
    {
        std::ofstream file(path);
        file << "# hand edited\n";
        file << "\n";
        file << "width=12\n";
        file << "height=not-a-number\n";
        file << "colour=blue\n";
        file << "no separator here\n";
        file << "agentHp=7\n";
    }

    WorldConfig config;
    const int defaultHeight = config.height;
    ASSERT_TRUE(config.loadFromFile(path));
    EXPECT_EQ(config.width, 12);
    EXPECT_EQ(config.height, defaultHeight);
    EXPECT_EQ(config.agentHp, 7);

    std::remove(path.c_str());
}

TEST(WorldConfigTest, LoadClampsOutOfRangeValues)
{
    const std::string path = tempPath("ecology_range.txt");
    {
        std::ofstream file(path);
        file << "width=999\n";
        file << "minConsumptionRate=8\n";
        file << "maxConsumptionRate=3\n";
    }

    WorldConfig config;
    ASSERT_TRUE(config.loadFromFile(path));
    EXPECT_EQ(config.width, WorldConfig::MAX_GRID_SIZE);
    EXPECT_EQ(config.maxConsumptionRate, 3);
    EXPECT_EQ(config.minConsumptionRate, 3);

    std::remove(path.c_str());
}

TEST(WorldConfigTest, LoadFromMissingFileFailsAndKeepsValues)
{
    WorldConfig config;
    config.width = 42;
    EXPECT_FALSE(config.loadFromFile(tempPath("does_not_exist/ecology.txt")));
    EXPECT_EQ(config.width, 42);
}

TEST(WorldConfigTest, SaveToUnwritablePathFails)
{
    WorldConfig config;
    EXPECT_FALSE(config.saveToFile(tempPath("does_not_exist/ecology.txt")));
}
