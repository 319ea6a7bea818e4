#pragma once
#include "BiomeDefinition.hpp"
#include "BiomeManager.hpp"
#include "ChunkColumns.hpp"
#include "IWorldGenerator.hpp"
#include "OreGenerator.hpp"
#include "PerlinNoise.hpp"
#include "Registry.hpp"
#include "VegetationGenerator.hpp"
#include <filesystem>
#include <memory>

namespace Deepvale {

class BlockRegistry;
class VoxelWorld;

// Fractal noise parameters for the column height field
struct TerrainSettings {
    float scale = 0.02f;
    int32_t octaves = 4;
    float persistence = 0.5f;
    float lacunarity = 2.0f;
};

/**
 * Biome-driven terrain generator.
 *
 * A chunk is filled in three passes: layered terrain per column (top, filler
 * and stone below a noise height field), ore veins replacing stone, and then
 * trees and bushes rolled per surface column. The last pass writes through the
 * attached VoxelWorld and may reach into neighbouring chunks.
 *
 * Output depends only on the seed, the terrain settings and the biomes.
 * Seed 0 is replaced by a random seed on construction or setSeed().
 */
class WorldGenerator : public IWorldGenerator {
public:
    explicit WorldGenerator(const BlockRegistry& blocks, int32_t seed = 0, TerrainSettings terrain = {});

    void setSeed(int32_t seed);
    int32_t getSeed() const override { return m_seed; }

    void setTerrainSettings(const TerrainSettings& terrain) { m_terrain = terrain; }
    const TerrainSettings& getTerrainSettings() const { return m_terrain; }
    void setBiomeScale(float scale) { m_biomeManager.setBiomeScale(scale); }

    // Required for vegetation and generateWorld()
    void setWorld(VoxelWorld* world) { m_world = world; }

    // Used when no registered biome exists
    void setDefaultBiome(std::shared_ptr<BiomeDefinition> biome) { m_defaultBiome = std::move(biome); }

    bool registerBiome(std::shared_ptr<BiomeDefinition> biome);

    // Reads <directory>/biomes/*.json; returns false when no biome was loaded
    bool loadFromDirectory(const std::filesystem::path& directory);

    const Registry<BiomeDefinition>& getBiomes() const { return m_biomes; }
    const BiomeManager& getBiomeManager() const { return m_biomeManager; }

    // IWorldGenerator
    void generateChunk(VoxelChunk& chunk) override;
    const BlockType* getBlockAt(const glm::ivec3& worldPos) const override;
    int32_t getSurfaceHeight(int32_t x, int32_t z) const override;

    const BiomeDefinition* getBiomeAt(int32_t x, int32_t z) const;

    // Terrain noise in [0, 1] for a column
    float getTerrainNoise(int32_t x, int32_t z) const;

    // Generates every loaded chunk of the attached world, then remeshes it
    void generateWorld();

private:
    void refreshBiomeManager();
    ChunkColumns sampleColumns(const glm::ivec3& origin) const;
    const BlockType* determineBlock(int32_t worldY, int32_t surfaceHeight, const BiomeDefinition* biome) const;
    size_t fillTerrain(VoxelChunk& chunk, const ChunkColumns& columns) const;
    size_t generateVegetation(const VoxelChunk& chunk, const ChunkColumns& columns);

    const BlockRegistry& m_blocks;
    int32_t m_seed = 0;
    TerrainSettings m_terrain;
    glm::vec2 m_seedOffset{0.0f};

    PerlinNoise m_terrainNoise;
    std::unique_ptr<OreGenerator> m_oreGenerator;
    VegetationGenerator m_vegetationGenerator;
    BiomeManager m_biomeManager;
    Registry<BiomeDefinition> m_biomes{"biome registry"};
    std::shared_ptr<BiomeDefinition> m_defaultBiome;

    VoxelWorld* m_world = nullptr;
};

} // namespace Deepvale
