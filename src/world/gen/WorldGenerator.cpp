#include "WorldGenerator.hpp"
#include "world/BlockRegistry.hpp"
#include "world/VoxelWorld.hpp"
#include <cmath>
#include <limits>
#include <random>
#include <tracy/Tracy.hpp>
#include <spdlog/spdlog.h>

namespace Deepvale {

namespace {

constexpr int32_t DEFAULT_SURFACE_HEIGHT = 32;

// Spatial hash primes for per-chunk vegetation streams
constexpr uint32_t VEGETATION_PRIME_X = 73856093u;
constexpr uint32_t VEGETATION_PRIME_Z = 19349663u;

int32_t randomSeed() {
    std::random_device device;
    std::uniform_int_distribution<int32_t> dist(std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max());
    int32_t seed = 0;
    while (seed == 0) {
        seed = dist(device);
    }
    return seed;
}

} // namespace

WorldGenerator::WorldGenerator(const BlockRegistry& blocks, int32_t seed, TerrainSettings terrain)
    : m_blocks(blocks), m_terrain(terrain) {
    setSeed(seed);
}

void WorldGenerator::setSeed(int32_t seed) {
    if (seed == 0) {
        seed = randomSeed();
        spdlog::info("No seed given, using random seed {}", seed);
    }

    m_seed = seed;

    std::mt19937 rng(static_cast<uint32_t>(seed));
    std::uniform_real_distribution<float> offset(0.0f, 10000.0f);
    m_seedOffset.x = offset(rng);
    m_seedOffset.y = offset(rng);

    m_terrainNoise = PerlinNoise(seed);
    m_oreGenerator = std::make_unique<OreGenerator>(seed);
    m_biomeManager.setSeed(seed);

    spdlog::info("World generator initialized with seed: {}", m_seed);
}

bool WorldGenerator::registerBiome(std::shared_ptr<BiomeDefinition> biome) {
    if (!biome || biome->id.empty()) {
        spdlog::error("Cannot register a biome without an id");
        return false;
    }
    if (!biome->topBlock || !biome->fillerBlock || !biome->stoneBlock) {
        spdlog::error("Biome '{}' is missing its top, filler or stone block", biome->id);
        return false;
    }

    std::string id = biome->id;
    if (!m_biomes.registerEntry(id, std::move(biome))) {
        return false;
    }
    refreshBiomeManager();
    return true;
}

bool WorldGenerator::loadFromDirectory(const std::filesystem::path& directory) {
    size_t loaded = RegistryLoader::loadFromDirectory(directory / "biomes",
        [this](const std::string& id, simdjson::ondemand::value json) {
            auto result = BiomeDefinition::codec(m_blocks, id).decode(json);
            if (result.isError()) {
                spdlog::error("Failed to decode biome {}: {}", id, result.error);
                return false;
            }
            return registerBiome(std::make_shared<BiomeDefinition>(std::move(result.value.value())));
        });

    if (loaded == 0) {
        spdlog::warn("No biomes loaded from {}", directory.string());
        return false;
    }
    return true;
}

void WorldGenerator::refreshBiomeManager() {
    m_biomeManager.setBiomes(m_biomes.values());
}

const BiomeDefinition* WorldGenerator::getBiomeAt(int32_t x, int32_t z) const {
    if (!m_biomes.empty()) {
        return m_biomeManager.getBiomeAt(x, z);
    }
    return m_defaultBiome.get();
}

float WorldGenerator::getTerrainNoise(int32_t x, int32_t z) const {
    return m_terrainNoise.fractal(
        (static_cast<float>(x) + m_seedOffset.x) * m_terrain.scale,
        (static_cast<float>(z) + m_seedOffset.y) * m_terrain.scale,
        m_terrain.octaves, m_terrain.persistence, m_terrain.lacunarity);
}

int32_t WorldGenerator::getSurfaceHeight(int32_t x, int32_t z) const {
    const BiomeDefinition* biome = getBiomeAt(x, z);
    if (!biome) {
        return DEFAULT_SURFACE_HEIGHT;
    }

    float noise = getTerrainNoise(x, z);
    return biome->baseHeight + static_cast<int32_t>(std::lround(noise * static_cast<float>(biome->heightVariation)));
}

const BlockType* WorldGenerator::determineBlock(int32_t worldY, int32_t surfaceHeight, const BiomeDefinition* biome) const {
    if (!biome) {
        return m_blocks.air();
    }

    bool inBeachBand = surfaceHeight <= biome->waterLevel + biome->beachHeight && biome->beachBlock;

    if (worldY > surfaceHeight) {
        if (worldY <= biome->waterLevel && biome->waterBlock) {
            return biome->waterBlock;
        }
        return m_blocks.air();
    }

    if (worldY == surfaceHeight) {
        return inBeachBand ? biome->beachBlock : biome->topBlock;
    }

    if (worldY > surfaceHeight - biome->fillerDepth && worldY > biome->stoneStartHeight) {
        return inBeachBand ? biome->beachBlock : biome->fillerBlock;
    }

    return biome->stoneBlock;
}

const BlockType* WorldGenerator::getBlockAt(const glm::ivec3& worldPos) const {
    const BiomeDefinition* biome = getBiomeAt(worldPos.x, worldPos.z);
    return determineBlock(worldPos.y, getSurfaceHeight(worldPos.x, worldPos.z), biome);
}

ChunkColumns WorldGenerator::sampleColumns(const glm::ivec3& origin) const {
    ChunkColumns columns;
    for (int32_t x = 0; x < CHUNK_SIZE; x++) {
        for (int32_t z = 0; z < CHUNK_SIZE; z++) {
            int32_t worldX = origin.x + x;
            int32_t worldZ = origin.z + z;
            columns[columnIndex(x, z)] = {getBiomeAt(worldX, worldZ), getSurfaceHeight(worldX, worldZ)};
        }
    }
    return columns;
}

size_t WorldGenerator::fillTerrain(VoxelChunk& chunk, const ChunkColumns& columns) const {
    glm::ivec3 origin = chunk.getWorldOrigin();
    size_t placed = 0;

    for (int32_t x = 0; x < CHUNK_SIZE; x++) {
        for (int32_t z = 0; z < CHUNK_SIZE; z++) {
            const ColumnSample& column = columns[columnIndex(x, z)];
            for (int32_t y = 0; y < CHUNK_SIZE; y++) {
                const BlockType* block = determineBlock(origin.y + y, column.surfaceHeight, column.biome);
                if (block && !block->isAir() && chunk.setBlockLocal(x, y, z, block)) {
                    placed++;
                }
            }
        }
    }
    return placed;
}

size_t WorldGenerator::generateVegetation(const VoxelChunk& chunk, const ChunkColumns& columns) {
    if (!m_world) {
        return 0;
    }

    glm::ivec3 origin = chunk.getWorldOrigin();
    uint32_t chunkSeed = static_cast<uint32_t>(m_seed)
                       + static_cast<uint32_t>(origin.x) * VEGETATION_PRIME_X
                       + static_cast<uint32_t>(origin.z) * VEGETATION_PRIME_Z;
    std::mt19937 rng(chunkSeed);
    std::uniform_real_distribution<float> chance(0.0f, 1.0f);

    size_t written = 0;
    for (int32_t x = 0; x < CHUNK_SIZE; x++) {
        for (int32_t z = 0; z < CHUNK_SIZE; z++) {
            const ColumnSample& column = columns[columnIndex(x, z)];
            const BiomeDefinition* biome = column.biome;
            if (!biome) {
                continue;
            }

            bool tree = biome->treeChance > 0.0f && chance(rng) < biome->treeChance;
            bool bush = !tree && biome->bushChance > 0.0f && chance(rng) < biome->bushChance;
            if (!tree && !bush) {
                continue;
            }

            glm::ivec3 base(origin.x + x, column.surfaceHeight + 1, origin.z + z);
            int32_t localY = base.y - origin.y;
            if (localY < 0 || localY >= CHUNK_SIZE) {
                continue;
            }

            // Only grow on undisturbed topsoil
            if (getBlockAt({base.x, column.surfaceHeight, base.z}) != biome->topBlock) {
                continue;
            }

            if (tree) {
                if (const TreeType* treeType = biome->getRandomTreeType(rng)) {
                    written += m_vegetationGenerator.generateTree(*m_world, base, *treeType, rng);
                }
            } else {
                written += m_vegetationGenerator.generateBush(*m_world, base, biome->getBushBlock(), rng);
            }
        }
    }
    return written;
}

void WorldGenerator::generateChunk(VoxelChunk& chunk) {
    ZoneScoped;

    ChunkColumns columns = sampleColumns(chunk.getWorldOrigin());
    size_t terrain = fillTerrain(chunk, columns);
    size_t ores = m_oreGenerator->generateOres(chunk, columns);
    size_t vegetation = generateVegetation(chunk, columns);

    spdlog::trace("Generated chunk {}: {} terrain, {} ore, {} vegetation blocks",
                  chunk.getPosition(), terrain, ores, vegetation);
}

void WorldGenerator::generateWorld() {
    if (!m_world) {
        spdlog::error("No VoxelWorld assigned, call setWorld() first");
        return;
    }
    if (m_biomes.empty() && !m_defaultBiome) {
        spdlog::error("No biome assigned, register a biome or call setDefaultBiome() first");
        return;
    }

    ZoneScoped;
    spdlog::info("Starting world generation...");

    for (VoxelChunk* chunk : m_world->getAllChunks()) {
        generateChunk(*chunk);
    }
    m_world->rebuildAllChunks();

    spdlog::info("World generation complete");
}

} // namespace Deepvale
