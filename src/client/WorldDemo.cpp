#include "WorldDemo.hpp"
#include "events/WorldEvents.hpp"
#include "world/gen/DefaultContent.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <spdlog/spdlog.h>

namespace Deepvale {

namespace {

constexpr int32_t WALK_TICKS = 64;
constexpr int32_t WALK_STEP_BLOCKS = 2;

} // namespace

WorldDemo::WorldDemo(const WorldSettings& settings)
    : settings(settings) {
}

WorldDemo::~WorldDemo() {
    shutdown();
}

void WorldDemo::init() {
    spdlog::info("Initializing world...");

    std::filesystem::path dataDir(settings.dataDirectory.getValue());

    // Blocks
    blocks = std::make_unique<BlockRegistry>();
    if (!blocks->loadFromDirectory(dataDir / "blocks")) {
        spdlog::info("Using built-in block definitions");
        blocks->registerDefaults();
    }
    blocks->freeze();

    // World
    pool = std::make_unique<ChunkPool>(blocks->air(), static_cast<size_t>(settings.chunkPoolMaxSize.getValue()));
    pool->preAllocate(static_cast<size_t>(settings.chunkPoolInitialSize.getValue()));

    world = std::make_unique<VoxelWorld>(*blocks, settings.worldSizeInChunks.getValue(),
                                         settings.worldHeightInChunks.getValue());
    world->setChunkPool(pool.get());
    world->setMesherType(settings.mesher.getValue());

    TerrainSettings terrain;
    terrain.scale = settings.terrainScale.getValue();
    terrain.octaves = settings.terrainOctaves.getValue();
    terrain.persistence = settings.terrainPersistence.getValue();
    terrain.lacunarity = settings.terrainLacunarity.getValue();

    generator = std::make_unique<WorldGenerator>(*blocks, settings.seed.getValue(), terrain);
    generator->setBiomeScale(settings.biomeScale.getValue());
    generator->setWorld(world.get());
    if (!generator->loadFromDirectory(dataDir)) {
        spdlog::info("Using built-in biomes");
        for (auto& biome : DefaultContent::createBiomes(*blocks)) {
            generator->registerBiome(std::move(biome));
        }
    }

    meshRebuilds = 0;
    meshSubscription = ScopedSubscription(EventBus::subscribe<ChunkMeshRebuiltEvent>(
        [this](ChunkMeshRebuiltEvent&) { meshRebuilds++; }));

    world->initialize();
}

void WorldDemo::run() {
    if (!world) {
        spdlog::warn("World demo run before init");
        return;
    }

    if (settings.useWorldGenerator.getValue()) {
        world->setWorldGenerator(generator.get());
        world->generateWithWorldGenerator();
    } else {
        world->generateFlatTerrain(settings.flatGroundHeight.getValue(), blocks->get(BlockIds::GRASS));
    }
    logWorldStatistics();

    // Dig a shaft through the first chunk boundary to show neighbour remeshing
    for (int32_t y = CHUNK_SIZE + 2; y >= CHUNK_SIZE - 2; y--) {
        world->requestBlockChange({CHUNK_SIZE, y, CHUNK_SIZE}, blocks->air());
    }
    spdlog::info("Edit remeshed {} chunks", world->rebuildDirtyChunks());

    // Walk diagonally across the world while the loader streams chunks
    loader = std::make_unique<ChunkLoader>(*world,
                                           settings.loadDistance.getValue(), settings.unloadDistance.getValue(),
                                           settings.chunksPerTick.getValue(), settings.meshesPerTick.getValue());
    loader->setTarget({0, 0, 0});
    for (int32_t tick = 0; tick < WALK_TICKS; tick++) {
        int32_t step = tick * WALK_STEP_BLOCKS;
        loader->update({step, 0, step});
    }
    spdlog::info("Walk finished: {} chunks loaded, {} queued, {} waiting for meshes",
                 world->getChunkCount(), loader->getLoadQueueSize(), loader->getMeshQueueSize());

    logWorldStatistics();
    spdlog::info("Chunk pool: {} available, {} created", pool->getAvailableCount(), pool->getTotalCreated());
    spdlog::info("{} mesh rebuilds in total", meshRebuilds);
}

void WorldDemo::shutdown() {
    if (!blocks) {
        return;
    }

    spdlog::info("Shutting down world...");

    // Cleanup in reverse order of initialization; the world hands its
    // chunks back to the pool, which still logs while trimming
    meshSubscription.reset();
    loader.reset();
    generator.reset();
    world.reset();
    pool.reset();
    blocks.reset();

    spdlog::info("Shutdown complete");
}

void WorldDemo::logWorldStatistics() const {
    size_t quads = 0;
    std::map<std::string, size_t> histogram;

    for (const VoxelChunk* chunk : world->getAllChunks()) {
        quads += chunk->getMesh().getQuadCount();
        for (const std::string& id : chunk->getBlockIds()) {
            if (id != BlockIds::AIR) {
                histogram[id]++;
            }
        }
    }

    spdlog::info("World: {} chunks loaded, {} faces meshed", world->getChunkCount(), quads);
    for (const auto& [id, count] : histogram) {
        spdlog::info("  {:<12} {:>8}", id, count);
    }
}

} // namespace Deepvale
