#pragma once

#include "SimpleOption.hpp"
#include "world/ChunkMeshBuilder.hpp"
#include <string>

namespace Deepvale {

/**
 * World, generation and streaming settings.
 * Loaded from and saved to a flat JSON object; unknown keys are ignored,
 * missing or invalid ones keep their defaults.
 */
class WorldSettings {
public:
    WorldSettings();

    SimpleOption<int32_t> version;

    // World layout
    SimpleOption<int32_t> seed;                 // 0 picks a random seed
    SimpleOption<int32_t> worldSizeInChunks;
    SimpleOption<int32_t> worldHeightInChunks;
    SimpleOption<bool> useWorldGenerator;
    SimpleOption<int32_t> flatGroundHeight;     // used when the generator is off
    SimpleOption<MesherType> mesher;

    // Terrain noise
    SimpleOption<float> terrainScale;
    SimpleOption<int32_t> terrainOctaves;
    SimpleOption<float> terrainPersistence;
    SimpleOption<float> terrainLacunarity;
    SimpleOption<float> biomeScale;

    // Streaming
    SimpleOption<int32_t> loadDistance;
    SimpleOption<int32_t> unloadDistance;
    SimpleOption<int32_t> chunksPerTick;
    SimpleOption<int32_t> meshesPerTick;
    SimpleOption<int32_t> chunkPoolInitialSize;
    SimpleOption<int32_t> chunkPoolMaxSize;     // 0 = unlimited

    // Resources and diagnostics
    SimpleOption<std::string> dataDirectory;
    SimpleOption<std::string> logLevel;

    /**
     * Load settings from a JSON file. Returns false when the file is missing
     * or unparsable; defaults stay in place in that case.
     * A successful load re-saves the file so new keys show up with defaults.
     */
    bool load(const std::string& filepath = "deepvale.json");

    bool save(const std::string& filepath = "deepvale.json") const;

private:
    template<typename Self, typename F>
    static void forEachOption(Self& self, F&& visit);
};

} // namespace Deepvale
