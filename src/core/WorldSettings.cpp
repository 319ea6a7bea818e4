#include "WorldSettings.hpp"
#include <fstream>
#include <iterator>
#include <limits>
#include <vector>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace Deepvale {

WorldSettings::WorldSettings()
    : version(ofInt("version", 1, 1, 100))
    , seed(ofInt("seed", 0, std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max()))
    , worldSizeInChunks(ofInt("worldSizeInChunks", 4, 1, 64))
    , worldHeightInChunks(ofInt("worldHeightInChunks", 2, 1, 16))
    , useWorldGenerator(ofBoolean("useWorldGenerator", true))
    , flatGroundHeight(ofInt("flatGroundHeight", 8, 0, 256))
    , mesher(ofEnum("mesher", MesherType::NAIVE))
    , terrainScale(ofFloat("terrainScale", 0.02f, 0.0001f, 1.0f))
    , terrainOctaves(ofInt("terrainOctaves", 4, 1, 8))
    , terrainPersistence(ofFloat("terrainPersistence", 0.5f, 0.0f, 1.0f))
    , terrainLacunarity(ofFloat("terrainLacunarity", 2.0f, 1.0f, 4.0f))
    , biomeScale(ofFloat("biomeScale", 0.005f, 0.0001f, 1.0f))
    , loadDistance(ofInt("loadDistance", 4, 1, 32))
    , unloadDistance(ofInt("unloadDistance", 6, 2, 64))
    , chunksPerTick(ofInt("chunksPerTick", 2, 1, 64))
    , meshesPerTick(ofInt("meshesPerTick", 4, 1, 64))
    , chunkPoolInitialSize(ofInt("chunkPoolInitialSize", 16, 0, 4096))
    , chunkPoolMaxSize(ofInt("chunkPoolMaxSize", 128, 0, 4096))
    , dataDirectory(ofString("dataDirectory", "data"))
    , logLevel(ofString("logLevel", "info"))
{
}

template<typename Self, typename F>
void WorldSettings::forEachOption(Self& self, F&& visit) {
    visit(self.version);
    visit(self.seed);
    visit(self.worldSizeInChunks);
    visit(self.worldHeightInChunks);
    visit(self.useWorldGenerator);
    visit(self.flatGroundHeight);
    visit(self.mesher);
    visit(self.terrainScale);
    visit(self.terrainOctaves);
    visit(self.terrainPersistence);
    visit(self.terrainLacunarity);
    visit(self.biomeScale);
    visit(self.loadDistance);
    visit(self.unloadDistance);
    visit(self.chunksPerTick);
    visit(self.meshesPerTick);
    visit(self.chunkPoolInitialSize);
    visit(self.chunkPoolMaxSize);
    visit(self.dataDirectory);
    visit(self.logLevel);
}

bool WorldSettings::load(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        spdlog::info("Settings file '{}' not found, using defaults", filepath);
        return false;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    file.close();

    simdjson::dom::parser parser;
    simdjson::dom::element doc;
    auto error = parser.parse(content).get(doc);
    if (error) {
        spdlog::warn("Failed to parse settings '{}': {}", filepath, simdjson::error_message(error));
        return false;
    }

    simdjson::dom::object root;
    if (doc.get(root)) {
        spdlog::warn("Settings '{}' must contain a JSON object", filepath);
        return false;
    }

    forEachOption(*this, [&root](auto& option) {
        simdjson::dom::element elem;
        if (!root[option.getKey()].get(elem)) {
            option.deserialize(elem);
        }
    });

    if (unloadDistance.getValue() <= loadDistance.getValue()) {
        spdlog::warn("unloadDistance {} must exceed loadDistance {}, adjusting",
                     unloadDistance, loadDistance);
        unloadDistance = loadDistance.getValue() + 2;
    }

    spdlog::info("Loaded settings (v{}): seed={}, world={}x{}x{} chunks, mesher={}",
                 version, seed, worldSizeInChunks, worldHeightInChunks, worldSizeInChunks, mesher);

    save(filepath);
    return true;
}

bool WorldSettings::save(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("Failed to open settings file for writing: {}", filepath);
        return false;
    }

    std::vector<std::string> lines;
    forEachOption(*this, [&lines](const auto& option) {
        lines.push_back(fmt::format("  \"{}\": {}", option.getKey(), option.serialize()));
    });

    file << "{\n" << fmt::format("{}", fmt::join(lines, ",\n")) << "\n}\n";
    if (!file.good()) {
        spdlog::error("Failed to write settings file: {}", filepath);
        return false;
    }

    spdlog::debug("Saved settings (v{}) to {}", version, filepath);
    return true;
}

} // namespace Deepvale
