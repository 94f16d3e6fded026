#include "conf.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace {

// Reads an integer field and checks it fits in [min, max]
std::int64_t get_in_range(const json& node, const char* key, std::int64_t min, std::int64_t max) {
    const std::int64_t value = node.at(key).get<std::int64_t>();
    if (value < min || value > max) {
        throw std::invalid_argument(std::string("value of '") + key + "' out of range: " + std::to_string(value));
    }
    return value;
}

Location get_pair(const json& node, const char* key) {
    const json& pair = node.at(key);
    if (!pair.is_array() || pair.size() != 2)
        throw std::invalid_argument(std::string("'") + key + "' must be an array of 2 integers");
    return Location(pair.at(0).get<int>(), pair.at(1).get<int>());
}

bool get_visible(const json& node) {
    return node.at("visible").get<bool>();
}

Conf conf_from_json(const json& j) {
    Conf conf;

    if (j.contains("fps"))
        conf.fps = j["fps"].is_null() ? 0 : static_cast<int>(get_in_range(j, "fps", 0, 1000));
    if (j.contains("seed") && !j["seed"].is_null())
        conf.seed = static_cast<unsigned>(get_in_range(j, "seed", 0, UINT32_MAX));

    const json& env = j.at("env");
    const Location dimension = get_pair(env, "dimension");
    conf.env.dimension = Dimension(dimension.x, dimension.y);
    conf.env.tile_side = env.at("tileSide").get<float>();
    const json& background = env.at("background");
    if (!background.is_array() || background.size() != 3)
        throw std::invalid_argument("'background' must be an array of 3 integers");
    conf.env.background = {background.at(0).get<int>(), background.at(1).get<int>(), background.at(2).get<int>()};
    conf.env.grid_visible = get_visible(env.at("grid"));

    const json& nest = j.at("nest");
    conf.nest.visible = get_visible(nest);
    conf.nest.location = get_pair(nest, "location");

    const json& ants = j.at("ants");
    conf.ants.visible = get_visible(ants);
    conf.ants.count = static_cast<std::size_t>(get_in_range(ants, "count", 0, INT32_MAX));
    conf.ants.memory_span = static_cast<std::size_t>(get_in_range(ants, "memorySpan", 0, INT32_MAX));
    conf.ants.max_phero_concentration =
        static_cast<std::uint16_t>(get_in_range(ants, "maxPheroConcentration", 0, UINT16_MAX));
    conf.ants.phero_decrease = static_cast<std::uint16_t>(get_in_range(ants, "pheroDecrease", 0, UINT16_MAX));
    conf.ants.phero_increase_ratio = ants.at("pheroIncreaseRatio").get<double>();

    const json& morsels = j.at("morsels");
    conf.morsels.visible = get_visible(morsels);
    conf.morsels.count = static_cast<std::size_t>(get_in_range(morsels, "count", 0, INT32_MAX));
    conf.morsels.storage = static_cast<std::uint64_t>(get_in_range(morsels, "storage", 0, INT64_MAX));

    const json& pheromones = j.at("pheromones");
    conf.pheromones.colony_visible = get_visible(pheromones.at("colony"));
    conf.pheromones.food_visible = get_visible(pheromones.at("food"));

    validate_conf(conf);
    return conf;
}

}  // namespace

void validate_conf(const Conf& conf) {
    if (conf.env.dimension.x <= 0 || conf.env.dimension.y <= 0)
        throw std::invalid_argument("environment dimension must be positive");
    if (!(conf.env.tile_side > 0.0f))
        throw std::invalid_argument("tile side must be positive");
    const Color3& bg = conf.env.background;
    if (bg.r < 0 || bg.r > 255 || bg.g < 0 || bg.g > 255 || bg.b < 0 || bg.b > 255)
        throw std::invalid_argument("background color components must be in [0, 255]");
    if (!conf.env.dimension.contains(conf.nest.location))
        throw std::invalid_argument("nest location outside of the environment");
    if (!(conf.ants.phero_increase_ratio >= 0.0) || !std::isfinite(conf.ants.phero_increase_ratio))
        throw std::invalid_argument("pheromone increase ratio must be finite and not negative");
    if (conf.ants.max_phero_concentration <= conf.ants.phero_decrease)
        throw std::invalid_argument("max pheromone concentration must exceed the pheromone decrease");
    if (conf.fps < 0)
        throw std::invalid_argument("fps must not be negative");
}

Conf conf_from_string(const std::string& text) {
    return conf_from_json(json::parse(text));
}

Conf parse_conf(const std::string& path) {
    std::cout << "Parsing configuration from " << path << std::endl;
    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("could not open file for reading: " + path);
    return conf_from_json(json::parse(file));
}

Conf load_conf(const std::string& path) {
    try {
        return parse_conf(path);
    } catch (const std::exception& e) {
        std::cerr << "Warning: using default configuration: " << e.what() << std::endl;
        return Conf();
    }
}
