#include "GenomeSerializer.h"

#include "core/LoggingChannels.h"

#include <cmath>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace Biomorph {

namespace {

SensorType sensorTypeFromName(const std::string& name)
{
    if (name == "eye") {
        return SensorType::Eye;
    }
    if (name == "feeler") {
        return SensorType::Feeler;
    }
    throw std::runtime_error("unknown sensor type '" + name + "'");
}

bool finite(double value)
{
    return std::isfinite(value);
}

} // namespace

void to_json(nlohmann::json& j, const Segment& segment)
{
    j = nlohmann::json{
        { "id", segment.id },
        { "parentId", segment.parentId ? nlohmann::json(*segment.parentId) : nlohmann::json() },
        { "attachAngle", segment.attachAngle },
        { "mass", segment.mass },
        { "color", segment.color },
        { "isHeart", segment.isHeart },
        { "isMouth", segment.isMouth },
        { "isGripper", segment.isGripper },
    };

    std::visit(
        [&j](auto&& shape) {
            using T = std::decay_t<decltype(shape)>;
            if constexpr (std::is_same_v<T, CircleSegment>) {
                j["shape"] = "circle";
                j["radius"] = shape.radius;
            }
            else {
                j["shape"] = "rectangle";
                j["length"] = shape.length;
                j["width"] = shape.width;
            }
        },
        segment.shape);
}

void from_json(const nlohmann::json& j, Segment& segment)
{
    segment.id = j.at("id").get<int>();
    const auto& parent = j.value("parentId", nlohmann::json());
    segment.parentId = parent.is_null() ? std::nullopt : std::optional<int>(parent.get<int>());
    segment.attachAngle = j.value("attachAngle", 0.0);
    segment.mass = j.at("mass").get<double>();
    segment.color = j.value("color", Rgb{ 128, 128, 128 });
    segment.isHeart = j.value("isHeart", false);
    segment.isMouth = j.value("isMouth", false);
    segment.isGripper = j.value("isGripper", false);

    const std::string shape = j.at("shape").get<std::string>();
    if (shape == "circle") {
        segment.shape = CircleSegment{ .radius = j.at("radius").get<double>() };
    }
    else if (shape == "rectangle") {
        segment.shape = RectangleSegment{ .length = j.at("length").get<double>(),
                                          .width = j.at("width").get<double>() };
    }
    else {
        throw std::runtime_error("unknown segment shape '" + shape + "'");
    }
}

void to_json(nlohmann::json& j, const MotorPattern& pattern)
{
    j = nlohmann::json{ { "amplitude", pattern.amplitude },
                        { "frequency", pattern.frequency },
                        { "phase", pattern.phase } };
}

void from_json(const nlohmann::json& j, MotorPattern& pattern)
{
    pattern.amplitude = j.at("amplitude").get<double>();
    pattern.frequency = j.at("frequency").get<double>();
    pattern.phase = j.at("phase").get<double>();
}

void to_json(nlohmann::json& j, const Joint& joint)
{
    j = nlohmann::json{ { "segA", joint.segA },
                        { "segB", joint.segB },
                        { "attachPointA", joint.attachPointA },
                        { "attachPointB", joint.attachPointB },
                        { "restLength", joint.restLength },
                        { "minLength", joint.minLength },
                        { "maxLength", joint.maxLength },
                        { "stiffness", joint.stiffness },
                        { "motorPattern", joint.motorPattern } };
}

void from_json(const nlohmann::json& j, Joint& joint)
{
    joint.segA = j.at("segA").get<int>();
    joint.segB = j.at("segB").get<int>();
    joint.attachPointA = j.value("attachPointA", Vector2d{});
    joint.attachPointB = j.value("attachPointB", Vector2d{});
    joint.restLength = j.at("restLength").get<double>();
    joint.minLength = j.at("minLength").get<double>();
    joint.maxLength = j.at("maxLength").get<double>();
    joint.stiffness = j.at("stiffness").get<double>();
    joint.motorPattern = j.value("motorPattern", MotorPattern{});
}

void to_json(nlohmann::json& j, const Sensor& sensor)
{
    j = nlohmann::json{ { "id", sensor.id },
                        { "type", toString(sensor.type) },
                        { "segmentId", sensor.segmentId },
                        { "angle", sensor.angle },
                        { "range", sensor.range } };
    if (sensor.type == SensorType::Eye) {
        j["fov"] = sensor.fov;
    }
}

void from_json(const nlohmann::json& j, Sensor& sensor)
{
    sensor.id = j.value("id", 0);
    sensor.type = sensorTypeFromName(j.at("type").get<std::string>());
    sensor.segmentId = j.at("segmentId").get<int>();
    sensor.angle = j.value("angle", 0.0);
    sensor.range = j.at("range").get<double>();
    sensor.fov = j.value("fov", 0.0);
}

void to_json(nlohmann::json& j, const SensorMotorWeight& weight)
{
    j = nlohmann::json{ { "amplitudeMod", weight.amplitudeMod },
                        { "frequencyMod", weight.frequencyMod },
                        { "phaseMod", weight.phaseMod } };
}

void from_json(const nlohmann::json& j, SensorMotorWeight& weight)
{
    weight.amplitudeMod = j.value("amplitudeMod", 0.0);
    weight.frequencyMod = j.value("frequencyMod", 0.0);
    weight.phaseMod = j.value("phaseMod", 0.0);
}

void to_json(nlohmann::json& j, const Genome& genome)
{
    j = nlohmann::json{ { "segments", genome.segments },
                        { "joints", genome.joints },
                        { "sensors", genome.sensors },
                        { "sensorMotorWeights", genome.sensorMotorWeights },
                        { "generation", genome.generation },
                        { "fitness", genome.fitness },
                        { "baseHue", genome.baseHue },
                        { "beauty", genome.beauty },
                        { "memorySize", genome.memorySize } };
}

void from_json(const nlohmann::json& j, Genome& genome)
{
    genome.segments = j.at("segments").get<std::vector<Segment>>();
    genome.joints = j.value("joints", std::vector<Joint>{});
    genome.sensors = j.value("sensors", std::vector<Sensor>{});
    genome.sensorMotorWeights =
        j.value("sensorMotorWeights", std::vector<std::vector<SensorMotorWeight>>{});
    genome.generation = j.value("generation", 0);
    genome.fitness = j.value("fitness", 0.0);
    genome.baseHue = j.value("baseHue", 0.0);
    genome.beauty = j.value("beauty", 0.5);
    genome.memorySize = j.value("memorySize", 2);
}

namespace GenomeSerializer {

nlohmann::json toJson(const Genome& genome)
{
    return nlohmann::json(genome);
}

std::string toString(const Genome& genome)
{
    return toJson(genome).dump(2);
}

std::string validate(const Genome& genome)
{
    const int segmentCount = static_cast<int>(genome.segments.size());
    if (segmentCount == 0) {
        return "genome has no segments";
    }
    if (segmentCount > Genome::MaxSegments) {
        return "genome has " + std::to_string(segmentCount) + " segments, at most "
            + std::to_string(Genome::MaxSegments) + " allowed";
    }
    if (genome.sensors.size() > static_cast<size_t>(Genome::MaxSensors)) {
        return "genome has " + std::to_string(genome.sensors.size()) + " sensors, at most "
            + std::to_string(Genome::MaxSensors) + " allowed";
    }

    for (int i = 0; i < segmentCount; i++) {
        const Segment& segment = genome.segments[i];
        if (!finite(segment.mass) || segment.mass <= 0.0) {
            return "segment " + std::to_string(i) + " has non-positive mass";
        }
        if (segment.parentId && (*segment.parentId < 0 || *segment.parentId >= segmentCount)) {
            return "segment " + std::to_string(i) + " has unknown parent";
        }
        if (!finite(segmentHalfLength(segment)) || segmentHalfLength(segment) <= 0.0) {
            return "segment " + std::to_string(i) + " has invalid dimensions";
        }
        if (const auto* rect = std::get_if<RectangleSegment>(&segment.shape)) {
            if (!finite(rect->width) || rect->width <= 0.0) {
                return "segment " + std::to_string(i) + " has invalid width";
            }
        }
    }

    for (size_t i = 0; i < genome.joints.size(); i++) {
        const Joint& joint = genome.joints[i];
        const std::string name = "joint " + std::to_string(i);
        if (joint.segA < 0 || joint.segA >= segmentCount || joint.segB < 0
            || joint.segB >= segmentCount) {
            return name + " references a missing segment";
        }
        if (joint.segA == joint.segB) {
            return name + " connects a segment to itself";
        }
        if (!finite(joint.restLength) || !finite(joint.minLength) || !finite(joint.maxLength)
            || joint.minLength > joint.maxLength) {
            return name + " has an invalid length range";
        }
        const MotorPattern& motor = joint.motorPattern;
        if (!finite(motor.amplitude) || !finite(motor.frequency) || !finite(motor.phase)) {
            return name + " has a non-finite motor pattern";
        }
    }

    for (size_t i = 0; i < genome.sensors.size(); i++) {
        const Sensor& sensor = genome.sensors[i];
        if (!finite(sensor.range) || sensor.range < 0.0 || !finite(sensor.angle)
            || !finite(sensor.fov)) {
            return "sensor " + std::to_string(i) + " has invalid geometry";
        }
    }

    if (genome.memorySize < 0 || genome.memorySize > Genome::MaxMemorySize) {
        return "memorySize must be between 0 and " + std::to_string(Genome::MaxMemorySize);
    }
    return "";
}

Result<Genome, std::string> fromJson(const nlohmann::json& doc)
{
    if (!doc.is_object()) {
        return Result<Genome, std::string>::error("genome document must be a JSON object");
    }

    Genome genome;
    try {
        genome = doc.get<Genome>();
    }
    catch (const std::exception& e) {
        return Result<Genome, std::string>::error(
            std::string("malformed genome document: ") + e.what());
    }

    const std::string problem = validate(genome);
    if (!problem.empty()) {
        return Result<Genome, std::string>::error(problem);
    }

    if (genome.normalizeSensorMotorWeights()) {
        LOG_WARN(
            Evolution,
            "Imported genome weight matrix did not match {} sensors x {} joints, repaired",
            genome.sensors.size(),
            genome.joints.size());
    }

    return Result<Genome, std::string>::okay(std::move(genome));
}

Result<Genome, std::string> fromString(const std::string& text)
{
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error& e) {
        return Result<Genome, std::string>::error(std::string("invalid JSON: ") + e.what());
    }
    return fromJson(doc);
}

Result<Genome, std::string> loadFile(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Genome, std::string>::error("cannot open " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    auto result = fromString(buffer.str());
    if (result.isError()) {
        return Result<Genome, std::string>::error(path.string() + ": " + result.errorValue());
    }

    LOG_INFO(Evolution, "Loaded genome from {}", path.string());
    return result;
}

Result<std::monostate, std::string> saveFile(
    const Genome& genome, const std::filesystem::path& path)
{
    std::ofstream file(path);
    if (!file.is_open()) {
        return Result<std::monostate, std::string>::error("cannot write " + path.string());
    }

    file << toString(genome) << '\n';
    if (!file) {
        return Result<std::monostate, std::string>::error("failed writing " + path.string());
    }

    LOG_INFO(
        Evolution, "Saved genome (generation {}) to {}", genome.generation, path.string());
    return Result<std::monostate, std::string>::okay(std::monostate{});
}

} // namespace GenomeSerializer
} // namespace Biomorph
