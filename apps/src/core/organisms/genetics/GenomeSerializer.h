#pragma once

#include "Genome.h"
#include "core/Result.h"

#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <variant>

namespace Biomorph {

void to_json(nlohmann::json& j, const Segment& segment);
void from_json(const nlohmann::json& j, Segment& segment);
void to_json(nlohmann::json& j, const MotorPattern& pattern);
void from_json(const nlohmann::json& j, MotorPattern& pattern);
void to_json(nlohmann::json& j, const Joint& joint);
void from_json(const nlohmann::json& j, Joint& joint);
void to_json(nlohmann::json& j, const Sensor& sensor);
void from_json(const nlohmann::json& j, Sensor& sensor);
void to_json(nlohmann::json& j, const SensorMotorWeight& weight);
void from_json(const nlohmann::json& j, SensorMotorWeight& weight);
void to_json(nlohmann::json& j, const Genome& genome);
void from_json(const nlohmann::json& j, Genome& genome);

/**
 * Genome interchange documents (JSON).
 *
 * Parsing validates structure and value ranges; a mismatched sensor-motor
 * weight matrix is repaired rather than rejected.
 */
namespace GenomeSerializer {

nlohmann::json toJson(const Genome& genome);
std::string toString(const Genome& genome);

Result<Genome, std::string> fromJson(const nlohmann::json& doc);
Result<Genome, std::string> fromString(const std::string& text);

Result<Genome, std::string> loadFile(const std::filesystem::path& path);
Result<std::monostate, std::string> saveFile(
    const Genome& genome, const std::filesystem::path& path);

// Empty string when the genome is usable, otherwise the first problem found.
std::string validate(const Genome& genome);

} // namespace GenomeSerializer
} // namespace Biomorph
