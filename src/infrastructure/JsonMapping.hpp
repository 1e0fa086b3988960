/**
 * @file JsonMapping.hpp
 * @brief nlohmann::json conversions for the domain types.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "domain/DocumentRecord.hpp"
#include "domain/JobStatus.hpp"
#include "domain/ParsedFields.hpp"
#include "domain/ProcessingOutcome.hpp"

namespace findoc::infrastructure {

/** @brief null for an absent value, the string otherwise. */
nlohmann::json OptionalToJson(const std::optional<std::string>& value);

/** @brief Reads an optional string; a missing key or null gives std::nullopt. */
std::optional<std::string> OptionalFromJson(const nlohmann::json& j, const char* key);

long long ToEpochMillis(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point FromEpochMillis(long long ms);

/** @brief ISO-8601 UTC with millisecond precision, e.g. "2024-04-05T10:00:00.000Z". */
std::string ToIso8601(std::chrono::system_clock::time_point tp);

} // namespace findoc::infrastructure

// ADL hooks must live in the namespace of the converted type.
namespace findoc::domain {

void to_json(nlohmann::json& j, const ParsedFields& fields);
void from_json(const nlohmann::json& j, ParsedFields& fields);

void to_json(nlohmann::json& j, const ProcessingOutcome& outcome);
void from_json(const nlohmann::json& j, ProcessingOutcome& outcome);

/** @brief Storage form of a record (all fields, epoch-millisecond timestamps). */
void to_json(nlohmann::json& j, const DocumentRecord& record);
void from_json(const nlohmann::json& j, DocumentRecord& record);

void to_json(nlohmann::json& j, const JobStatus& status);
void from_json(const nlohmann::json& j, JobStatus& status);

} // namespace findoc::domain
