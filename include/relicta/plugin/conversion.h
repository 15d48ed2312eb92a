#pragma once

#include <relicta/core/types.h>
#include <relicta/plugin/types.h>
#include <relicta/plugin/wire.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file conversion.h
 * @brief Native <-> wire conversion for the plugin service
 *
 * The wire format is JSON. Free-form maps (config, outputs) travel as
 * string-encoded JSON so that the message shape stays fixed; hooks travel as
 * the WireHook integer.
 */

namespace relicta::plugin::wire {

using json = nlohmann::json;

// Readers for peer-supplied fields: a missing or wrongly typed field reads as
// the type's zero value instead of throwing
std::string stringField(const json& j, const char* key);
bool boolField(const json& j, const char* key);
double numberField(const json& j, const char* key);
int64_t intField(const json& j, const char* key);
std::vector<std::string> stringListField(const json& j, const char* key);

WireHook hookToWire(const Hook& hook);
Hook hookFromWire(WireHook hook);

/// Integer read off the wire, values outside the enum map to Unspecified
WireHook wireHookFromInt(int value);

json releaseContextToWire(const ReleaseContext& ctx);
ReleaseContext releaseContextFromWire(const json& j);

json changesToWire(const CategorizedChanges& changes);
CategorizedChanges changesFromWire(const json& j);

json commitsToWire(const std::vector<ConventionalCommit>& commits);
std::vector<ConventionalCommit> commitsFromWire(const json& j);

json artifactsToWire(const std::vector<Artifact>& artifacts);
std::vector<Artifact> artifactsFromWire(const json& j);

json infoToWire(const Info& info);
Info infoFromWire(const json& j);

json executeResponseToWire(const ExecuteResponse& resp);
ExecuteResponse executeResponseFromWire(const json& j);

json validateResponseToWire(const ValidateResponse& resp);
ValidateResponse validateResponseFromWire(const json& j);

/// Serialize a config map for transmission; null maps encode as "{}"
std::string encodeConfig(const ConfigMap& config);

/**
 * @brief Parse a string-encoded config map
 *
 * An empty string and "null" decode to an empty object. Anything that is not
 * a JSON object is an InvalidData error carrying the parser message.
 */
Result<ConfigMap> decodeConfig(std::string_view encoded);

} // namespace relicta::plugin::wire
