#include <relicta/plugin/conversion.h>

#include <spdlog/spdlog.h>

#include <cstdint>

namespace relicta::plugin::wire {

std::string stringField(const json& j, const char* key) {
    if (!j.is_object()) {
        return {};
    }
    auto it = j.find(key);
    return it != j.end() && it->is_string() ? it->get<std::string>() : std::string{};
}

bool boolField(const json& j, const char* key) {
    if (!j.is_object()) {
        return false;
    }
    auto it = j.find(key);
    return it != j.end() && it->is_boolean() && it->get<bool>();
}

double numberField(const json& j, const char* key) {
    if (!j.is_object()) {
        return 0.0;
    }
    auto it = j.find(key);
    return it != j.end() && it->is_number() ? it->get<double>() : 0.0;
}

int64_t intField(const json& j, const char* key) {
    if (!j.is_object()) {
        return 0;
    }
    auto it = j.find(key);
    return it != j.end() && it->is_number_integer() ? it->get<int64_t>() : 0;
}

std::vector<std::string> stringListField(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.is_object()) {
        return out;
    }
    if (auto it = j.find(key); it != j.end() && it->is_array()) {
        for (const auto& v : *it) {
            if (v.is_string()) {
                out.push_back(v.get<std::string>());
            }
        }
    }
    return out;
}

WireHook hookToWire(const Hook& hook) {
    const auto& h = hook.str();
    if (h == kHookPreInit.str())
        return WireHook::PreInit;
    if (h == kHookPostInit.str())
        return WireHook::PostInit;
    if (h == kHookPrePlan.str())
        return WireHook::PrePlan;
    if (h == kHookPostPlan.str())
        return WireHook::PostPlan;
    if (h == kHookPreVersion.str())
        return WireHook::PreVersion;
    if (h == kHookPostVersion.str())
        return WireHook::PostVersion;
    if (h == kHookPreNotes.str())
        return WireHook::PreNotes;
    if (h == kHookPostNotes.str())
        return WireHook::PostNotes;
    if (h == kHookPreApprove.str())
        return WireHook::PreApprove;
    if (h == kHookPostApprove.str())
        return WireHook::PostApprove;
    if (h == kHookPrePublish.str())
        return WireHook::PrePublish;
    if (h == kHookPostPublish.str())
        return WireHook::PostPublish;
    if (h == kHookOnSuccess.str())
        return WireHook::OnSuccess;
    if (h == kHookOnError.str())
        return WireHook::OnError;
    return WireHook::Unspecified;
}

Hook hookFromWire(WireHook hook) {
    switch (hook) {
        case WireHook::PreInit: return kHookPreInit;
        case WireHook::PostInit: return kHookPostInit;
        case WireHook::PrePlan: return kHookPrePlan;
        case WireHook::PostPlan: return kHookPostPlan;
        case WireHook::PreVersion: return kHookPreVersion;
        case WireHook::PostVersion: return kHookPostVersion;
        case WireHook::PreNotes: return kHookPreNotes;
        case WireHook::PostNotes: return kHookPostNotes;
        case WireHook::PreApprove: return kHookPreApprove;
        case WireHook::PostApprove: return kHookPostApprove;
        case WireHook::PrePublish: return kHookPrePublish;
        case WireHook::PostPublish: return kHookPostPublish;
        case WireHook::OnSuccess: return kHookOnSuccess;
        case WireHook::OnError: return kHookOnError;
        case WireHook::Unspecified: break;
    }
    return Hook{};
}

WireHook wireHookFromInt(int value) {
    if (value < static_cast<int>(WireHook::Unspecified) || value > static_cast<int>(WireHook::OnError)) {
        return WireHook::Unspecified;
    }
    return static_cast<WireHook>(value);
}

json commitsToWire(const std::vector<ConventionalCommit>& commits) {
    json out = json::array();
    for (const auto& c : commits) {
        out.push_back({{"hash", c.hash},
                       {"type", c.type},
                       {"scope", c.scope},
                       {"description", c.description},
                       {"body", c.body},
                       {"breaking", c.breaking},
                       {"breaking_description", c.breakingDescription},
                       {"issues", c.issues},
                       {"author", c.author},
                       {"date", c.date}});
    }
    return out;
}

std::vector<ConventionalCommit> commitsFromWire(const json& j) {
    std::vector<ConventionalCommit> out;
    if (!j.is_array()) {
        return out;
    }
    out.reserve(j.size());
    for (const auto& item : j) {
        ConventionalCommit c;
        c.hash = stringField(item, "hash");
        c.type = stringField(item, "type");
        c.scope = stringField(item, "scope");
        c.description = stringField(item, "description");
        c.body = stringField(item, "body");
        c.breaking = boolField(item, "breaking");
        c.breakingDescription = stringField(item, "breaking_description");
        c.issues = stringListField(item, "issues");
        c.author = stringField(item, "author");
        c.date = stringField(item, "date");
        out.push_back(std::move(c));
    }
    return out;
}

json changesToWire(const CategorizedChanges& changes) {
    return {{"features", commitsToWire(changes.features)},
            {"fixes", commitsToWire(changes.fixes)},
            {"breaking", commitsToWire(changes.breaking)},
            {"performance", commitsToWire(changes.performance)},
            {"refactor", commitsToWire(changes.refactor)},
            {"docs", commitsToWire(changes.docs)},
            {"other", commitsToWire(changes.other)}};
}

CategorizedChanges changesFromWire(const json& j) {
    CategorizedChanges changes;
    if (!j.is_object()) {
        return changes;
    }
    if (auto it = j.find("features"); it != j.end())
        changes.features = commitsFromWire(*it);
    if (auto it = j.find("fixes"); it != j.end())
        changes.fixes = commitsFromWire(*it);
    if (auto it = j.find("breaking"); it != j.end())
        changes.breaking = commitsFromWire(*it);
    if (auto it = j.find("performance"); it != j.end())
        changes.performance = commitsFromWire(*it);
    if (auto it = j.find("refactor"); it != j.end())
        changes.refactor = commitsFromWire(*it);
    if (auto it = j.find("docs"); it != j.end())
        changes.docs = commitsFromWire(*it);
    if (auto it = j.find("other"); it != j.end())
        changes.other = commitsFromWire(*it);
    return changes;
}

json releaseContextToWire(const ReleaseContext& ctx) {
    json j = {{"version", ctx.version},
              {"previous_version", ctx.previousVersion},
              {"tag_name", ctx.tagName},
              {"release_type", ctx.releaseType},
              {"repository_url", ctx.repositoryUrl},
              {"repository_owner", ctx.repositoryOwner},
              {"repository_name", ctx.repositoryName},
              {"branch", ctx.branch},
              {"commit_sha", ctx.commitSha},
              {"changelog", ctx.changelog},
              {"release_notes", ctx.releaseNotes},
              {"environment", ctx.environment}};
    if (ctx.changes) {
        j["changes"] = changesToWire(*ctx.changes);
    }
    return j;
}

ReleaseContext releaseContextFromWire(const json& j) {
    ReleaseContext ctx;
    if (!j.is_object()) {
        return ctx;
    }
    ctx.version = stringField(j, "version");
    ctx.previousVersion = stringField(j, "previous_version");
    ctx.tagName = stringField(j, "tag_name");
    ctx.releaseType = stringField(j, "release_type");
    ctx.repositoryUrl = stringField(j, "repository_url");
    ctx.repositoryOwner = stringField(j, "repository_owner");
    ctx.repositoryName = stringField(j, "repository_name");
    ctx.branch = stringField(j, "branch");
    ctx.commitSha = stringField(j, "commit_sha");
    ctx.changelog = stringField(j, "changelog");
    ctx.releaseNotes = stringField(j, "release_notes");
    if (auto it = j.find("environment"); it != j.end() && it->is_object()) {
        for (const auto& [key, value] : it->items()) {
            if (value.is_string()) {
                ctx.environment[key] = value.get<std::string>();
            }
        }
    }
    if (auto it = j.find("changes"); it != j.end() && it->is_object()) {
        ctx.changes = changesFromWire(*it);
    }
    return ctx;
}

json artifactsToWire(const std::vector<Artifact>& artifacts) {
    json out = json::array();
    for (const auto& a : artifacts) {
        out.push_back({{"name", a.name},
                       {"path", a.path},
                       {"type", a.type},
                       {"size", a.size},
                       {"checksum", a.checksum}});
    }
    return out;
}

std::vector<Artifact> artifactsFromWire(const json& j) {
    std::vector<Artifact> out;
    if (!j.is_array()) {
        return out;
    }
    out.reserve(j.size());
    for (const auto& item : j) {
        out.push_back(Artifact{stringField(item, "name"), stringField(item, "path"),
                               stringField(item, "type"), intField(item, "size"),
                               stringField(item, "checksum")});
    }
    return out;
}

json infoToWire(const Info& info) {
    json hooks = json::array();
    for (const auto& h : info.hooks) {
        hooks.push_back(h.str());
    }
    return {{"name", info.name},
            {"version", info.version},
            {"description", info.description},
            {"author", info.author},
            {"hooks", std::move(hooks)},
            {"config_schema", info.configSchema}};
}

Info infoFromWire(const json& j) {
    Info info;
    if (!j.is_object()) {
        return info;
    }
    info.name = stringField(j, "name");
    info.version = stringField(j, "version");
    info.description = stringField(j, "description");
    info.author = stringField(j, "author");
    info.configSchema = stringField(j, "config_schema");
    if (auto it = j.find("hooks"); it != j.end() && it->is_array()) {
        for (const auto& h : *it) {
            if (h.is_string()) {
                info.hooks.emplace_back(h.get<std::string>());
            }
        }
    }
    return info;
}

json executeResponseToWire(const ExecuteResponse& resp) {
    std::string outputs;
    if (!resp.outputs.is_null() && !resp.outputs.empty()) {
        outputs = resp.outputs.dump();
    }
    return {{"success", resp.success},
            {"message", resp.message},
            {"error", resp.error},
            {"outputs", std::move(outputs)},
            {"artifacts", artifactsToWire(resp.artifacts)}};
}

ExecuteResponse executeResponseFromWire(const json& j) {
    ExecuteResponse resp;
    if (!j.is_object()) {
        return resp;
    }
    resp.success = boolField(j, "success");
    resp.message = stringField(j, "message");
    resp.error = stringField(j, "error");
    if (auto it = j.find("outputs"); it != j.end()) {
        if (it->is_object()) {
            resp.outputs = *it;
        } else if (it->is_string() && !it->get_ref<const std::string&>().empty()) {
            auto decoded = decodeConfig(it->get_ref<const std::string&>());
            if (decoded) {
                resp.outputs = std::move(decoded).value();
            } else {
                spdlog::warn("PluginRpc: Dropping unparseable execute outputs: {}",
                             decoded.error().message);
            }
        } else if (!it->is_null() && !it->is_string()) {
            spdlog::warn("PluginRpc: Dropping execute outputs of type {}", it->type_name());
        }
    }
    if (auto it = j.find("artifacts"); it != j.end()) {
        resp.artifacts = artifactsFromWire(*it);
    }
    return resp;
}

json validateResponseToWire(const ValidateResponse& resp) {
    json errors = json::array();
    for (const auto& e : resp.errors) {
        errors.push_back({{"field", e.field}, {"message", e.message}, {"code", e.code}});
    }
    return {{"valid", resp.valid}, {"errors", std::move(errors)}};
}

ValidateResponse validateResponseFromWire(const json& j) {
    ValidateResponse resp;
    if (!j.is_object()) {
        return resp;
    }
    resp.valid = boolField(j, "valid");
    if (auto it = j.find("errors"); it != j.end() && it->is_array()) {
        for (const auto& e : *it) {
            resp.errors.push_back(
                ValidationError{stringField(e, "field"), stringField(e, "message"), stringField(e, "code")});
        }
    }
    return resp;
}

std::string encodeConfig(const ConfigMap& config) {
    if (config.is_null()) {
        return "{}";
    }
    return config.dump();
}

Result<ConfigMap> decodeConfig(std::string_view encoded) {
    if (encoded.empty()) {
        return ConfigMap::object();
    }
    try {
        auto parsed = json::parse(encoded);
        if (parsed.is_null()) {
            return ConfigMap::object();
        }
        if (!parsed.is_object()) {
            return Error{ErrorCode::InvalidData,
                         std::string("expected a JSON object, got ") + parsed.type_name()};
        }
        return parsed;
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData, e.what()};
    }
}

} // namespace relicta::plugin::wire
