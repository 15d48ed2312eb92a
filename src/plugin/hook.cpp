#include <relicta/plugin/hook.h>

#include <nlohmann/json.hpp>

#include <algorithm>

namespace relicta::plugin {

const std::vector<Hook>& allHooks() {
    static const std::vector<Hook> hooks{
        kHookPreInit,    kHookPostInit,    kHookPrePlan,    kHookPostPlan,    kHookPreVersion,
        kHookPostVersion, kHookPreNotes,   kHookPostNotes,  kHookPreApprove,  kHookPostApprove,
        kHookPrePublish, kHookPostPublish, kHookOnSuccess, kHookOnError,
    };
    return hooks;
}

Hook hookFromString(std::string_view name) {
    const auto& hooks = allHooks();
    auto it = std::find_if(hooks.begin(), hooks.end(),
                           [name](const Hook& h) { return h.str() == name; });
    return it != hooks.end() ? *it : Hook{};
}

bool isKnownHook(const Hook& hook) {
    return hookIndex(hook).has_value();
}

std::optional<std::size_t> hookIndex(const Hook& hook) {
    const auto& hooks = allHooks();
    auto it = std::find(hooks.begin(), hooks.end(), hook);
    if (it == hooks.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(hooks.begin(), it));
}

std::optional<Hook> pairedHook(const Hook& hook) {
    if (!isKnownHook(hook)) {
        return std::nullopt;
    }
    const auto& name = hook.str();
    if (name.starts_with("pre-")) {
        return Hook{"post-" + name.substr(4)};
    }
    if (name.starts_with("post-")) {
        return Hook{"pre-" + name.substr(5)};
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const Hook& hook) {
    j = hook.str();
}

void from_json(const nlohmann::json& j, Hook& hook) {
    hook = Hook{j.get<std::string>()};
}

} // namespace relicta::plugin
