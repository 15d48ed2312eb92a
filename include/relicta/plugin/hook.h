#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relicta::plugin {

/**
 * @brief A point in the release workflow at which plugins may be invoked
 *
 * Hooks are immutable string identifiers. The string values are part of the
 * wire contract and must not change. A default-constructed hook is the
 * "unspecified" hook.
 */
class Hook {
public:
    Hook() = default;
    explicit Hook(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] const std::string& str() const noexcept { return name_; }
    [[nodiscard]] bool empty() const noexcept { return name_.empty(); }

    bool operator==(const Hook& other) const noexcept = default;

private:
    std::string name_;
};

inline const Hook kHookPreInit{"pre-init"};
inline const Hook kHookPostInit{"post-init"};
inline const Hook kHookPrePlan{"pre-plan"};
inline const Hook kHookPostPlan{"post-plan"};
inline const Hook kHookPreVersion{"pre-version"};
inline const Hook kHookPostVersion{"post-version"};
inline const Hook kHookPreNotes{"pre-notes"};
inline const Hook kHookPostNotes{"post-notes"};
inline const Hook kHookPreApprove{"pre-approve"};
inline const Hook kHookPostApprove{"post-approve"};
inline const Hook kHookPrePublish{"pre-publish"};
inline const Hook kHookPostPublish{"post-publish"};
inline const Hook kHookOnSuccess{"on-success"};
inline const Hook kHookOnError{"on-error"};

/**
 * @brief All declared hooks in execution order
 *
 * Every pre-X hook precedes its post-X counterpart; the two terminal hooks
 * come last.
 */
const std::vector<Hook>& allHooks();

/// Declared hook with the given name, or the unspecified hook
Hook hookFromString(std::string_view name);

bool isKnownHook(const Hook& hook);

/// Position of the hook in allHooks(), std::nullopt for undeclared hooks
std::optional<std::size_t> hookIndex(const Hook& hook);

/// For a pre-X or post-X hook, the other half of the pair
std::optional<Hook> pairedHook(const Hook& hook);

void to_json(nlohmann::json& j, const Hook& hook);
void from_json(const nlohmann::json& j, Hook& hook);

} // namespace relicta::plugin

template <> struct std::hash<relicta::plugin::Hook> {
    std::size_t operator()(const relicta::plugin::Hook& hook) const noexcept {
        return std::hash<std::string>{}(hook.str());
    }
};
