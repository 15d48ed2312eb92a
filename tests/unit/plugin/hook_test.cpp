#include <gtest/gtest.h>

#include <relicta/plugin/hook.h>
#include <relicta/plugin/types.h>

#include <nlohmann/json.hpp>

#include <unordered_set>

using namespace relicta::plugin;

TEST(HookTest, AllHooksInWorkflowOrder) {
    const auto& hooks = allHooks();
    ASSERT_EQ(hooks.size(), 14u);
    EXPECT_EQ(hooks.front(), kHookPreInit);
    EXPECT_EQ(hooks[hooks.size() - 2], kHookOnSuccess);
    EXPECT_EQ(hooks.back(), kHookOnError);

    for (const auto& hook : hooks) {
        auto paired = pairedHook(hook);
        if (!paired || !hook.str().starts_with("pre-")) {
            continue;
        }
        EXPECT_LT(*hookIndex(hook), *hookIndex(*paired)) << hook.str();
    }
}

TEST(HookTest, WireStringsAreStable) {
    EXPECT_EQ(kHookPreInit.str(), "pre-init");
    EXPECT_EQ(kHookPostPlan.str(), "post-plan");
    EXPECT_EQ(kHookPreApprove.str(), "pre-approve");
    EXPECT_EQ(kHookPostPublish.str(), "post-publish");
    EXPECT_EQ(kHookOnSuccess.str(), "on-success");
    EXPECT_EQ(kHookOnError.str(), "on-error");
}

TEST(HookTest, LookupByName) {
    EXPECT_EQ(hookFromString("pre-notes"), kHookPreNotes);
    EXPECT_TRUE(hookFromString("pre-deploy").empty());
    EXPECT_TRUE(hookFromString("").empty());

    EXPECT_TRUE(isKnownHook(kHookPostVersion));
    EXPECT_FALSE(isKnownHook(Hook{"post-deploy"}));
    EXPECT_FALSE(isKnownHook(Hook{}));
    EXPECT_FALSE(hookIndex(Hook{"post-deploy"}).has_value());
}

TEST(HookTest, PairedHooks) {
    EXPECT_EQ(pairedHook(kHookPrePublish), kHookPostPublish);
    EXPECT_EQ(pairedHook(kHookPostInit), kHookPreInit);
    EXPECT_FALSE(pairedHook(kHookOnSuccess).has_value());
    EXPECT_FALSE(pairedHook(kHookOnError).has_value());
    EXPECT_FALSE(pairedHook(Hook{"pre-deploy"}).has_value());
}

TEST(HookTest, UsableAsHashKeyAndJson) {
    std::unordered_set<Hook> seen(allHooks().begin(), allHooks().end());
    EXPECT_EQ(seen.size(), allHooks().size());

    nlohmann::json j = kHookPreVersion;
    EXPECT_EQ(j, "pre-version");
    EXPECT_EQ(j.get<Hook>(), kHookPreVersion);
}

TEST(HookTest, InfoSupports) {
    Info info;
    info.hooks = {kHookPrePublish, kHookOnError};
    EXPECT_TRUE(info.supports(kHookPrePublish));
    EXPECT_TRUE(info.supports(Hook{"on-error"}));
    EXPECT_FALSE(info.supports(kHookPostPublish));
}

TEST(HookTest, CategorizedChangesTotal) {
    CategorizedChanges changes;
    EXPECT_EQ(changes.total(), 0u);
    changes.features.resize(2);
    changes.fixes.resize(1);
    changes.other.resize(3);
    EXPECT_EQ(changes.total(), 6u);
}
