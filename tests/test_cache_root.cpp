#include <gtest/gtest.h>
#include <cache_root.hpp>
#include <map>
#include <optional>
#include <string>

using namespace FxCacheManager;

namespace {

class FakeEnvironment : public EnvironmentStore {
public:
    std::map<std::string, std::string> values;

    std::string get(const std::string& name) const override {
        auto it = values.find(name);
        return it != values.end() ? it->second : "";
    }

    void set(const std::string& name, const std::string& value) override {
        values[name] = value;
    }
};

class FakePrompt : public CachePathPrompt {
public:
    std::optional<std::string> answer;
    int calls = 0;

    std::optional<std::string> askCachePath() override {
        ++calls;
        return answer;
    }
};

} // namespace

TEST(CacheRootResolver, UsesEnvironmentWhenSet) {
    FakeEnvironment env;
    FakePrompt prompt;
    env.values["CACHEPATH"] = "/shows/abc/caches/sh010";

    CacheRootResolver resolver(env, prompt, "sh010_fx.hip");
    EXPECT_EQ(resolver.resolve(), "/shows/abc/caches/sh010");
    EXPECT_EQ(prompt.calls, 0);
}

TEST(CacheRootResolver, PromptsAndAppendsSceneName) {
    FakeEnvironment env;
    FakePrompt prompt;
    prompt.answer = "/shows/abc/caches/";

    CacheRootResolver resolver(env, prompt, "sh010_fx.v2.hip");
    EXPECT_EQ(resolver.resolve(), "/shows/abc/caches/sh010_fx");
    EXPECT_EQ(prompt.calls, 1);
    EXPECT_EQ(env.values["CACHEPATH"], "/shows/abc/caches/sh010_fx");
}

TEST(CacheRootResolver, SecondResolveReadsStoredValue) {
    FakeEnvironment env;
    FakePrompt prompt;
    prompt.answer = "/tmp/caches/";

    CacheRootResolver resolver(env, prompt, "shotA.hip");
    std::string first = resolver.resolve();
    std::string second = resolver.resolve();
    EXPECT_EQ(first, second);
    EXPECT_EQ(prompt.calls, 1);
}

TEST(CacheRootResolver, CancelThrows) {
    FakeEnvironment env;
    FakePrompt prompt;

    CacheRootResolver resolver(env, prompt, "sh010.hip");
    try {
        resolver.resolve();
        FAIL() << "expected CacheRootUnresolvedError";
    } catch (const CacheRootUnresolvedError& e) {
        EXPECT_STREQ(e.what(), "Operation canceled. $CACHEPATH was not set.");
    }
    EXPECT_EQ(prompt.calls, 1);
    EXPECT_TRUE(env.values.empty());
}

TEST(CacheRootResolver, EmptyAnswerWithoutSceneThrows) {
    FakeEnvironment env;
    FakePrompt prompt;
    prompt.answer = "";

    CacheRootResolver resolver(env, prompt, "");
    EXPECT_THROW(resolver.resolve(), CacheRootUnresolvedError);
    EXPECT_TRUE(env.values.empty());
}

TEST(CacheRootResolver, SceneBaseName) {
    EXPECT_EQ(CacheRootResolver::sceneBaseName("sh010_fx.v2.hip"), "sh010_fx");
    EXPECT_EQ(CacheRootResolver::sceneBaseName("/shows/abc/sh020.hipnc"), "sh020");
    EXPECT_EQ(CacheRootResolver::sceneBaseName("untitled"), "untitled");
    EXPECT_EQ(CacheRootResolver::sceneBaseName(""), "");
}

TEST(ProcessEnvironment, SetThenGet) {
    ProcessEnvironment env;
    env.set("FXCACHE_TEST_VARIABLE", "/cache/here");
    EXPECT_EQ(env.get("FXCACHE_TEST_VARIABLE"), "/cache/here");
}

TEST(ProcessEnvironment, UnsetIsEmpty) {
    ProcessEnvironment env;
    EXPECT_EQ(env.get("FXCACHE_TEST_VARIABLE_THAT_IS_NEVER_SET"), "");
}
