/**
 * @file PluginRegistry_uTest.cpp
 * @brief Plugin lifecycle and the plugin normalization source.
 */

#include "src/unified/inc/PluginRegistry.hpp"
#include "src/unified/inc/UnifiedNormalizer.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using cascade::unified::Plugin;
using cascade::unified::PluginInfo;
using cascade::unified::PluginMetadata;
using cascade::unified::PluginRegistry;
using cascade::unified::PluginState;
using cascade::unified::RawSensor;
using cascade::unified::UnifiedNormalizer;

namespace {

/// Records lifecycle calls into a shared log.
class ScriptedPlugin final : public Plugin {
public:
  ScriptedPlugin(std::string id, std::vector<std::string>& calls)
      : calls_(calls) {
    meta_.id = std::move(id);
    meta_.name = meta_.id + " plugin";
    meta_.version = "1.0.0";
  }

  const PluginMetadata& metadata() const noexcept override { return meta_; }

  bool init() override {
    calls_.push_back(meta_.id + ":init");
    if (throwOnInit) {
      throw std::runtime_error("no device");
    }
    return initOk;
  }
  bool start() override {
    calls_.push_back(meta_.id + ":start");
    return true;
  }
  void stop() override { calls_.push_back(meta_.id + ":stop"); }
  void destroy() override { calls_.push_back(meta_.id + ":destroy"); }

  std::vector<RawSensor> poll() override {
    if (throwOnPoll) {
      throw std::runtime_error("read error");
    }
    RawSensor s{};
    s.id = "temp0";
    s.name = "Temp";
    s.typeLabel = "temperature";
    s.value = 40.0;
    return {s};
  }

  bool initOk{true};
  bool throwOnInit{false};
  bool throwOnPoll{false};

private:
  PluginMetadata meta_;
  std::vector<std::string>& calls_;
};

} // namespace

/** @test Duplicate ids and null plugins are rejected. */
TEST(PluginRegistryTest, RegisterRejectsDuplicates) {
  std::vector<std::string> calls;
  PluginRegistry reg;
  EXPECT_TRUE(reg.registerPlugin(std::make_unique<ScriptedPlugin>("nv", calls)));

  std::string error;
  EXPECT_FALSE(reg.registerPlugin(std::make_unique<ScriptedPlugin>("nv", calls), &error));
  EXPECT_NE(error.find("nv"), std::string::npos);
  EXPECT_FALSE(reg.registerPlugin(nullptr));
  EXPECT_EQ(reg.size(), 1U);
}

/** @test Lifecycle runs in order; a failing plugin is disabled, others continue. */
TEST(PluginRegistryTest, LifecycleWithFailures) {
  std::vector<std::string> calls;
  PluginRegistry reg;

  auto good = std::make_unique<ScriptedPlugin>("good", calls);
  auto bad = std::make_unique<ScriptedPlugin>("bad", calls);
  bad->initOk = false;
  auto boom = std::make_unique<ScriptedPlugin>("boom", calls);
  boom->throwOnInit = true;

  ASSERT_TRUE(reg.registerPlugin(std::move(bad)));
  ASSERT_TRUE(reg.registerPlugin(std::move(boom)));
  ASSERT_TRUE(reg.registerPlugin(std::move(good)));

  EXPECT_FALSE(reg.available());
  reg.initAll();
  reg.startAll();
  EXPECT_TRUE(reg.available());

  const std::vector<PluginInfo> INFO = reg.list();
  ASSERT_EQ(INFO.size(), 3U);
  EXPECT_EQ(INFO[0].state, PluginState::Failed);
  EXPECT_EQ(INFO[1].state, PluginState::Failed);
  EXPECT_NE(INFO[1].error.find("no device"), std::string::npos);
  EXPECT_EQ(INFO[2].state, PluginState::Running);

  reg.stopAll();
  reg.destroyAll();
  EXPECT_EQ(reg.list()[2].state, PluginState::Destroyed);

  const std::vector<std::string> GOOD_CALLS{"good:init", "good:start", "good:stop",
                                            "good:destroy"};
  std::vector<std::string> seen;
  for (const auto& C : calls) {
    if (C.rfind("good:", 0) == 0) {
      seen.push_back(C);
    }
  }
  EXPECT_EQ(seen, GOOD_CALLS);
}

/** @test Running plugins feed the normalizer under the "plugin" tag. */
TEST(PluginRegistryTest, FeedsNormalizer) {
  std::vector<std::string> calls;
  auto reg = std::make_shared<PluginRegistry>();
  auto flaky = std::make_unique<ScriptedPlugin>("flaky", calls);
  flaky->throwOnPoll = true;
  ASSERT_TRUE(reg->registerPlugin(std::make_unique<ScriptedPlugin>("nv", calls)));
  ASSERT_TRUE(reg->registerPlugin(std::move(flaky)));
  reg->initAll();
  reg->startAll();

  UnifiedNormalizer norm;
  norm.addSource(reg);
  const auto DATA = norm.merge();
  ASSERT_EQ(DATA.sensors.size(), 1U);
  EXPECT_EQ(DATA.sensors[0].id, "plugin-nv-temp0");
  EXPECT_EQ(DATA.sensors[0].source, "plugin");
  EXPECT_EQ(DATA.sensors[0].hardware, "nv plugin");
}
