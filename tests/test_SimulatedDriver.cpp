/*
 * MicrogridControl — Simulated driver tests
 * (c) 2025 MicrogridControl contributors
 */
#include <cstdio>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "fakes/ManualTimeSource.hpp"
#include "include/ControlSession.hpp"
#include "include/SimulatedDriver.hpp"

namespace mgc {
namespace {

using fakes::ManualTimeSource;
using nlohmann::json;
using std::chrono::milliseconds;

const char* kInventory = R"({
  "components": [
    { "id": 1, "category": "inverter", "name": "pv-inverter",
      "features": { "acRelay": true, "dcRelay": true, "activeResolutionW": 100 } },
    { "id": 2, "category": "battery",
      "features": { "dcRelay": true },
      "state": { "dcRelayClosed": true } },
    { "id": 3, "category": "precharge", "prechargeMs": 500,
      "features": { "dcRelay": true, "precharge": true } },
    { "id": 4, "category": "relay", "features": { "acRelay": true },
      "state": { "error": "recoverable" } },
    { "id": 5, "category": "other", "unreachable": true }
  ]
})";

class SimulatedDriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string err;
        ASSERT_TRUE(driver.loadInventoryJson(json::parse(kInventory), err)) << err;
    }

    ManualTimeSource clock;
    SimulatedDriver  driver{clock};
};

TEST_F(SimulatedDriverTest, LoadsInventory) {
    EXPECT_EQ(driver.size(), 5u);
    const auto list = driver.listComponents();
    ASSERT_EQ(list.size(), 5u);
    EXPECT_EQ(list[0].name, "pv-inverter");
    EXPECT_EQ(list[0].category, ComponentCategory::Inverter);
    ASSERT_TRUE(list[0].features.activeResolutionW.has_value());
    EXPECT_DOUBLE_EQ(*list[0].features.activeResolutionW, 100.0);
    EXPECT_EQ(list[1].name, "component-2");

    auto hw = driver.getHardwareState(2);
    ASSERT_TRUE(hw.has_value());
    EXPECT_TRUE(hw->dcRelayClosed);
    EXPECT_EQ(driver.getErrorState(4), ErrorState::Recoverable);
}

TEST_F(SimulatedDriverTest, UnreachableComponentFailsReadsAndCommands) {
    EXPECT_FALSE(driver.getHardwareState(5).has_value());
    EXPECT_FALSE(driver.getFeatures(5).has_value());

    std::string err;
    EXPECT_FALSE(driver.setPower(5, PowerKind::Active, 0.0, err));
    EXPECT_EQ(err, "component unreachable");

    driver.setUnreachable(5, false);
    EXPECT_TRUE(driver.getHardwareState(5).has_value());
}

TEST_F(SimulatedDriverTest, RelayCommands) {
    std::string err;
    EXPECT_TRUE(driver.setRelay(1, RelayKind::Ac, true, err));
    EXPECT_TRUE(driver.getHardwareState(1)->acRelayClosed);

    EXPECT_FALSE(driver.setRelay(2, RelayKind::Ac, true, err));
    EXPECT_EQ(err, "no AC relay");

    EXPECT_FALSE(driver.setRelay(42, RelayKind::Ac, true, err));
    EXPECT_EQ(err, "no such component");
}

TEST_F(SimulatedDriverTest, FailingComponentRejectsCommands) {
    driver.setFailing(1, true);
    std::string err;
    EXPECT_FALSE(driver.setRelay(1, RelayKind::Dc, true, err));
    EXPECT_FALSE(err.empty());
    // Reads still work.
    EXPECT_TRUE(driver.getHardwareState(1).has_value());
}

TEST_F(SimulatedDriverTest, PrechargeCompletesAfterConfiguredTime) {
    std::string err;
    ASSERT_TRUE(driver.startPrecharge(3, err)) << err;
    EXPECT_TRUE(driver.getHardwareState(3)->prechargeActive);

    clock.advance(milliseconds(499));
    driver.advance(clock.now());
    EXPECT_FALSE(driver.getHardwareState(3)->dcRelayClosed);

    clock.advance(milliseconds(1));
    driver.advance(clock.now());
    auto hw = driver.getHardwareState(3);
    EXPECT_TRUE(hw->dcRelayClosed);
    EXPECT_FALSE(hw->prechargeActive);

    EXPECT_FALSE(driver.startPrecharge(1, err));
    EXPECT_EQ(err, "precharge not supported");
}

TEST_F(SimulatedDriverTest, OpeningDcCancelsPrecharge) {
    std::string err;
    ASSERT_TRUE(driver.startPrecharge(3, err));
    ASSERT_TRUE(driver.setRelay(3, RelayKind::Dc, false, err));

    clock.advance(milliseconds(1000));
    driver.advance(clock.now());
    EXPECT_FALSE(driver.getHardwareState(3)->dcRelayClosed);
    EXPECT_FALSE(driver.getHardwareState(3)->prechargeActive);
}

TEST_F(SimulatedDriverTest, AckClearsOnlyRecoverableErrors) {
    std::string err;
    EXPECT_TRUE(driver.ackError(4, err));
    EXPECT_EQ(driver.getErrorState(4), ErrorState::None);

    driver.setErrorState(4, ErrorState::Fatal);
    EXPECT_FALSE(driver.ackError(4, err));
    EXPECT_EQ(driver.getErrorState(4), ErrorState::Fatal);
}

TEST_F(SimulatedDriverTest, DrivesSessionEndToEnd) {
    ControlSession session(driver, clock);
    EXPECT_EQ(session.discover(), 5u);

    session.startComponent(3);
    clock.advance(milliseconds(600));
    driver.advance(clock.now());
    session.pollHardware();
    EXPECT_EQ(session.status(3).record.lifecycle, LifecycleState::Operational);

    session.startComponent(1);
    session.setComponentPowerActive(1, 3333.0);
    EXPECT_DOUBLE_EQ(driver.getHardwareState(1)->activePowerW, 3300.0);
    EXPECT_EQ(session.status(4).record.lifecycle, LifecycleState::Error);
}

TEST(SimulatedDriverInventory, RejectsMalformedDocuments) {
    ManualTimeSource clock;
    SimulatedDriver driver(clock);
    std::string err;

    EXPECT_FALSE(driver.loadInventoryJson(json::parse(R"({"items": []})"), err));

    EXPECT_FALSE(driver.loadInventoryJson(json::parse(R"({"components": [{"category": "battery"}]})"), err));
    EXPECT_EQ(err, "components[0]: missing or invalid 'id'");

    EXPECT_FALSE(driver.loadInventoryJson(
        json::parse(R"({"components": [{"id": 1, "category": "battery"}, {"id": 1, "category": "relay"}]})"), err));
    EXPECT_EQ(err, "components[1]: duplicate id 1");

    EXPECT_FALSE(driver.loadInventoryJson(json::parse(R"({"components": [{"id": 1, "category": "turbine"}]})"), err));
    EXPECT_EQ(err, "components[0]: unknown category 'turbine'");

    EXPECT_FALSE(driver.loadInventoryJson(
        json::parse(R"({"components": [{"id": 1, "category": "battery", "prechargeMs": -1}]})"), err));
    EXPECT_EQ(err, "components[0]: prechargeMs must be >= 0");

    // A failed load leaves the previous inventory untouched.
    EXPECT_EQ(driver.size(), 0u);
}

TEST(SimulatedDriverInventory, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "mgc_inventory_test.json";
    {
        std::ofstream os(path);
        os << kInventory;
    }
    ManualTimeSource clock;
    SimulatedDriver driver(clock);
    std::string err;
    EXPECT_TRUE(driver.loadInventory(path, err)) << err;
    EXPECT_EQ(driver.size(), 5u);
    std::remove(path.c_str());

    EXPECT_FALSE(driver.loadInventory(path, err));
    EXPECT_FALSE(err.empty());
}

} // namespace
} // namespace mgc
