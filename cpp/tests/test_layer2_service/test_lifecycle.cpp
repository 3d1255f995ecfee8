// tests/test_layer2_service/test_lifecycle.cpp
/**
 * @file test_lifecycle.cpp
 * @brief Lifecycle tests that can run inside the already initialized test process.
 */
#include "lgtv_service.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <string>

using namespace lgtv::utils;

TEST(LifecycleTest, EntryPointInitializedTheApp)
{
    EXPECT_TRUE(IsAppInitialized());
    EXPECT_FALSE(LifecycleManager::instance().is_finalized());
    EXPECT_TRUE(Logger::lifecycle_initialized());
}

TEST(LifecycleTest, RegisterAfterInitThrows)
{
    ModuleDef late("LateModule");
    late.set_startup([](const char *) {});
    EXPECT_THROW(RegisterModule(std::move(late)), std::logic_error);
}

TEST(LifecycleTest, SecondGuardIsNotOwner)
{
    // Must not re-initialize or finalize the running app.
    {
        LifecycleGuard nested(MakeModDefList(ModuleDef("NestedModule")));
    }
    EXPECT_TRUE(IsAppInitialized());
    EXPECT_FALSE(LifecycleManager::instance().is_finalized());
}

TEST(ModuleDefTest, RejectsInvalidNames)
{
    EXPECT_THROW(ModuleDef(""), std::invalid_argument);
    EXPECT_THROW(ModuleDef(std::string(ModuleDef::MAX_MODULE_NAME_LEN + 1, 'm')),
                 std::length_error);
}

TEST(ModuleDefTest, MakeModDefListKeepsOrder)
{
    auto list = MakeModDefList(ModuleDef("A"), ModuleDef("B"), ModuleDef("C"));
    EXPECT_EQ(list.size(), 3u);
}
