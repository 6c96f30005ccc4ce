#include "Module.h"
#include <gtest/gtest.h>

class TestModule : public hr::Module {
public:
    explicit TestModule(const std::string& name) : hr::Module(name) {}
};

TEST(ModuleTest, LogReturnsNamedLogger) {
    TestModule module("mt_module");
    EXPECT_NO_THROW(module.log().info << "Test message");
    EXPECT_EQ(module.log().getName(), "mt_module");
}

TEST(ModuleTest, LogIsConst) {
    const TestModule module("mt_const");
    EXPECT_NO_THROW(module.log().info << "Const test message");
    EXPECT_EQ(module.log().getFullName(), "mt_const");
}

TEST(ModuleTest, RedirectLoggerPlacesModuleUnderOwner) {
    TestModule owner("mt_owner");
    TestModule part("mt_part");
    part.redirectLogger(owner.log().getFullName() + ".Part");
    EXPECT_EQ(part.log().getFullName(), "mt_owner.Part");
    EXPECT_NO_THROW(part.log().info << "Message via redirect");
}
