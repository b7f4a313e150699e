#include <gtest/gtest.h>

#include <errno.h>
#include <string.h>
#include <sys/stat.h>

#include <fstream>
#include <sstream>

#include "core/gpio_sysfs.h"
#include "fakes.h"

namespace {

constexpr unsigned kBase = 512;
constexpr unsigned kPin = 24;

std::string readAll(const std::string &path) {
  std::ifstream in(path.c_str());
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

// A stand-in for /sys/class/gpio with the pin already exported.
class SysfsGpioTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root.write("export", "");
    root.write("unexport", "");
    pinDir = root.file("gpio" + std::to_string(kBase + kPin));
    ASSERT_EQ(::mkdir(pinDir.c_str(), 0755), 0);
  }

  TempDir root;
  std::string pinDir;
};

TEST_F(SysfsGpioTest, OutputLifecycle) {
  root.write("gpio536/direction", "");
  root.write("gpio536/value", "1");

  SysfsGpioBackend gpio(kBase, root.path());
  ASSERT_TRUE(gpio.open());
  std::string err;
  ASSERT_TRUE(gpio.claimOutput(kPin, true, &err)) << err;
  EXPECT_EQ(readAll(pinDir + "/direction"), "high");

  EXPECT_TRUE(gpio.write(kPin, false));
  EXPECT_FALSE(gpio.read(kPin));

  gpio.release(kPin);
  EXPECT_EQ(readAll(root.file("unexport")), "536");
}

TEST_F(SysfsGpioTest, SecondClaimIsBusy) {
  root.write("gpio536/direction", "");
  root.write("gpio536/value", "1");

  SysfsGpioBackend gpio(kBase, root.path());
  ASSERT_TRUE(gpio.claimInput(kPin, true));
  std::string err;
  EXPECT_FALSE(gpio.claimInput(kPin, true, &err));
  EXPECT_NE(err.find("busy"), std::string::npos);
}

TEST_F(SysfsGpioTest, FailedDirectionUnexportsAndReportsTheWriteError) {
  // A directory in place of the attribute makes every direction write fail.
  ASSERT_EQ(::mkdir((pinDir + "/direction").c_str(), 0755), 0);

  SysfsGpioBackend gpio(kBase, root.path());
  std::string err;
  EXPECT_FALSE(gpio.claimOutput(kPin, false, &err));
  EXPECT_NE(err.find(strerror(EISDIR)), std::string::npos) << err;
  EXPECT_EQ(readAll(root.file("unexport")), "536");
}

TEST(SysfsGpioOpenTest, MissingExportFails) {
  TempDir root;
  SysfsGpioBackend gpio(kBase, root.path());
  std::string err;
  EXPECT_FALSE(gpio.open(&err));
  EXPECT_NE(err.find("export"), std::string::npos);
}

}  // namespace
