#include <gtest/gtest.h>
#include <trafficgen/start_gate.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>

#include <boost/thread.hpp>
#include <sys/stat.h>

using namespace trafficgen;

namespace {

bool exists(const std::string &path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0;
}

Config gated(const std::string &file) {
  Config cfg;
  cfg.auto_start = false;
  cfg.start_signal_file = file;
  cfg.start_check_interval = 0.05;
  return cfg;
}

} // namespace

TEST(StartGate, AutoStartDoesNotWait) {
  Config cfg;
  cfg.auto_start = true;
  cfg.start_signal_file = "/nonexistent/never";
  std::atomic<bool> running{true};
  EXPECT_TRUE(wait_for_start_signal(cfg, running));
}

TEST(StartGate, ConsumesSignalFile) {
  const std::string file = ::testing::TempDir() + "trafficgen_start_signal";
  std::remove(file.c_str());
  const Config cfg = gated(file);
  std::atomic<bool> running{true};

  boost::thread writer([&file] {
    boost::this_thread::sleep_for(boost::chrono::milliseconds(150));
    std::ofstream(file) << "go";
  });
  EXPECT_TRUE(wait_for_start_signal(cfg, running));
  writer.join();
  EXPECT_FALSE(exists(file));
}

TEST(StartGate, CancelledWhileWaiting) {
  const Config cfg = gated(::testing::TempDir() + "trafficgen_never_created");
  std::atomic<bool> running{true};
  boost::thread stopper([&running] {
    boost::this_thread::sleep_for(boost::chrono::milliseconds(150));
    running = false;
  });
  EXPECT_FALSE(wait_for_start_signal(cfg, running));
  stopper.join();
}
