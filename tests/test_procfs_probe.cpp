#include "minitest.hpp"
#include "app/ResourceSnapshot.hpp"
#include "probe/ProcfsProbe.hpp"
#include "util/Procfs.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using hostsnap::probe::ProcfsProbe;

// Points /proc and /sys at a scratch tree for the lifetime of the guard
struct FakeRoot {
  fs::path root;
  explicit FakeRoot(const std::string& tag) {
    root = fs::temp_directory_path() / fs::path("hostsnap_test_" + tag + "_" + std::to_string(::getpid()));
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root / "proc");
    fs::create_directories(root / "sys/devices/system/cpu");
    setenv("HOSTSNAP_PROC_ROOT", (root / "").c_str(), 1);
    setenv("HOSTSNAP_SYS_ROOT", (root / "").c_str(), 1);
  }
  ~FakeRoot() {
    unsetenv("HOSTSNAP_PROC_ROOT");
    unsetenv("HOSTSNAP_SYS_ROOT");
    std::error_code ec;
    fs::remove_all(root, ec);
  }
  void write(const std::string& rel, const std::string& content) const {
    auto p = root / rel;
    fs::create_directories(p.parent_path());
    std::ofstream(p) << content;
  }
  void mkdir(const std::string& rel) const { fs::create_directories(root / rel); }
};

static const char* kStat1 =
  "cpu  100 0 100 1000 0 0 0 0\n"
  "cpu0 50 0 50 500 0 0 0 0\n"
  "cpu1 50 0 50 500 0 0 0 0\n"
  "intr 12345 0 0\n"
  "btime 1700000000\n";

static const char* kStat2 =
  "cpu  150 0 150 1100 0 0 0 0\n"
  "cpu0 75 0 75 550 0 0 0 0\n"
  "cpu1 100 0 100 550 0 0 0 0\n"
  "intr 12399 0 0\n"
  "btime 1700000000\n";

static const char* kCpuinfoX86 =
  "processor\t: 0\n"
  "vendor_id\t: GenuineIntel\n"
  "model name\t: Intel(R) Core(TM) i5-8250U CPU @ 1.60GHz\n"
  "cpu MHz\t\t: 2893.202\n"
  "physical id\t: 0\n"
  "cpu cores\t: 2\n"
  "\n"
  "processor\t: 1\n"
  "vendor_id\t: GenuineIntel\n"
  "model name\t: Intel(R) Core(TM) i5-8250U CPU @ 1.60GHz\n"
  "cpu MHz\t\t: 2893.202\n"
  "physical id\t: 0\n"
  "cpu cores\t: 2\n"
  "\n";

static void write_x86_tree(const FakeRoot& fr) {
  fr.write("proc/stat", kStat1);
  fr.write("proc/cpuinfo", kCpuinfoX86);
  fr.write("proc/meminfo",
           "MemTotal:       16384000 kB\n"
           "MemFree:         2048000 kB\n"
           "MemAvailable:   12288000 kB\n"
           "Buffers:          512000 kB\n"
           "Cached:          4096000 kB\n");
  fr.write("proc/uptime", "3600.55 7000.00\n");
  fr.write("sys/devices/system/cpu/cpu0/cpufreq/scaling_cur_freq", "3400000\n");
  fr.mkdir("proc/1");
  fr.mkdir("proc/42");
  fr.mkdir("proc/1234");
  fr.mkdir("proc/self");
  fr.mkdir("proc/sys");
}

TEST(procfs_paths_remap_under_root) {
  FakeRoot fr("remap");
  auto mapped = hostsnap::util::map_proc_path("/proc/stat");
  ASSERT_TRUE(mapped.find("hostsnap_test_remap_") != std::string::npos);
  ASSERT_EQ(hostsnap::util::map_proc_path("/etc/hostname"), "/etc/hostname");
  fr.write("sys/devices/system/cpu/online", "0-1\n");
  auto online = hostsnap::util::read_file_string("/sys/devices/system/cpu/online");
  ASSERT_TRUE(online.has_value());
  ASSERT_EQ(*online, "0-1\n");
  ASSERT_FALSE(hostsnap::util::read_file_string("/proc/does-not-exist").has_value());
}

TEST(procfs_probe_reads_full_tree) {
  FakeRoot fr("full");
  write_x86_tree(fr);
  ProcfsProbe p;
  ASSERT_TRUE(p.refresh_all());

  ASSERT_EQ(p.cpus().size(), 2u);
  ASSERT_EQ(p.cpus()[0].name, "cpu0");
  ASSERT_EQ(p.cpus()[1].name, "cpu1");
  ASSERT_EQ(p.cpus()[0].vendor_id, "GenuineIntel");
  ASSERT_EQ(p.cpus()[1].brand, "Intel(R) Core(TM) i5-8250U CPU @ 1.60GHz");
  // sysfs wins over cpuinfo, cpuinfo is the fallback
  ASSERT_EQ(p.cpus()[0].frequency_mhz, 3400u);
  ASSERT_EQ(p.cpus()[1].frequency_mhz, 2893u);
  ASSERT_TRUE(p.physical_core_count().has_value());
  ASSERT_EQ(*p.physical_core_count(), 2u);

  ASSERT_EQ(p.total_memory(), 16384000ull * 1024);
  ASSERT_EQ(p.available_memory(), 12288000ull * 1024);
  ASSERT_EQ(p.used_memory(), (16384000ull - 12288000ull) * 1024);
  ASSERT_EQ(p.uptime(), 3600u);
  ASSERT_EQ(p.boot_time(), 1700000000u);
  ASSERT_EQ(p.process_count(), 3u);
  // no baseline yet
  ASSERT_NEAR(p.global_cpu_usage(), 0.0, 1e-9);
}

TEST(procfs_probe_usage_is_delta_between_refreshes) {
  FakeRoot fr("delta");
  write_x86_tree(fr);
  ProcfsProbe p;
  ASSERT_TRUE(p.refresh_cpu_usage());
  fr.write("proc/stat", kStat2);
  std::this_thread::sleep_for(ProcfsProbe::kMinimumCpuUpdateInterval);
  ASSERT_TRUE(p.refresh_cpu_usage());
  ASSERT_NEAR(p.global_cpu_usage(), 50.0, 1e-3);
  ASSERT_NEAR(p.cpus()[0].cpu_usage, 50.0, 1e-3);
  ASSERT_NEAR(p.cpus()[1].cpu_usage, 100.0 * 100.0 / 150.0, 1e-3);
}

TEST(procfs_probe_counter_reset_reads_zero) {
  FakeRoot fr("reset");
  write_x86_tree(fr);
  ProcfsProbe p;
  fr.write("proc/stat", kStat2);
  ASSERT_TRUE(p.refresh_cpu_usage());
  fr.write("proc/stat", kStat1);
  std::this_thread::sleep_for(ProcfsProbe::kMinimumCpuUpdateInterval);
  ASSERT_TRUE(p.refresh_cpu_usage());
  ASSERT_NEAR(p.global_cpu_usage(), 0.0, 1e-9);
}

TEST(procfs_probe_back_to_back_refresh_keeps_baseline) {
  FakeRoot fr("backtoback");
  write_x86_tree(fr);
  ProcfsProbe p;
  ASSERT_TRUE(p.refresh_all());
  // counters move but no interval has passed: no usage is derived from them
  fr.write("proc/stat", kStat2);
  ASSERT_TRUE(p.refresh_cpu_all());
  ASSERT_NEAR(p.global_cpu_usage(), 0.0, 1e-9);
  ASSERT_NEAR(p.cpus()[0].cpu_usage, 0.0, 1e-9);
  ASSERT_NEAR(p.cpus()[1].cpu_usage, 0.0, 1e-9);

  // the first baseline still stands once the interval has passed
  std::this_thread::sleep_for(ProcfsProbe::kMinimumCpuUpdateInterval);
  ASSERT_TRUE(p.refresh_cpu_usage());
  ASSERT_NEAR(p.global_cpu_usage(), 50.0, 1e-3);
}

TEST(procfs_probe_meminfo_without_available) {
  FakeRoot fr("memfallback");
  write_x86_tree(fr);
  fr.write("proc/meminfo",
           "MemTotal:       8000000 kB\n"
           "MemFree:        1000000 kB\n"
           "Buffers:         500000 kB\n"
           "Cached:         2500000 kB\n");
  ProcfsProbe p;
  ASSERT_TRUE(p.refresh_all());
  ASSERT_EQ(p.available_memory(), 4000000ull * 1024);
  ASSERT_EQ(p.used_memory(), 4000000ull * 1024);
}

TEST(procfs_probe_arm_cpuinfo_and_topology) {
  FakeRoot fr("arm");
  fr.write("proc/stat",
           "cpu  10 0 10 100 0 0 0 0\n"
           "cpu0 5 0 5 50 0 0 0 0\n"
           "cpu1 5 0 5 50 0 0 0 0\n");
  fr.write("proc/cpuinfo",
           "processor\t: 0\n"
           "BogoMIPS\t: 108.00\n"
           "CPU implementer\t: 0x41\n"
           "CPU part\t: 0xd08\n"
           "\n"
           "processor\t: 1\n"
           "BogoMIPS\t: 108.00\n"
           "CPU implementer\t: 0x41\n"
           "CPU part\t: 0xd08\n"
           "\n"
           "Hardware\t: BCM2835\n");
  fr.write("proc/meminfo", "MemTotal: 4000000 kB\nMemAvailable: 3000000 kB\n");
  fr.write("proc/uptime", "12.00 20.00\n");
  fr.write("sys/devices/system/cpu/cpu0/topology/physical_package_id", "0\n");
  fr.write("sys/devices/system/cpu/cpu0/topology/core_id", "0\n");
  fr.write("sys/devices/system/cpu/cpu1/topology/physical_package_id", "0\n");
  fr.write("sys/devices/system/cpu/cpu1/topology/core_id", "1\n");
  ProcfsProbe p;
  ASSERT_TRUE(p.refresh_all());
  ASSERT_EQ(p.cpus().size(), 2u);
  ASSERT_EQ(p.cpus()[0].vendor_id, "ARM");
  ASSERT_EQ(p.cpus()[1].brand, "BCM2835");
  ASSERT_EQ(p.cpus()[0].frequency_mhz, 0u);
  ASSERT_TRUE(p.physical_core_count().has_value());
  ASSERT_EQ(*p.physical_core_count(), 2u);
}

TEST(procfs_probe_without_core_info_reports_absent) {
  FakeRoot fr("nocores");
  write_x86_tree(fr);
  fr.write("proc/cpuinfo", "processor\t: 0\nvendor_id\t: GenuineIntel\n\nprocessor\t: 1\nvendor_id\t: GenuineIntel\n\n");
  ProcfsProbe p;
  ASSERT_TRUE(p.refresh_all());
  ASSERT_FALSE(p.physical_core_count().has_value());
}

TEST(procfs_probe_missing_meminfo_fails) {
  FakeRoot fr("nomem");
  write_x86_tree(fr);
  fs::remove(fr.root / "proc/meminfo");
  ProcfsProbe p;
  ASSERT_FALSE(p.refresh_all());
}

TEST(procfs_probe_missing_stat_fails) {
  FakeRoot fr("nostat");
  ProcfsProbe p;
  ASSERT_FALSE(p.refresh_cpu_usage());
  ASSERT_FALSE(p.refresh_cpu_all());
  ASSERT_TRUE(p.cpus().empty());
}

TEST(procfs_probe_interval_is_published) {
  ProcfsProbe p;
  ASSERT_TRUE(p.minimum_cpu_update_interval() == std::chrono::milliseconds(200));
}

TEST(snapshot_loads_from_procfs_tree) {
  FakeRoot fr("snapshot");
  write_x86_tree(fr);
  hostsnap::app::ResourceSnapshot s;
  ASSERT_TRUE(s.load());
  ASSERT_EQ(s.cpu().identity.name, "cpu0");
  ASSERT_EQ(s.cpu().identity.vendor_id, "GenuineIntel");
  ASSERT_EQ(s.cpu().core_count, 2u);
  ASSERT_EQ(s.cpu().processes.size(), 2u);
  ASSERT_NEAR(s.get_cpu_frequency_ghz(), 3.4, 1e-9);
  ASSERT_EQ(s.total_memory_gb(), 15u);
  ASSERT_EQ(s.num_of_processes(), 3u);
  ASSERT_EQ(s.boot_time(), 1700000000u);

  fr.write("proc/stat", kStat2);
  fr.write("proc/uptime", "3700.00 7100.00\n");
  ASSERT_TRUE(s.reload());
  ASSERT_EQ(s.uptime(), 3700u);
  ASSERT_TRUE(s.cpu().cpu_usage >= 0.0f && s.cpu().cpu_usage <= 100.0f);
  ASSERT_EQ(s.cpu().core_count, 2u);
}
