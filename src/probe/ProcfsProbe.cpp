#include "probe/ProcfsProbe.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <ctime>
#include <map>
#include <set>
#include <sstream>
#include <string_view>
#include <utility>

namespace hostsnap::probe {

static void parse_cpu_line(const std::string_view& line, model::CpuTimes& out) {
  // line starts with 'cpu' or 'cpuN'
  size_t pos = line.find(' ');
  if (pos == std::string::npos) return;
  std::string_view rest = line.substr(pos + 1);
  uint64_t vals[8]{}; int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end > start) {
      std::from_chars(rest.data() + start, rest.data() + end, vals[i++]);
    }
    start = end + 1;
  }
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
}

static inline uint64_t parse_u64(std::string_view s) {
  uint64_t v = 0;
  // strip non-digits on right (e.g., kB) and spaces on left
  while (!s.empty() && (s.back() < '0' || s.back() > '9')) s.remove_suffix(1);
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  std::from_chars(s.data(), s.data() + s.size(), v);
  return v;
}

static std::string trim(std::string s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
  return s;
}

// Value after the ':' of a "key : value" cpuinfo line
static std::string cpuinfo_value(const std::string& line) {
  auto pos = line.find(':');
  if (pos == std::string::npos) return {};
  return trim(line.substr(pos + 1));
}

static float usage_pct(const model::CpuTimes& now, const model::CpuTimes& prev) {
  if (now.total() <= prev.total()) return 0.0f;
  auto td = now.total() - prev.total();
  auto wd = now.work() > prev.work() ? now.work() - prev.work() : 0;
  double pct = 100.0 * static_cast<double>(wd) / static_cast<double>(td);
  return static_cast<float>(std::clamp(pct, 0.0, 100.0));
}

static std::string arm_implementer_name(const std::string& code) {
  static const std::map<std::string, std::string> names = {
    {"0x41", "ARM"}, {"0x42", "Broadcom"}, {"0x43", "Cavium"}, {"0x48", "HiSilicon"},
    {"0x4e", "NVIDIA"}, {"0x51", "Qualcomm"}, {"0x53", "Samsung"}, {"0x61", "Apple"},
    {"0xc0", "Ampere"},
  };
  auto it = names.find(code);
  return it == names.end() ? code : it->second;
}

bool ProcfsProbe::refresh_cpu_usage() {
  auto txt_opt = util::read_file_string("/proc/stat");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;

  model::CpuTimes agg{};
  std::vector<model::CpuTimes> per;
  std::vector<std::string> labels;
  size_t start = 0; bool after_cpu = false;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) { parse_cpu_line(line, agg); after_cpu = true; }
    else if (after_cpu && line.starts_with("cpu")) {
      model::CpuTimes t{};
      parse_cpu_line(line, t);
      per.push_back(t);
      labels.emplace_back(line.substr(0, line.find(' ')));
    }
    else if (after_cpu) break;
    start = end + 1;
  }

  // Keep entries keyed by position; names follow the kernel's labels
  if (cpus_.size() != per.size()) {
    cpus_.resize(per.size());
    cpuinfo_mhz_.resize(per.size(), 0.0);
  }
  for (size_t i = 0; i < per.size(); ++i) cpus_[i].name = labels[i];

  // Reads closer together than the interval keep the baseline and the last figures
  auto now = std::chrono::steady_clock::now();
  if (has_last_ && now - last_sample_ < kMinimumCpuUpdateInterval) return true;

  if (has_last_) {
    global_usage_ = usage_pct(agg, last_total_);
    for (size_t i = 0; i < per.size(); ++i) {
      cpus_[i].cpu_usage = (i < last_per_.size()) ? usage_pct(per[i], last_per_[i]) : 0.0f;
    }
  }
  last_total_ = agg; last_per_ = std::move(per); has_last_ = true;
  last_sample_ = now;
  return true;
}

void ProcfsProbe::read_cpuinfo() {
  auto txt_opt = util::read_file_string("/proc/cpuinfo");
  if (!txt_opt) return;

  std::map<std::string, size_t> index_by_name;
  for (size_t i = 0; i < cpus_.size(); ++i) index_by_name.emplace(cpus_[i].name, i);

  struct Block { std::string processor, vendor, brand, phys; double mhz{0.0}; int cores{-1}; };
  std::vector<Block> blocks;
  std::string global_brand;
  Block cur;
  bool in_block = false;

  auto flush = [&]() {
    if (in_block) blocks.push_back(cur);
    cur = Block{}; in_block = false;
  };

  std::istringstream ss(*txt_opt);
  std::string line;
  while (std::getline(ss, line)) {
    if (trim(line).empty()) { flush(); continue; }
    if (line.rfind("processor", 0) == 0) { in_block = true; cur.processor = cpuinfo_value(line); }
    else if (line.rfind("vendor_id", 0) == 0) cur.vendor = cpuinfo_value(line);
    else if (line.rfind("CPU implementer", 0) == 0) cur.vendor = arm_implementer_name(cpuinfo_value(line));
    else if (line.rfind("model name", 0) == 0) cur.brand = cpuinfo_value(line);
    else if (line.rfind("physical id", 0) == 0) cur.phys = cpuinfo_value(line);
    else if (line.rfind("cpu cores", 0) == 0) {
      auto v = cpuinfo_value(line);
      int n = -1;
      if (std::from_chars(v.data(), v.data() + v.size(), n).ec == std::errc{}) cur.cores = n;
    }
    else if (line.rfind("cpu MHz", 0) == 0) {
      auto v = cpuinfo_value(line);
      cur.mhz = std::strtod(v.c_str(), nullptr);
    }
    // arm variations: board-wide model outside the processor blocks
    else if (line.rfind("Hardware", 0) == 0 || line.rfind("Processor", 0) == 0) {
      global_brand = cpuinfo_value(line);
    }
  }
  flush();

  std::map<std::string, int> socket_cores;
  for (const auto& b : blocks) {
    if (!b.phys.empty() && b.cores > 0) socket_cores.emplace(b.phys, b.cores);
    auto it = index_by_name.find("cpu" + b.processor);
    if (it == index_by_name.end()) continue;
    auto& cpu = cpus_[it->second];
    cpu.vendor_id = b.vendor;
    cpu.brand = b.brand.empty() ? global_brand : b.brand;
    cpuinfo_mhz_[it->second] = b.mhz;
  }
  if (!global_brand.empty()) {
    for (auto& cpu : cpus_) if (cpu.brand.empty()) cpu.brand = global_brand;
  }

  size_t phys_total = 0;
  for (const auto& kv : socket_cores) phys_total += static_cast<size_t>(kv.second);
  if (phys_total > 0) physical_cores_ = phys_total;
  else physical_cores_.reset();
}

void ProcfsProbe::read_topology_cores() {
  // (package, core) pairs are unique per physical core
  std::set<std::pair<std::string, std::string>> cores;
  for (const auto& cpu : cpus_) {
    std::string base = "/sys/devices/system/cpu/" + cpu.name + "/topology/";
    auto pkg = util::read_file_string(base + "physical_package_id");
    auto core = util::read_file_string(base + "core_id");
    if (!pkg || !core) return;
    cores.emplace(trim(*pkg), trim(*core));
  }
  if (!cores.empty()) physical_cores_ = cores.size();
}

void ProcfsProbe::read_frequencies() {
  for (size_t i = 0; i < cpus_.size(); ++i) {
    auto& cpu = cpus_[i];
    auto cur = util::read_file_string("/sys/devices/system/cpu/" + cpu.name + "/cpufreq/scaling_cur_freq");
    uint64_t khz = cur ? parse_u64(trim(*cur)) : 0;
    if (khz > 0) cpu.frequency_mhz = khz / 1000;
    else if (cpuinfo_mhz_[i] > 0.0) cpu.frequency_mhz = static_cast<uint64_t>(cpuinfo_mhz_[i] + 0.5);
    else cpu.frequency_mhz = 0;
  }
}

bool ProcfsProbe::refresh_cpu_all() {
  if (!refresh_cpu_usage()) return false;
  read_cpuinfo();
  if (!physical_cores_) read_topology_cores();
  read_frequencies();
  return true;
}

bool ProcfsProbe::read_meminfo() {
  auto txt_opt = util::read_file_string("/proc/meminfo");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;

  uint64_t mem_total = 0, mem_free = 0, mem_avail = 0, buffers = 0, cached = 0;
  bool have_avail = false;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start);
    if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("MemTotal:")) mem_total = parse_u64(line.substr(9));
    else if (line.starts_with("MemFree:")) mem_free = parse_u64(line.substr(8));
    else if (line.starts_with("MemAvailable:")) { mem_avail = parse_u64(line.substr(13)); have_avail = true; }
    else if (line.starts_with("Buffers:")) buffers = parse_u64(line.substr(8));
    else if (line.starts_with("Cached:")) cached = parse_u64(line.substr(7));
    start = end + 1;
  }
  if (mem_total == 0) return false;

  if (!have_avail) mem_avail = std::min(mem_total, mem_free + buffers + cached);
  mem_avail = std::min(mem_avail, mem_total);
  mem_total_ = mem_total * 1024;
  mem_available_ = mem_avail * 1024;
  mem_used_ = mem_total_ - mem_available_;
  return true;
}

bool ProcfsProbe::read_uptime() {
  auto txt = util::read_file_string("/proc/uptime");
  if (!txt) return false;
  std::istringstream ss(*txt);
  double uptime_seconds = 0.0;
  if (!(ss >> uptime_seconds) || uptime_seconds < 0.0) return false;
  uptime_ = static_cast<uint64_t>(uptime_seconds);
  return true;
}

void ProcfsProbe::read_boot_time() {
  if (auto txt = util::read_file_string("/proc/stat")) {
    std::istringstream ss(*txt);
    std::string line;
    while (std::getline(ss, line)) {
      if (line.rfind("btime ", 0) == 0) {
        boot_time_ = parse_u64(std::string_view(line).substr(6));
        return;
      }
    }
  }
  // No btime line: derive from the wall clock
  auto now = static_cast<uint64_t>(std::time(nullptr));
  boot_time_ = now > uptime_ ? now - uptime_ : 0;
}

void ProcfsProbe::count_processes() {
  size_t n = 0;
  for (const auto& name : util::list_dir("/proc")) {
    if (!name.empty() && std::all_of(name.begin(), name.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; })) {
      ++n;
    }
  }
  process_count_ = n;
}

bool ProcfsProbe::refresh_all() {
  bool ok = refresh_cpu_all();
  ok = read_meminfo() && ok;
  ok = read_uptime() && ok;
  read_boot_time();
  count_processes();
  return ok;
}

std::unique_ptr<IProbe> make_procfs_probe() {
  return std::make_unique<ProcfsProbe>();
}

} // namespace hostsnap::probe
