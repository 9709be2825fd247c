#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <future>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "mpam/mpam.hpp"

using namespace mpam;
namespace fs = std::filesystem;

// -------------------- 并发限流：C++17 简单信号量 --------------------
class Semaphore {
  std::mutex m_;
  std::condition_variable cv_;
  size_t count_;

public:
  explicit Semaphore(size_t c) : count_(c) {}
  void acquire() {
    std::unique_lock<std::mutex> lk(m_);
    cv_.wait(lk, [&] { return count_ > 0; });
    --count_;
  }
  void release() {
    std::lock_guard<std::mutex> lk(m_);
    ++count_;
    cv_.notify_one();
  }
};

// -------------------- 双写输出：控制台 + 文件 --------------------
struct DualOut {
  std::ostream& console;
  std::ofstream file;
  DualOut(std::ostream& c, const std::string& filepath)
      : console(c), file(filepath, std::ios::out | std::ios::app) {}
  template <typename T>
  DualOut& operator<<(const T& v) {
    console << v;
    if (file) file << v;
    return *this;
  }
  DualOut& operator<<(std::ostream& (*pf)(std::ostream&)) {
    pf(console);
    if (file) pf(file);
    return *this;
  }
};

// -------------------- 时间戳/工具函数 --------------------
static std::string now_stamp()
{
  using clock = std::chrono::system_clock;
  auto t = clock::to_time_t(clock::now());
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y%m%d-%H%M%S");
  return oss.str();
}

static void ensure_dir(const fs::path& p)
{
  std::error_code ec;
  fs::create_directories(p, ec);
}

static void ensure_csv_header(const std::string& csv_path)
{
  std::ifstream fin(csv_path);
  if (fin.good() && fin.peek() != std::ifstream::traits_type::eof()) return;

  std::ofstream fout(csv_path, std::ios::out | std::ios::app);
  fout << "timestamp,run_id,scenario,M,level_spacing,receiver,ptx_dbm,ber,ser,"
          "opt_iterations,opt_converged,n_diagnostics\n";
}

static double dBm_to_watt(double dBm) { return 1e-3 * std::pow(10.0, dBm / 10.0); }

// log10(BER) 在 BERtarget 处线性插值得到灵敏度（dBm）；未跨越时返回 NaN
static double interp_sensitivity(const std::vector<double>& ptx_dBm,
                                 const std::vector<double>& ber,
                                 double ber_target)
{
  const double y0 = std::log10(ber_target);
  for (size_t i = 0; i + 1 < ber.size(); ++i) {
    if (!(ber[i] > 0.0) || !(ber[i + 1] > 0.0)) continue;
    const double ya = std::log10(ber[i]);
    const double yb = std::log10(ber[i + 1]);
    if ((ya - y0) * (yb - y0) <= 0.0 && ya != yb) {
      return ptx_dBm[i] + (y0 - ya) * (ptx_dBm[i + 1] - ptx_dBm[i]) / (yb - ya);
    }
  }
  return std::numeric_limits<double>::quiet_NaN();
}

// ======== 用户可改区域 ========
static constexpr double kBitRate     = 112e9;
static constexpr double kBerTarget   = 1.8e-4;
static constexpr double kRexdB       = -10.0;
static constexpr double kLinkAttdB   = 2.0;
static constexpr double kN0          = 30e-12 * 30e-12;
static constexpr double kPtxStartdBm = -30.0;
static constexpr double kPtxStopdBm  = -4.0;
static constexpr double kPtxStepdBm  = 0.5;
static constexpr double kApdGain     = 10.0;
static constexpr double kSoaGaindB   = 20.0;
// =============================

enum class Receiver { PIN, APD, SOA };

static const char* receiver_name(Receiver r)
{
  switch (r) {
    case Receiver::PIN: return "pin";
    case Receiver::APD: return "apd";
    case Receiver::SOA: return "soa";
  }
  return "unknown";
}

struct SweepScenario {
  std::string  name;
  int          M = 4;
  LevelSpacing spacing = LevelSpacing::EquallySpaced;
  Receiver     receiver = Receiver::PIN;
};

static std::vector<SweepScenario> build_scenarios(const std::vector<int>& orders,
                                                  const std::vector<LevelSpacing>& spacings,
                                                  const std::vector<Receiver>& receivers)
{
  std::vector<SweepScenario> scenarios;
  for (int M : orders) {
    for (LevelSpacing sp : spacings) {
      for (Receiver rx : receivers) {
        SweepScenario sc;
        sc.M = M;
        sc.spacing = sp;
        sc.receiver = rx;
        std::ostringstream oss;
        oss << M << "pam_" << to_string(sp) << "_" << receiver_name(rx);
        sc.name = oss.str();
        scenarios.push_back(std::move(sc));
      }
    }
  }
  return scenarios;
}

// 每个任务的返回包（带索引，便于按原顺序汇总）
struct ScenarioOutput {
  std::size_t idx{};
  SweepScenario scenario;
  std::vector<double> ptx_dBm;
  std::vector<double> ber;
  std::vector<double> ser;
  int  opt_iterations = 0;
  bool opt_converged  = true;
  std::vector<Diagnostic> diagnostics;
  double sensitivity_dBm = std::numeric_limits<double>::quiet_NaN();
};

// 单个 scenario：自己持有 PAM 与噪声模型，不与其它任务共享可变状态
static ScenarioOutput run_scenario(std::size_t idx, const SweepScenario& sc,
                                   const std::vector<double>& ptx_dBm)
{
  ScenarioOutput out;
  out.idx = idx;
  out.scenario = sc;
  out.ptx_dBm = ptx_dBm;

  PAM pam(sc.M, kBitRate, sc.spacing, select_pulse_shape(PulseType::Rectangular, 1));
  pam.params().log_warnings = false; // 诊断在主线程统一打印

  const double Deltaf = pam.symbol_rate() / 2.0;
  const double att    = std::pow(10.0, -kLinkAttdB / 10.0);

  std::unique_ptr<NoiseModel> noise;
  double link_gain = 1.0;
  switch (sc.receiver) {
    case Receiver::PIN: {
      auto pin = std::make_unique<PinNoise>();
      pin->thermal_N0 = kN0;
      pin->noise_bw = Deltaf;
      link_gain = pin->responsivity * att;
      noise = std::move(pin);
      break;
    }
    case Receiver::APD: {
      auto apd = std::make_unique<ApdNoise>();
      apd->gain = kApdGain;
      apd->thermal_N0 = kN0;
      apd->noise_bw = Deltaf;
      link_gain = apd->gain * apd->responsivity * att;
      noise = std::move(apd);
      break;
    }
    case Receiver::SOA: {
      auto soa = std::make_unique<SoaNoise>();
      soa->thermal_N0 = kN0;
      soa->noise_bw = Deltaf;
      link_gain = std::pow(10.0, kSoaGaindB / 10.0) * att;
      noise = std::move(soa);
      break;
    }
  }

  // 优化后的电平只取决于噪声模型，不随发射功率变化，因此每个 scenario 只优化一次
  if (sc.spacing == LevelSpacing::Optimized) {
    pam.optimize_level_spacing(kBerTarget, kRexdB, *noise);
    out.opt_iterations = pam.last_optimization().iterations;
    out.opt_converged  = pam.last_optimization().converged;
    out.diagnostics    = pam.diagnostics();
  }

  for (double p_dBm : ptx_dBm) {
    pam.adjust_levels(dBm_to_watt(p_dBm) * link_gain, kRexdB);
    const BerResult r = pam.ber_awgn(*noise);
    out.ber.push_back(r.ber_total);
    out.ser.push_back(r.ser_total);
  }

  out.sensitivity_dBm = interp_sensitivity(out.ptx_dBm, out.ber, kBerTarget);
  return out;
}

int main()
{
  // ========== 1) IO 准备 ==========
  const fs::path data_dir = "data";
  ensure_dir(data_dir);
  const std::string run_id = now_stamp();
  const std::string log_path = (data_dir / ("run_" + run_id + ".log")).string();
  DualOut out(std::cout, log_path);

  const std::string csv_path = (data_dir / ("pam_sweep_results_" + run_id + ".csv")).string();
  ensure_csv_header(csv_path);

  out << "[INFO] " << version_string() << "\n";

  // ========== 2) 生成 scenario ==========
  std::vector<double> ptx_dBm;
  for (double p = kPtxStartdBm; p <= kPtxStopdBm + 1e-9; p += kPtxStepdBm) ptx_dBm.push_back(p);

  const auto scenarios = build_scenarios({4, 8},
                                         {LevelSpacing::EquallySpaced, LevelSpacing::Optimized},
                                         {Receiver::PIN, Receiver::APD, Receiver::SOA});
  const std::size_t NS = scenarios.size();
  out << "[INFO] total scenarios = " << NS << ", power points = " << ptx_dBm.size() << "\n";

  // ========== 3) 并行执行 ==========
  unsigned hw = std::max(1u, std::thread::hardware_concurrency());
  unsigned max_workers = std::max(1u, hw * 3 / 4);  // 默认值
  if (const char* env = std::getenv("NTHREADS")) {
    try {
      max_workers = static_cast<unsigned>(std::max(1, std::stoi(env)));
    } catch (const std::exception&) {
      out << "[WARN] ignoring invalid NTHREADS='" << env << "'\n";
    }
  }
  out << "[INFO] using up to " << max_workers << " workers\n";
  Semaphore sem(max_workers);

  std::vector<std::future<ScenarioOutput>> futures;
  futures.reserve(NS);
  for (std::size_t idx = 0; idx < NS; ++idx) {
    const auto& scenario = scenarios[idx];
    sem.acquire();
    futures.emplace_back(std::async(std::launch::async,
                                    [idx, scenario, &ptx_dBm, &sem]() -> ScenarioOutput {
                                      struct Releaser {
                                        Semaphore& s;
                                        ~Releaser() { s.release(); }
                                      } _releaser{sem};
                                      return run_scenario(idx, scenario, ptx_dBm);
                                    }));
  }

  // ========== 4) 汇总：主线程统一写 CSV/日志 ==========
  std::vector<ScenarioOutput> results;
  results.reserve(futures.size());
  for (auto& fut : futures) {
    try {
      results.emplace_back(fut.get());
    } catch (const std::exception& ex) {
      out << "[ERROR] worker threw: " << ex.what() << "\n";
    }
  }

  std::sort(results.begin(), results.end(),
            [](const auto& a, const auto& b) { return a.idx < b.idx; });

  std::ofstream csv(csv_path, std::ios::out | std::ios::app);
  csv << std::setprecision(10);

  const std::string ts = now_stamp();
  for (const auto& pack : results) {
    const auto& sc = pack.scenario;
    for (const auto& d : pack.diagnostics)
      out << "[WARN] (" << sc.name << ") " << to_string(d.kind) << ": " << d.message << "\n";

    for (size_t i = 0; i < pack.ptx_dBm.size(); ++i) {
      csv << ts << "," << run_id << "," << sc.name << "," << sc.M << ","
          << to_string(sc.spacing) << "," << receiver_name(sc.receiver) << ","
          << pack.ptx_dBm[i] << "," << pack.ber[i] << "," << pack.ser[i] << ","
          << pack.opt_iterations << "," << (pack.opt_converged ? 1 : 0) << ","
          << pack.diagnostics.size() << "\n";
    }

    out << "[RESULT] " << sc.name << " sensitivity @BER=" << kBerTarget << ": ";
    if (std::isnan(pack.sensitivity_dBm)) out << "not reached\n";
    else out << std::fixed << std::setprecision(2) << pack.sensitivity_dBm << " dBm\n" << std::defaultfloat;
  }

  out << "[DONE] results saved at " << csv_path << "\n";
  return results.size() == NS ? 0 : 1;
}
