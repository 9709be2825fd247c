#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include "mpam/mpam.hpp"

using namespace mpam;
namespace fs = std::filesystem;

// ======== 用户可改区域 ========
// 只需要改这里的常量即可完成一次“单次调试运行”的配置
static constexpr const char* kLabel      = "4pam_pin_opt";
static constexpr int         kM          = 4;
static constexpr double      kBitRate    = 112e9;   // b/s
static constexpr bool        kOptimized  = true;    // false 则使用等间距电平
static constexpr double      kBerTarget  = 1.8e-4;
static constexpr double      kRexdB      = -10.0;   // 消光比 Pmin/Pmax (dB)
static constexpr double      kPtxdBm     = -10.0;   // 平均发射功率
static constexpr double      kLinkAttdB  = 2.0;     // 光纤链路损耗
static constexpr double      kN0         = 30e-12 * 30e-12; // 单边热噪声 PSD
static constexpr bool        kVerbose    = true;
// =============================

static std::string now_stamp() {
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

static void ensure_dir(const fs::path& p) {
  std::error_code ec;
  fs::create_directories(p, ec);
}

int main() {
  // 1) IO
  const fs::path data_dir = "data";
  ensure_dir(data_dir);
  const std::string log_path = (data_dir / ("run_" + now_stamp() + "_single.log")).string();
  std::ofstream flog(log_path, std::ios::out | std::ios::app);
  auto both = [&](const auto& x) -> void { std::cout << x; if (flog) flog << x; };

  both("[INFO] "); both(version_string()); both("\n");

  // 2) 组装 PAM 与接收机噪声模型
  PAM pam(kM, kBitRate, kOptimized ? LevelSpacing::Optimized : LevelSpacing::EquallySpaced,
          select_pulse_shape(PulseType::Rectangular, 1));

  PinNoise pin;
  pin.thermal_N0 = kN0;
  pin.noise_bw   = pam.symbol_rate() / 2.0;

  const double link_gain = pin.responsivity * std::pow(10.0, -kLinkAttdB / 10.0);
  const double Ptx       = 1e-3 * std::pow(10.0, kPtxdBm / 10.0);

  // 3) 运行（串行、单次）
  try {
    if (kOptimized) {
      both("[INFO] optimize_level_spacing(label="); both(kLabel);
      both(", BERtarget="); both(kBerTarget); both(", rex="); both(kRexdB); both(" dB)\n");

      pam.optimize_level_spacing(kBerTarget, kRexdB, pin, kVerbose);
      for (const auto& d : pam.diagnostics()) {
        both("[WARN] "); both(to_string(d.kind)); both(": "); both(d.message); both("\n");
      }
    }

    // 电平换算到接收端功率
    pam.adjust_levels(Ptx * link_gain, kRexdB);
    std::ostringstream summary;
    pam.summary(summary);
    both(summary.str());

    const BerResult r = print_ber(pam.ber_awgn(pin), kLabel, kM);
    if (flog) flog << "[RESULT] " << kLabel << " BER=" << r.ber_total << "  SER=" << r.ser_total << "\n";

    both("[RESULT] BER per level:");
    for (double bk : r.ber_per_level) { both(" "); both(bk); }
    both("\n");

    // AGC 后（最高电平归一化到 1）的等效噪声，BER 应保持不变
    const double Pmax = pam.levels().levels.back();
    LevelSet normalized = pam.levels();
    normalized.normalize();
    const ReferredNoise referred(pin, Pmax);
    both("[RESULT] normalized-domain BER="); both(ber_awgn(normalized, referred).ber_total); both("\n");

    both("[RESULT] thermal-noise-limited required power = ");
    both(pam.required_power_dBm(kN0, kBerTarget)); both(" dBm\n");
  } catch (const std::exception& ex) {
    both("[ERROR] "); both(ex.what()); both("\n");
    return 2;
  }

  both("[INFO] log saved at "); both(log_path); both("\n");
  return 0;
}
