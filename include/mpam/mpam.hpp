#pragma once
#include <string>

#include "mpam/ber.hpp"
#include "mpam/errors.hpp"
#include "mpam/gray_code.hpp"
#include "mpam/level_optimizer.hpp"
#include "mpam/level_set.hpp"
#include "mpam/noise_model.hpp"
#include "mpam/pam.hpp"
#include "mpam/params.hpp"
#include "mpam/power_adjust.hpp"
#include "mpam/pulse_shape.hpp"
#include "mpam/qfunc.hpp"
#include "mpam/root_finder.hpp"

namespace mpam {

// 一个简单的版本结构
struct Version { int major, minor, patch; };
Version version();

// "mpam x.y.z"
std::string version_string();

} // namespace mpam
