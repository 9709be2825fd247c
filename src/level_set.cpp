#include "mpam/level_set.hpp"
#include "mpam/errors.hpp"
#include <cstddef>
#include <numeric>
#include <string>
#include <utility>

namespace mpam {

const char* to_string(LevelSpacing spacing)
{
    switch (spacing) {
        case LevelSpacing::EquallySpaced: return "equally-spaced";
        case LevelSpacing::Optimized:     return "optimized";
    }
    return "unknown";
}

LevelSpacing parse_level_spacing(const std::string& name)
{
    if (name == "equally-spaced") return LevelSpacing::EquallySpaced;
    if (name == "optimized")      return LevelSpacing::Optimized;
    throw InvalidArgument("mpam: invalid level spacing option '" + name + "'");
}

void LevelSet::set_levels(std::vector<double> new_levels, std::vector<double> new_thresholds)
{
    if (new_levels.size() != static_cast<std::size_t>(M))
        throw InvalidArgument("set_levels: invalid number of levels (expected " +
                              std::to_string(M) + ", got " + std::to_string(new_levels.size()) + ")");
    if (new_thresholds.size() + 1 != static_cast<std::size_t>(M))
        throw InvalidArgument("set_levels: invalid number of decision thresholds (expected " +
                              std::to_string(M - 1) + ", got " + std::to_string(new_thresholds.size()) + ")");

    levels     = std::move(new_levels);
    thresholds = std::move(new_thresholds);
}

LevelSet& LevelSet::normalize()
{
    if (levels.empty())
        throw InvalidArgument("normalize: level set is empty");

    const double top = levels.back();
    if (top == 0.0)
        throw DomainError("normalize: top level is zero");

    for (auto& a : levels)     a /= top;
    for (auto& b : thresholds) b /= top;
    return *this;
}

bool LevelSet::is_monotonic() const
{
    if (M < 2 || levels.size() != static_cast<std::size_t>(M) ||
        thresholds.size() + 1 != static_cast<std::size_t>(M))
        return false;

    for (std::size_t k = 0; k + 1 < levels.size(); ++k) {
        if (!(levels[k] < thresholds[k] && thresholds[k] < levels[k + 1]))
            return false;
    }
    return true;
}

double LevelSet::mean_level() const
{
    if (levels.empty()) return 0.0;
    return std::accumulate(levels.begin(), levels.end(), 0.0) / static_cast<double>(levels.size());
}

LevelSet equally_spaced_levels(int M)
{
    if (M < 2)
        throw InvalidArgument("equally_spaced_levels: M must be >= 2");

    const double den = 2.0 * static_cast<double>(M - 1);

    LevelSet s;
    s.M = M;
    s.spacing = LevelSpacing::EquallySpaced;
    s.levels.resize(static_cast<std::size_t>(M));
    s.thresholds.resize(static_cast<std::size_t>(M - 1));
    for (int k = 0; k < M; ++k)
        s.levels[static_cast<std::size_t>(k)] = (2.0 * k) / den;
    for (int k = 0; k + 1 < M; ++k)
        s.thresholds[static_cast<std::size_t>(k)] = (2.0 * k + 1.0) / den;
    return s;
}

} // namespace mpam
