#include "mpam/level_optimizer.hpp"
#include "mpam/ber.hpp"
#include "mpam/power_adjust.hpp"
#include "mpam/qfunc.hpp"
#include "mpam/root_finder.hpp"
#include <cmath>
#include <cstddef>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

namespace mpam {
namespace {

void report(OptimizationResult& res, const Params& p, DiagnosticKind kind,
            int iteration, int level_index, double value, const std::string& message)
{
    if (p.log_warnings)
        std::cerr << "[WARN] " << message << "\n";

    Diagnostic d;
    d.kind        = kind;
    d.iteration   = iteration;
    d.level_index = level_index;
    d.value       = value;
    d.message     = message;
    res.diagnostics.push_back(std::move(d));
}

std::string root_failure_message(const char* what, int iteration, int level, const RootResult& r)
{
    std::ostringstream oss;
    oss << "level_spacing_optm: " << what << " optimization did not converge"
        << " (iteration " << iteration + 1 << ", level " << level
        << ", residual " << r.fx << (r.bracketed ? "" : ", no sign change found") << ")";
    return oss.str();
}

RootOptions make_root_options(const Params& p, double Pe)
{
    RootOptions o;
    o.max_iterations = p.root_max_iterations;
    o.max_expansions = p.root_max_expansions;
    o.initial_step   = p.root_initial_step;
    o.x_tolerance    = p.root_x_tolerance;
    o.f_tolerance    = p.root_f_rel_tolerance * Pe;
    return o;
}

} // namespace

bool OptimizationResult::has(DiagnosticKind kind) const
{
    for (const auto& d : diagnostics)
        if (d.kind == kind) return true;
    return false;
}

double per_threshold_error_probability(int M, double ber_target)
{
    return std::log2(static_cast<double>(M)) * ber_target *
           (static_cast<double>(M) / (2.0 * static_cast<double>(M - 1)));
}

OptimizationResult optimize_level_spacing(int M,
                                          double ber_target,
                                          double rex_dB,
                                          const NoiseModel& noise,
                                          const Params& params,
                                          bool verbose)
{
    if (M < 2)
        throw InvalidArgument("optimize_level_spacing: M must be >= 2");
    if (!(ber_target > 0.0 && ber_target < 1.0))
        throw InvalidArgument("optimize_level_spacing: BERtarget must be in (0, 1)");
    if (!params.valid())
        throw InvalidArgument("optimize_level_spacing: invalid Params");

    // 每个门限的单侧误码预算
    const double Pe = per_threshold_error_probability(M, ber_target);
    if (!(Pe < 0.5))
        throw InvalidArgument("optimize_level_spacing: BERtarget too large for M (per-threshold error probability >= 0.5)");

    const double rex = extinction_ratio(rex_dB);
    const RootOptions ropt = make_root_options(params, Pe);
    const std::size_t n = static_cast<std::size_t>(M);

    OptimizationResult res;
    std::vector<double> a(n, 0.0);      // levels
    std::vector<double> b(n - 1, 0.0);  // thresholds

    double tol = std::numeric_limits<double>::infinity();
    for (int k = 0; k < params.max_iterations; ++k) {
        const std::vector<double> a_past = a;
        a[0] = a[n - 1] * rex; // 用上一轮的顶层电平锚定最低电平

        for (std::size_t level = 0; level + 1 < n; ++level) {
            // 1) 门限：Q(|d|/σ(a_level)) = Pe
            const double sig = checked_noise_std(noise, a[level]);
            const RootResult th = find_root(
                [&](double d) { return qfunc(std::fabs(d) / sig) - Pe; }, 0.0, ropt);
            if (!th.converged)
                report(res, params, DiagnosticKind::RootFindNotConverged, k, static_cast<int>(level),
                       th.fx, root_failure_message("threshold", k, static_cast<int>(level), th));

            b[level] = a[level] + std::fabs(th.x);

            // 2) 下一电平：Q(|d|/σ(b_level + |d|)) = Pe，噪声取在未知的下一电平处
            const double b_level = b[level];
            const RootResult lv = find_root(
                [&](double d) {
                    const double ad = std::fabs(d);
                    return qfunc(ad / checked_noise_std(noise, b_level + ad)) - Pe;
                },
                0.0, ropt);
            if (!lv.converged)
                report(res, params, DiagnosticKind::RootFindNotConverged, k, static_cast<int>(level),
                       lv.fx, root_failure_message("level", k, static_cast<int>(level), lv));

            a[level + 1] = b_level + std::fabs(lv.x);
        }

        double sq = 0.0;
        for (std::size_t i = 0; i < n; ++i)
            sq += (a[i] - a_past[i]) * (a[i] - a_past[i]);
        tol = std::sqrt(sq);

        res.tolerance_history.push_back(tol);
        res.iterations = k + 1;
        if (verbose)
            std::cout << "[INFO] level spacing iteration " << k + 1
                      << ": tol=" << tol << " (required " << params.abs_tolerance << ")\n";

        if (tol < params.abs_tolerance) {
            res.converged = true;
            break;
        }
    }

    if (!res.converged) {
        std::ostringstream oss;
        oss << "level_spacing_optm: reached " << params.max_iterations
            << " iterations without convergence (tol " << tol << ")";
        report(res, params, DiagnosticKind::IterationLimitReached, res.iterations - 1, -1, tol, oss.str());
    }

    res.levels.M          = M;
    res.levels.spacing    = LevelSpacing::Optimized;
    res.levels.levels     = std::move(a);
    res.levels.thresholds = std::move(b);

    res.achieved_ber       = ber_awgn(res.levels, noise).ber_total;
    res.ber_relative_error = std::fabs(res.achieved_ber - ber_target) / ber_target;
    if (res.ber_relative_error > params.max_ber_relative_error) {
        std::ostringstream oss;
        oss << "level_spacing_optm: BER error " << res.ber_relative_error
            << " greater than maximum acceptable error " << params.max_ber_relative_error
            << " (achieved " << res.achieved_ber << ", target " << ber_target << ")";
        report(res, params, DiagnosticKind::BerToleranceExceeded, res.iterations - 1, -1,
               res.ber_relative_error, oss.str());
    }

    if (verbose)
        std::cout << "[DONE] level spacing optimization: " << res.iterations << " iterations, BER="
                  << res.achieved_ber << " (target " << ber_target << ")\n";
    return res;
}

} // namespace mpam
