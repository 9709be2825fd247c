#include "mpam/root_finder.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace mpam {

static inline bool opposite_sign(double fa, double fb)
{
    return (fa < 0.0 && fb > 0.0) || (fa > 0.0 && fb < 0.0);
}

RootResult find_root(const std::function<double(double)>& f,
                     double x0,
                     const RootOptions& opt)
{
    RootResult r;
    r.x  = x0;
    r.fx = f(x0);
    if (r.fx == 0.0) {
        r.bracketed = true;
        r.converged = true;
        return r;
    }

    // ===== 1) 搜索异号区间 [a, b] =====
    double a = x0, fa = r.fx;
    double b = x0, fb = r.fx;
    double dx = (x0 == 0.0) ? opt.initial_step : std::fabs(x0) / 50.0;

    double best_x = x0, best_f = r.fx;
    for (int k = 0; k < opt.max_expansions && !r.bracketed; ++k, dx *= 2.0) {
        const double xr = x0 + dx;
        const double fr = f(xr);
        if (std::isfinite(fr) && std::fabs(fr) < std::fabs(best_f)) { best_x = xr; best_f = fr; }
        if (opposite_sign(r.fx, fr)) {
            a = x0; fa = r.fx; b = xr; fb = fr;
            r.bracketed = true;
            break;
        }
        const double xl = x0 - dx;
        const double fl = f(xl);
        if (std::isfinite(fl) && std::fabs(fl) < std::fabs(best_f)) { best_x = xl; best_f = fl; }
        if (opposite_sign(r.fx, fl)) {
            a = xl; fa = fl; b = x0; fb = r.fx;
            r.bracketed = true;
        }
    }

    if (!r.bracketed) {
        r.x  = best_x;
        r.fx = best_f;
        return r;
    }

    // ===== 2) Brent 法（zeroin）=====
    const double eps = std::numeric_limits<double>::epsilon();
    double c = a, fc = fa;
    double d = b - a, e = d;

    int it = 0;
    bool width_ok = false;
    for (; it < opt.max_iterations; ++it) {
        if ((fb > 0.0 && fc > 0.0) || (fb < 0.0 && fc < 0.0)) {
            c = a; fc = fa;
            d = b - a; e = d;
        }
        if (std::fabs(fc) < std::fabs(fb)) {
            a = b;  b = c;  c = a;
            fa = fb; fb = fc; fc = fa;
        }

        const double tol1 = 2.0 * eps * std::fabs(b) + 0.5 * opt.x_tolerance;
        const double m    = 0.5 * (c - b);
        if (std::fabs(m) <= tol1 || fb == 0.0) {
            width_ok = true;
            break;
        }

        if (std::fabs(e) >= tol1 && std::fabs(fa) > std::fabs(fb)) {
            // 插值：割线或逆二次插值
            double p, q;
            const double s = fb / fa;
            if (a == c) {
                p = 2.0 * m * s;
                q = 1.0 - s;
            } else {
                const double qq = fa / fc;
                const double rr = fb / fc;
                p = s * (2.0 * m * qq * (qq - rr) - (b - a) * (rr - 1.0));
                q = (qq - 1.0) * (rr - 1.0) * (s - 1.0);
            }
            if (p > 0.0) q = -q; else p = -p;

            if (2.0 * p < std::min(3.0 * m * q - std::fabs(tol1 * q), std::fabs(e * q))) {
                e = d;
                d = p / q;
            } else {
                d = m; e = m;   // 插值不可信，退回二分
            }
        } else {
            d = m; e = m;
        }

        a = b; fa = fb;
        b += (std::fabs(d) > tol1) ? d : (m > 0.0 ? tol1 : -tol1);
        fb = f(b);
    }

    r.x = b;
    r.fx = fb;
    r.iterations = it;
    r.converged = width_ok && (opt.f_tolerance <= 0.0 || std::fabs(fb) <= opt.f_tolerance);
    return r;
}

} // namespace mpam
