#include "mpam/errors.hpp"
#include "mpam/pulse_shape.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

static inline bool approx(double a, double b, double eps = 1e-12)
{
    return std::fabs(a - b) <= eps;
}

int main()
{
    using namespace mpam;

    // --- 用例 1：系数归一化 ---
    {
        const auto odd = norm_filter_coefficients({1.0, 2.0, 3.0});
        assert(approx(odd[0], 0.5) && approx(odd[1], 1.0) && approx(odd[2], 1.5));

        const auto even = norm_filter_coefficients({1.0, 3.0, 3.0, 1.0});
        assert(approx(even[0], 1.0 / 3.0) && approx(even[1], 1.0) && approx(even[3], 1.0 / 3.0));

        bool threw = false;
        try { (void)norm_filter_coefficients({1.0, 0.0, 1.0}); } catch (const DomainError&) { threw = true; }
        assert(threw);

        threw = false;
        try { (void)norm_filter_coefficients({}); } catch (const InvalidArgument&) { threw = true; }
        assert(threw);
    }

    // --- 用例 2：矩形脉冲 ---
    {
        const PulseShape p = select_pulse_shape(PulseType::Rectangular, 4);
        assert(p.h.size() == 4);
        for (double c : p.h) assert(approx(c, 1.0));
        assert(p.type_name() == "rectangular");

        const auto y = shape_pulses({1.0, 2.0}, select_pulse_shape(PulseType::Rectangular, 2));
        const double expect[] = {1.0, 1.0, 2.0, 2.0};
        assert(y.size() == 4);
        for (int i = 0; i < 4; ++i) assert(approx(y[i], expect[i]));
    }

    // --- 用例 3：升余弦：中心为 1，对称，符号间隔处过零 ---
    {
        const int sps = 4, span = 3;
        const PulseShape p = select_pulse_shape(PulseType::RaisedCosine, sps, 0.3, span);
        const std::size_t half = static_cast<std::size_t>(span * sps);
        assert(p.h.size() == 2 * half + 1);
        assert(approx(p.h[half], 1.0));
        for (std::size_t i = 0; i < half; ++i)
            assert(approx(p.h[i], p.h[p.h.size() - 1 - i]));
        for (int m = 1; m <= span; ++m)
            assert(approx(p.h[half + static_cast<std::size_t>(m * sps)], 0.0, 1e-12));

        // 无 ISI：延迟 half 个样点后，每个符号中心处的输出等于该符号
        const std::vector<double> x = {0.2, 1.0, 0.6, 0.0, 0.8, 0.4, 1.0, 0.2};
        const auto y = shape_pulses(x, p);
        assert(y.size() == x.size() * sps);
        for (std::size_t i = 0; i * sps + half < y.size(); ++i)
            assert(approx(y[i * sps + half], x[i], 1e-12));
    }

    // --- 用例 4：根升余弦：中心为 1，对称 ---
    {
        const PulseShape p = select_pulse_shape(PulseType::RootRaisedCosine, 8, 0.25, 4);
        const std::size_t half = 32;
        assert(p.h.size() == 65);
        assert(approx(p.h[half], 1.0));
        for (std::size_t i = 0; i < half; ++i)
            assert(approx(p.h[i], p.h[p.h.size() - 1 - i], 1e-12));
        for (double c : p.h) assert(std::isfinite(c));
        assert(p.type_name() == "root raised cosine");
    }

    // --- 用例 5：非法参数 ---
    {
        bool threw = false;
        try { (void)select_pulse_shape(PulseType::Rectangular, 0); } catch (const InvalidArgument&) { threw = true; }
        assert(threw);

        threw = false;
        try { (void)select_pulse_shape(PulseType::RaisedCosine, 4, 1.5, 2); } catch (const InvalidArgument&) { threw = true; }
        assert(threw);

        threw = false;
        try { (void)select_pulse_shape(PulseType::RootRaisedCosine, 4, 0.2, 0); } catch (const InvalidArgument&) { threw = true; }
        assert(threw);
    }

    std::cout << "All pulse shape tests passed.\n";
    return 0;
}
