#include "mpam/ber.hpp"
#include "mpam/errors.hpp"
#include "mpam/qfunc.hpp"
#include <algorithm>
#include <bit>
#include <cmath>
#include <iostream>

namespace mpam {

BerResult ber_awgn(const LevelSet& set, const NoiseModel& noise)
{
    const int M = set.M;
    if (M < 2 || set.levels.size() != static_cast<std::size_t>(M) ||
        set.thresholds.size() + 1 != static_cast<std::size_t>(M))
        throw InvalidArgument("ber_awgn: level set is not initialised");

    const auto& a = set.levels;
    const auto& b = set.thresholds;

    BerResult r;
    r.ser.assign(static_cast<std::size_t>(M), 0.0);
    for (std::size_t k = 0; k < a.size(); ++k) {
        const double sig = checked_noise_std(noise, a[k]);
        if (k + 1 < a.size()) r.ser[k] += qfunc((b[k] - a[k]) / sig);     // 上门限
        if (k > 0)            r.ser[k] += qfunc((a[k] - b[k - 1]) / sig); // 下门限
    }

    const double log2M = std::log2(static_cast<double>(M));
    r.ber_per_level.resize(r.ser.size());
    for (std::size_t k = 0; k < r.ser.size(); ++k) {
        r.ser_total        += r.ser[k] / M;
        r.ber_per_level[k]  = r.ser[k] / (M * log2M);
        r.ber_total        += r.ber_per_level[k];
    }
    return r;
}

const BerResult& print_ber(const BerResult& r, const char* label, int M)
{
    std::cout << "[RESULT] " << (label ? label : "BER")
              << " BER=" << r.ber_total
              << "  SER=" << r.ser_total
              << "  (M=" << M << ")\n";
    return r;
}

ErrorStats count_symbol_errors(const std::vector<int>& ref_symbols,
                               const std::vector<int>& rx_symbols)
{
    const std::size_t L = std::min(ref_symbols.size(), rx_symbols.size());

    ErrorStats s;
    for (std::size_t i = 0; i < L; ++i)
        s.errors += (ref_symbols[i] != rx_symbols[i]) ? 1u : 0u;
    s.total = L;
    s.rate  = (L == 0) ? 0.0 : static_cast<double>(s.errors) / static_cast<double>(L);
    return s;
}

ErrorStats count_bit_errors(const std::vector<int>& ref_symbols,
                            const std::vector<int>& rx_symbols,
                            int M)
{
    if (M < 2) throw InvalidArgument("count_bit_errors: M must be >= 2");

    const unsigned bits_per_symbol = static_cast<unsigned>(std::bit_width(static_cast<unsigned>(M - 1)));
    const std::size_t L = std::min(ref_symbols.size(), rx_symbols.size());

    ErrorStats s;
    for (std::size_t i = 0; i < L; ++i) {
        const unsigned diff = static_cast<unsigned>(ref_symbols[i] ^ rx_symbols[i]);
        s.errors += static_cast<std::size_t>(std::popcount(diff));
    }
    s.total = L * bits_per_symbol;
    s.rate  = (s.total == 0) ? 0.0 : static_cast<double>(s.errors) / static_cast<double>(s.total);
    return s;
}

} // namespace mpam
