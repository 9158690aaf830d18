#ifndef _TEST_UTILS_H
#define _TEST_UTILS_H

#include <cmath>
#include <complex>
#include <memory>
#include <random>
#include <vector>

#include <gtest/gtest.h>

#include <common/complex.hpp>
#include <common/types.hpp>
#include <common/utils.hpp>
#include <engines_common.hpp>

#define SKIP_WITHOUT_GPU()                                   \
    if (ptyDeviceCount() == 0) {                             \
        GTEST_SKIP() << "No cuda device is available.";      \
    }

inline std::vector<complex> RandomComplex(size_t size, unsigned seed, float scale = 1.0f) {
    std::mt19937 gen(seed);
    std::normal_distribution<float> normal(0.0f, scale);
    std::vector<complex> values(size);
    for (complex& v : values) v = complex(normal(gen), normal(gen));
    return values;
}

inline std::unique_ptr<cImage> RandomImage(size_t sizex, size_t sizey, size_t sizez, unsigned seed,
                                           float scale = 1.0f) {
    std::vector<complex> values = RandomComplex(sizex * sizey * sizez, seed, scale);
    return std::unique_ptr<cImage>(new cImage(values.data(), sizex, sizey, sizez));
}

/**
 * Uniform positions in [low, high) for both coordinates.
 * */
inline std::unique_ptr<PositionArray> RandomPositions(size_t nscan, size_t ntheta, float low, float high,
                                                      unsigned seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> uniform(low, high);
    std::vector<Position> positions(nscan * ntheta);
    for (Position& p : positions) {
        p.x = uniform(gen);
        p.y = uniform(gen);
    }
    return std::unique_ptr<PositionArray>(new PositionArray(positions.data(), nscan, 1, ntheta));
}

template <typename Type>
std::vector<Type> ToHost(const Image<Type>& img) {
    std::vector<Type> host(img.size);
    img.CopyTo(host.data());
    return host;
}

/**
 * sum(conj(a) * b) on the host.
 * */
inline std::complex<double> HostDot(const std::vector<complex>& a, const std::vector<complex>& b) {
    std::complex<double> sum = 0;
    for (size_t i = 0; i < a.size(); ++i)
        sum += std::conj(std::complex<double>(a[i].x, a[i].y)) * std::complex<double>(b[i].x, b[i].y);
    return sum;
}

inline void ExpectRelativeNear(double expected, double actual, double rtol) {
    EXPECT_NEAR(expected, actual, rtol * std::max(std::fabs(expected), 1e-30)) << "expected " << expected
                                                                                << ", got " << actual;
}

#endif  // _TEST_UTILS_H
