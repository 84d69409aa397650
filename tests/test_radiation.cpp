#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

#include <gtest/gtest.h>

#include "Constants.hpp"
#include "Errors.hpp"
#include "Radiation.hpp"

namespace cs = Constants;

TEST(Radiation, SolarSurfaceAtVisibleWavelength) {
    std::vector<double> r = Radiation::compute({500e-9}, 5778.0);
    ASSERT_EQ(r.size(), 1u);
    EXPECT_TRUE(std::isfinite(r[0]));
    EXPECT_GT(r[0], 1e13);
    EXPECT_LT(r[0], 1e14);
}

TEST(Radiation, NonNegativeAndIncreasingWithTemperature) {
    const double wls[] = {100e-9, 500e-9, 1e-6, 2e-6, 10e-6};
    const double temps[] = {300.0, 1000.0, 4500.0, 5778.0, 7000.0, 20000.0};
    for (double wl : wls) {
        double last = -1.0;
        for (double T : temps) {
            double v = Radiation::planck(wl, T);
            EXPECT_GE(v, 0.0) << "wl " << wl << " T " << T;
            EXPECT_GT(v, last) << "wl " << wl << " T " << T;
            last = v;
        }
    }
}

TEST(Radiation, OutputIsIndexAligned) {
    std::vector<double> wl = Radiation::linspace(100e-9, 2e-6, 50);
    std::vector<double> fwd = Radiation::compute(wl, 6000.0);

    std::vector<double> rev(wl.rbegin(), wl.rend());
    std::vector<double> back = Radiation::compute(rev, 6000.0);

    ASSERT_EQ(fwd.size(), wl.size());
    for (size_t i = 0; i < wl.size(); i++) {
        EXPECT_DOUBLE_EQ(fwd[i], Radiation::planck(wl[i], 6000.0));
        EXPECT_DOUBLE_EQ(fwd[i], back[wl.size() - 1 - i]);
    }
}

TEST(Radiation, RepeatedCallsAreIdentical) {
    std::vector<double> wl = Radiation::linspace(100e-9, 2e-6, 200);
    EXPECT_EQ(Radiation::compute(wl, 5000.0), Radiation::compute(wl, 5000.0));
}

TEST(Radiation, SingleAndEmptyGrid) {
    EXPECT_EQ(Radiation::compute({1e-6}, 4500.0).size(), 1u);
    EXPECT_TRUE(Radiation::compute({}, 4500.0).empty());
}

TEST(Radiation, ZeroTemperatureGivesZero) {
    EXPECT_EQ(Radiation::planck(500e-9, 0.0), 0.0);
    // exponent far beyond the double range
    EXPECT_EQ(Radiation::planck(1e-9, 10.0), 0.0);
}

TEST(Radiation, LongWavelengthLimitIsRayleighJeans) {
    double wl   = 1.0;
    double T    = 6000.0;
    double rj   = 2.0 * cs::c * cs::k * T / std::pow(wl, 4.0);
    EXPECT_NEAR(Radiation::planck(wl, T) / rj, 1.0, 1e-5);
}

TEST(Radiation, ValidateRejectsNonPositiveInput) {
    std::vector<double> wl = {100e-9, 200e-9};
    EXPECT_NO_THROW(Radiation::validate(wl, 4500.0));
    EXPECT_THROW(Radiation::validate(wl, 0.0), DomainError);
    EXPECT_THROW(Radiation::validate(wl, -10.0), DomainError);
    EXPECT_THROW(Radiation::validate(wl, std::numeric_limits<double>::quiet_NaN()), DomainError);
    EXPECT_THROW(Radiation::validate({100e-9, 0.0}, 4500.0), DomainError);
    EXPECT_THROW(Radiation::validate({-1e-6}, 4500.0), DomainError);
    EXPECT_THROW(Radiation::validate({std::numeric_limits<double>::infinity()}, 4500.0), DomainError);
}

TEST(Radiation, Linspace) {
    std::vector<double> g = Radiation::linspace(100e-9, 2e-6, 1000);
    ASSERT_EQ(g.size(), 1000u);
    EXPECT_DOUBLE_EQ(g.front(), 100e-9);
    EXPECT_DOUBLE_EQ(g.back(), 2e-6);
    EXPECT_TRUE(std::is_sorted(g.begin(), g.end()));
    EXPECT_NEAR(g[1] - g[0], (2e-6 - 100e-9) / 999.0, 1e-18);

    EXPECT_TRUE(Radiation::linspace(1.0, 2.0, 0).empty());
    std::vector<double> one = Radiation::linspace(1.0, 2.0, 1);
    ASSERT_EQ(one.size(), 1u);
    EXPECT_EQ(one[0], 1.0);
}

TEST(Radiation, TemperatureRangeIncludesEnd) {
    std::vector<double> t = Radiation::temperature_range(4500.0, 7000.0, 25.0);
    ASSERT_EQ(t.size(), 101u);
    EXPECT_EQ(t.front(), 4500.0);
    EXPECT_EQ(t[1], 4525.0);
    EXPECT_EQ(t.back(), 7000.0);

    std::vector<double> partial = Radiation::temperature_range(4500.0, 4560.0, 25.0);
    EXPECT_EQ(partial, (std::vector<double>{4500.0, 4525.0, 4550.0}));

    EXPECT_EQ(Radiation::temperature_range(5000.0, 5000.0, 25.0).size(), 1u);
}

TEST(Radiation, TemperatureRangeRejectsBadStep) {
    EXPECT_THROW(Radiation::temperature_range(4500.0, 7000.0, 0.0), DomainError);
    EXPECT_THROW(Radiation::temperature_range(4500.0, 7000.0, -25.0), DomainError);
    EXPECT_THROW(Radiation::temperature_range(7000.0, 4500.0, 25.0), DomainError);
}
