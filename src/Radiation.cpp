#include <cmath>
#include <sstream>

#include "Constants.hpp"
namespace cs = Constants;

#include "Errors.hpp"

#include "Radiation.hpp"

double Radiation::planck(double wl, double T) {
    double a    = 2.0 * cs::h * std::pow(cs::c, 2.0);
    double b    = cs::h * cs::c / (wl * cs::k * T);
    // expm1 keeps precision for b -> 0, gives inf (radiance 0) for T -> 0
    double val  = a / (std::pow(wl, 5.0) * std::expm1(b));
    return val;
}

std::vector<double> Radiation::compute(const std::vector<double>& wl, double T) {
    std::vector<double> radiance(wl.size());
    for (size_t i = 0; i < wl.size(); i++) {
        radiance[i] = planck(wl[i], T);
    }
    return radiance;
}

void Radiation::validate(const std::vector<double>& wl, double T) {
    if (!std::isfinite(T) || T <= 0.0) {
        std::ostringstream ss;
        ss << "temperature must be positive, got " << T << " K";
        throw DomainError(ss.str());
    }
    for (size_t i = 0; i < wl.size(); i++) {
        if (!std::isfinite(wl[i]) || wl[i] <= 0.0) {
            std::ostringstream ss;
            ss << "wavelength[" << i << "] must be positive, got " << wl[i] << " m";
            throw DomainError(ss.str());
        }
    }
}

std::vector<double> Radiation::linspace(double low, double high, size_t n) {
    std::vector<double> grid(n);
    if (n < 2) {
        if (n == 1) {grid[0] = low;}
        return grid;
    }
    double step = (high - low) / ((double) (n - 1));
    for (size_t i = 0; i < n; i++) {
        grid[i] = low + ((double) i) * step;
    }
    // no rounding drift on the last point
    grid[n-1] = high;
    return grid;
}

std::vector<double> Radiation::temperature_range(double low, double high, double step) {
    if (!(step > 0.0)) {
        std::ostringstream ss;
        ss << "temperature step must be positive, got " << step;
        throw DomainError(ss.str());
    }
    if (high < low) {
        std::ostringstream ss;
        ss << "temperature range is empty (" << low << " > " << high << ")";
        throw DomainError(ss.str());
    }

    // small tolerance so 4500..7000 / 25 includes 7000
    size_t n = (size_t) std::floor((high - low) / step + 1e-9) + 1;
    std::vector<double> temps(n);
    for (size_t i = 0; i < n; i++) {
        temps[i] = low + ((double) i) * step;
    }
    return temps;
}
