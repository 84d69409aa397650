#ifndef RADIATION_HPP
#define RADIATION_HPP

#include <cstddef>
#include <vector>

namespace Radiation {

// spectral radiance of a black body (W * m^-3 * sr^-1), wl in m, T in K
double planck(double wl, double T);

// elementwise planck() over the grid, index aligned with wl
std::vector<double> compute(const std::vector<double>& wl, double T);

// throws DomainError on non-positive / non-finite wavelength or temperature
void validate(const std::vector<double>& wl, double T);

// n points from low to high, both included
std::vector<double> linspace(double low, double high, size_t n);

// low, low + step, ... up to high (included when reached)
std::vector<double> temperature_range(double low, double high, double step);

}

#endif
