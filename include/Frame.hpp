#ifndef FRAME_HPP
#define FRAME_HPP

#include <cstddef>
#include <string>
#include <vector>

class Plotter;

namespace Frame {

// maximum of a radiance series, first occurrence on ties
struct PeakPoint {
    size_t index;
    double wavelength;
    double radiance;
};

// rendered + persisted frame
struct Result {
    std::string path;
    PeakPoint   peak;
};

// index of the first maximum, ShapeError on empty input
size_t argmax(const std::vector<double>& radiance);

// ShapeError on empty input or length mismatch
PeakPoint peak(const std::vector<double>& radiance, const std::vector<double>& wavelengths);

// "Peak Wavelength = <wl rounded to 1e-10> m"
std::string peak_label(double wl);

/**
 * Plot the radiance curve with its peak marker and write it as png.
 * The image is written to a temporary sibling first and renamed to
 * destination once complete, a failed write leaves nothing behind.
 */
Result render(
    const std::vector<double>& radiance,
    double T,
    const std::vector<double>& wavelengths,
    const std::string& destination,
    Plotter& plotter
);

}

#endif
