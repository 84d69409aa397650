#include <cmath>
#include <filesystem>
#include <sstream>
#include <system_error>

#include "Errors.hpp"
#include "Canvas.hpp"
#include "Plotter.hpp"
#include "Png.hpp"

#include "Frame.hpp"

namespace fs = std::filesystem;

size_t Frame::argmax(const std::vector<double>& radiance) {
    if (radiance.empty()) {
        throw ShapeError("empty input: radiance series has no points");
    }
    size_t best = 0;
    for (size_t i = 1; i < radiance.size(); i++) {
        // strict comparison keeps the first maximum
        if (radiance[i] > radiance[best]) {
            best = i;
        }
    }
    return best;
}

Frame::PeakPoint Frame::peak(const std::vector<double>& radiance, const std::vector<double>& wavelengths) {
    if (radiance.empty() || wavelengths.empty()) {
        throw ShapeError("empty input: radiance series or wavelength grid has no points");
    }
    if (radiance.size() != wavelengths.size()) {
        std::ostringstream ss;
        ss << "length mismatch: " << radiance.size() << " radiance values for "
           << wavelengths.size() << " wavelengths";
        throw ShapeError(ss.str());
    }
    size_t i = argmax(radiance);
    return {i, wavelengths[i], radiance[i]};
}

std::string Frame::peak_label(double wl) {
    std::ostringstream ss;
    ss.precision(10);
    ss << "Peak Wavelength = " << std::round(wl * 1e10) / 1e10 << " m";
    return ss.str();
}

Frame::Result Frame::render(
    const std::vector<double>& radiance,
    double T,
    const std::vector<double>& wavelengths,
    const std::string& destination,
    Plotter& plotter
) {
    PeakPoint p = peak(radiance, wavelengths);

    Canvas canvas = plotter.render(wavelengths, radiance, p, T);

    std::string tmp = destination + ".part";
    try {
        Png::write(tmp, canvas);
    } catch (...) {
        // no partial frame, whatever stopped the write
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }

    std::error_code ec;
    fs::rename(tmp, destination, ec);
    if (ec) {
        std::error_code ignore;
        fs::remove(tmp, ignore);
        throw IOError("could not move frame to " + destination + ": " + ec.message());
    }

    return {destination, p};
}
