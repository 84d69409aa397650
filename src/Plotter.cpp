#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

#include "Constants.hpp"
namespace cs = Constants;

#include "Errors.hpp"

#include "Plotter.hpp"

namespace {

// 1, 2, 2.5 or 5 times a power of ten, close to range / n
double nice_step(double range, int n) {
    double raw  = range / n;
    double mag  = std::pow(10.0, std::floor(std::log10(raw)));
    double f    = raw / mag;
    if (f < 1.5) {return mag;}
    if (f < 2.25) {return 2.0 * mag;}
    if (f < 3.5) {return 2.5 * mag;}
    if (f < 7.5) {return 5.0 * mag;}
    return 10.0 * mag;
}

// tick positions step apart inside [lo, hi], never more than MAX_TICKS
const int MAX_TICKS = 100;

std::vector<double> ticks(double lo, double hi, double step) {
    std::vector<double> out;
    if (!(step > 0.0) || !std::isfinite(step) || !(hi >= lo)) {
        return out;
    }
    double first = std::ceil(lo / step) * step;
    double n = std::floor((hi - first) / step + 1e-9);
    if (!(n >= 0.0)) {
        return out;
    }
    int count = (int) std::min(n, (double) MAX_TICKS);
    for (int i = 0; i <= count; i++) {
        out.push_back(first + i * step);
    }
    return out;
}

std::string tick_label(double v) {
    std::ostringstream ss;
    ss.precision(3);
    ss << v;
    return ss.str();
}

// keeps huge or tiny values inside int range, the canvas clips the rest
int to_px(double v) {
    return (int) std::lround(std::max(-1e6, std::min(1e6, v)));
}

}

SpectrumPlotter::SpectrumPlotter(int width, int height, double y_max, const std::string& font_path, bool warn) {
    if (width <= cs::plot::LEFT + cs::plot::RIGHT || height <= cs::plot::TOP + cs::plot::BOTTOM) {
        std::ostringstream ss;
        ss << "canvas " << width << "x" << height << " leaves no room for the plot area";
        throw DomainError(ss.str());
    }
    if (!(y_max > 0.0)) {
        throw DomainError("y_max must be positive");
    }
    _width  = width;
    _height = height;
    _y_max  = y_max;

    try {
        _font   = std::make_unique<FontFace>(font_path, 14);
        _small  = std::make_unique<FontFace>(font_path, 11);
    } catch (const IOError& e) {
        if (warn) {
            std::cerr << "Warning: " << e.what() << ", frames are rendered without text" << std::endl;
        }
        _font.reset();
        _small.reset();
    }
}

int SpectrumPlotter::left() const {return cs::plot::LEFT;}
int SpectrumPlotter::right() const {return _width - cs::plot::RIGHT;}
int SpectrumPlotter::top() const {return cs::plot::TOP;}
int SpectrumPlotter::bottom() const {return _height - cs::plot::BOTTOM;}

double SpectrumPlotter::px(double x, double xmin, double xmax) const {
    if (xmax <= xmin) {
        return 0.5 * (left() + right());
    }
    return left() + (x - xmin) / (xmax - xmin) * (right() - left());
}

double SpectrumPlotter::py(double y) const {
    return bottom() - y / _y_max * (bottom() - top());
}

void SpectrumPlotter::axes(Canvas& canvas, double xmin, double xmax) {
    canvas.rect(left(), top(), right(), bottom(), Colors::BLACK);

    // x ticks
    if (xmax > xmin) {
        for (double x : ticks(xmin, xmax, nice_step(xmax - xmin, 6))) {
            int p = to_px(px(x, xmin, xmax));
            canvas.line(p, bottom(), p, bottom() + 5, Colors::BLACK);
            if (_small) {
                std::string s = tick_label(x);
                _small->draw(canvas, p - _small->width(s) / 2, bottom() + 8 + _small->ascent(), s, Colors::BLACK);
            }
        }
    }

    // y ticks
    for (double y : ticks(0.0, _y_max, nice_step(_y_max, 7))) {
        int p = to_px(py(y));
        canvas.line(left() - 5, p, left(), p, Colors::BLACK);
        if (_small) {
            std::string s = tick_label(y);
            _small->draw(canvas, left() - 8 - _small->width(s), p + _small->ascent() / 2, s, Colors::BLACK);
        }
    }
}

void SpectrumPlotter::labels(Canvas& canvas, const Frame::PeakPoint& peak, double T) {
    if (!_font) {
        return;
    }

    std::ostringstream title;
    title << "Blackbody Function for T = " << T << " K";
    _font->draw(canvas, (left() + right() - _font->width(title.str())) / 2, top() - 12, title.str(), Colors::BLACK);

    std::string xl = "Wavelength (m)";
    _font->draw(canvas, (left() + right() - _font->width(xl)) / 2, _height - 10, xl, Colors::BLACK);

    std::string yl = "Spectral Radiance (W m^-3 sr^-1)";
    _font->draw(canvas, 4 + _font->ascent(), (top() + bottom() + _font->width(yl)) / 2, yl, Colors::BLACK, true);

    // legend, upper right corner of the plot area
    std::string l0  = "Blackbody Function";
    std::string l1  = Frame::peak_label(peak.wavelength);
    int line_h      = _small->size() + 6;
    int bw          = std::max(_small->width(l0), _small->width(l1)) + 44;
    int bh          = 2 * line_h + 8;
    int x0          = right() - bw - 8;
    int y0          = top() + 8;

    canvas.fill_rect(x0, y0, x0 + bw, y0 + bh, Colors::WHITE);
    canvas.rect(x0, y0, x0 + bw, y0 + bh, Colors::GRAY);

    int cy = y0 + 4 + line_h / 2;
    canvas.line(x0 + 6, cy, x0 + 30, cy, Colors::BLUE, 2);
    _small->draw(canvas, x0 + 36, cy + _small->ascent() / 2 - 1, l0, Colors::BLACK);

    cy += line_h;
    canvas.dashed_line(x0 + 6, cy, x0 + 30, cy, Colors::RED, 6, 4, 2);
    _small->draw(canvas, x0 + 36, cy + _small->ascent() / 2 - 1, l1, Colors::BLACK);
}

Canvas SpectrumPlotter::render(
    const std::vector<double>& wavelengths,
    const std::vector<double>& radiance,
    const Frame::PeakPoint& peak,
    double T
) {
    Canvas canvas(_width, _height);

    double xmin = wavelengths.empty() ? 0.0 : *std::min_element(wavelengths.begin(), wavelengths.end());
    double xmax = wavelengths.empty() ? 1.0 : *std::max_element(wavelengths.begin(), wavelengths.end());

    // data is clipped to the plot area
    canvas.clip(left(), top(), right() + 1, bottom() + 1);

    size_t n = std::min(wavelengths.size(), radiance.size());
    bool pen = false;
    int lx = 0, ly = 0;
    for (size_t i = 0; i < n; i++) {
        // non-finite points break the curve
        if (!std::isfinite(radiance[i])) {
            pen = false;
            continue;
        }
        int x = to_px(px(wavelengths[i], xmin, xmax));
        int y = to_px(py(radiance[i]));
        if (pen) {
            canvas.line(lx, ly, x, y, Colors::BLUE, 2);
        } else if (n == 1) {
            canvas.set(x, y, Colors::BLUE);
        }
        lx  = x;
        ly  = y;
        pen = true;
    }

    int mx = to_px(px(peak.wavelength, xmin, xmax));
    canvas.dashed_line(mx, to_px(py(0.0)), mx, to_px(py(peak.radiance)), Colors::RED, 6, 4, 2);

    canvas.unclip();

    this->axes(canvas, xmin, xmax);
    this->labels(canvas, peak, T);

    return canvas;
}
