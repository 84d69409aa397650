#ifndef PLOTTER_HPP
#define PLOTTER_HPP

#include <memory>
#include <string>
#include <vector>

#include "Canvas.hpp"
#include "FontFace.hpp"
#include "Frame.hpp"

// Rendering collaborator of Frame::render, turns one spectrum into a raster.
class Plotter {
public:
    virtual ~Plotter() {}

    virtual Canvas render(
        const std::vector<double>& wavelengths,
        const std::vector<double>& radiance,
        const Frame::PeakPoint& peak,
        double T
    ) = 0;
};

/**
 * Line plot of a black-body spectrum.
 *
 * The radiance axis is fixed to [0, y_max] so every frame of a sweep
 * shares one scale. Without a usable font the labels are left out, the
 * curve and the peak marker are drawn regardless.
 */
class SpectrumPlotter : public Plotter {
private:
    int                         _width;
    int                         _height;
    double                      _y_max;
    std::unique_ptr<FontFace>   _font;
    std::unique_ptr<FontFace>   _small;

    int left() const;
    int right() const;
    int top() const;
    int bottom() const;

    void axes(Canvas& canvas, double xmin, double xmax);
    void labels(Canvas& canvas, const Frame::PeakPoint& peak, double T);
public:
    // warn: report an unusable font on stderr
    SpectrumPlotter(int width, int height, double y_max, const std::string& font_path, bool warn = true);

    bool has_font() const {return _font != nullptr;}

    // pixel position of a data point, x grid range [xmin, xmax]
    double px(double x, double xmin, double xmax) const;
    double py(double y) const;

    Canvas render(
        const std::vector<double>& wavelengths,
        const std::vector<double>& radiance,
        const Frame::PeakPoint& peak,
        double T
    ) override;
};

#endif
