#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <sstream>

#include "Errors.hpp"

#include "Canvas.hpp"

Canvas::Canvas(int width, int height, Color bg) {
    if (width <= 0 || height <= 0) {
        std::ostringstream ss;
        ss << "invalid canvas size " << width << "x" << height;
        throw DomainError(ss.str());
    }
    _width  = width;
    _height = height;
    _data.resize((size_t) width * height * 3);
    this->unclip();
    this->fill(bg);
}

void Canvas::fill(Color c) {
    for (size_t i = 0; i < _data.size(); i += 3) {
        _data[i]    = c.r;
        _data[i+1]  = c.g;
        _data[i+2]  = c.b;
    }
}

void Canvas::set(int x, int y, Color c) {
    if (!inside(x, y)) {
        return;
    }
    size_t i = ((size_t) y * _width + x) * 3;
    _data[i]    = c.r;
    _data[i+1]  = c.g;
    _data[i+2]  = c.b;
}

void Canvas::blend(int x, int y, Color c, float alpha) {
    if (!inside(x, y) || alpha <= 0.0f) {
        return;
    }
    if (alpha >= 1.0f) {
        this->set(x, y, c);
        return;
    }
    size_t i = ((size_t) y * _width + x) * 3;
    _data[i]    = (uint8_t) std::lround(_data[i] + alpha * (c.r - _data[i]));
    _data[i+1]  = (uint8_t) std::lround(_data[i+1] + alpha * (c.g - _data[i+1]));
    _data[i+2]  = (uint8_t) std::lround(_data[i+2] + alpha * (c.b - _data[i+2]));
}

Color Canvas::at(int x, int y) const {
    if (x < 0 || x >= _width || y < 0 || y >= _height) {
        std::ostringstream ss;
        ss << "pixel (" << x << ", " << y << ") outside " << _width << "x" << _height << " canvas";
        throw DomainError(ss.str());
    }
    size_t i = ((size_t) y * _width + x) * 3;
    return {_data[i], _data[i+1], _data[i+2]};
}

// Bresenham, square brush for thickness > 1
void Canvas::line(int x0, int y0, int x1, int y1, Color c, int thickness) {
    int dx  = std::abs(x1 - x0);
    int dy  = -std::abs(y1 - y0);
    int sx  = x0 < x1 ? 1 : -1;
    int sy  = y0 < y1 ? 1 : -1;
    int err = dx + dy;
    int lo  = -(thickness - 1) / 2;
    int hi  = thickness / 2;

    while (true) {
        for (int ox = lo; ox <= hi; ox++) {
            for (int oy = lo; oy <= hi; oy++) {
                this->set(x0 + ox, y0 + oy, c);
            }
        }
        if (x0 == x1 && y0 == y1) {break;}
        int e2 = 2 * err;
        if (e2 >= dy) {
            err += dy;
            x0  += sx;
        }
        if (e2 <= dx) {
            err += dx;
            y0  += sy;
        }
    }
}

void Canvas::dashed_line(int x0, int y0, int x1, int y1, Color c, int dash, int gap, int thickness) {
    double len = std::hypot((double) (x1 - x0), (double) (y1 - y0));
    if (len < 1.0 || dash <= 0) {
        this->line(x0, y0, x1, y1, c, thickness);
        return;
    }
    double ux = (x1 - x0) / len;
    double uy = (y1 - y0) / len;
    double period = dash + std::max(gap, 0);
    for (double s = 0.0; s < len; s += period) {
        double e = std::min(s + dash, len);
        this->line(
            (int) std::lround(x0 + ux * s), (int) std::lround(y0 + uy * s),
            (int) std::lround(x0 + ux * e), (int) std::lround(y0 + uy * e),
            c, thickness
        );
    }
}

void Canvas::rect(int x0, int y0, int x1, int y1, Color c) {
    this->line(x0, y0, x1, y0, c);
    this->line(x1, y0, x1, y1, c);
    this->line(x1, y1, x0, y1, c);
    this->line(x0, y1, x0, y0, c);
}

void Canvas::fill_rect(int x0, int y0, int x1, int y1, Color c) {
    for (int y = std::min(y0, y1); y <= std::max(y0, y1); y++) {
        for (int x = std::min(x0, x1); x <= std::max(x0, x1); x++) {
            this->set(x, y, c);
        }
    }
}

void Canvas::clip(int x0, int y0, int x1, int y1) {
    _cx0 = std::max(0, x0);
    _cy0 = std::max(0, y0);
    _cx1 = std::min(_width, x1);
    _cy1 = std::min(_height, y1);
}

void Canvas::unclip() {
    _cx0 = 0;
    _cy0 = 0;
    _cx1 = _width;
    _cy1 = _height;
}
