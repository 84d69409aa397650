#ifndef CANVAS_HPP
#define CANVAS_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

struct Color {
    uint8_t r;
    uint8_t g;
    uint8_t b;
};

inline bool operator==(const Color& a, const Color& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

inline bool operator!=(const Color& a, const Color& b) {
    return !(a == b);
}

namespace Colors {
    const Color WHITE   = {255, 255, 255};
    const Color BLACK   = {0, 0, 0};
    const Color GRAY    = {200, 200, 200};
    const Color BLUE    = {31, 119, 180};
    const Color RED     = {214, 39, 40};
}

// RGB8 raster, row major, top row first
class Canvas {
private:
    int                     _width;
    int                     _height;
    std::vector<uint8_t>    _data;

    // clip rectangle, [x0, x1) x [y0, y1)
    int _cx0, _cy0, _cx1, _cy1;

    bool inside(int x, int y) const {
        return x >= _cx0 && x < _cx1 && y >= _cy0 && y < _cy1;
    }
public:
    Canvas(int width, int height, Color bg = Colors::WHITE);

    int width() const {return _width;}
    int height() const {return _height;}

    const std::vector<uint8_t>& data() const {return _data;}
    const uint8_t* row(int y) const {return _data.data() + (size_t) y * _width * 3;}

    void fill(Color c);

    void set(int x, int y, Color c);

    // alpha in [0, 1], 1 == set()
    void blend(int x, int y, Color c, float alpha);

    Color at(int x, int y) const;

    // thickness grows the line symmetrically, in px
    void line(int x0, int y0, int x1, int y1, Color c, int thickness = 1);

    void dashed_line(int x0, int y0, int x1, int y1, Color c, int dash, int gap, int thickness = 1);

    // outline only
    void rect(int x0, int y0, int x1, int y1, Color c);

    void fill_rect(int x0, int y0, int x1, int y1, Color c);

    void clip(int x0, int y0, int x1, int y1);

    void unclip();
};

#endif
