#ifndef FONTFACE_HPP
#define FONTFACE_HPP

#include <string>

#include <ft2build.h>
#include FT_FREETYPE_H

#include "Canvas.hpp"

// TrueType face rasterised with FreeType, owns library + face
class FontFace {
private:
    FT_Library  _library = nullptr;
    FT_Face     _face    = nullptr;
    int         _size;
public:
    FontFace(const std::string& path, int pixel_size);
    ~FontFace();

    FontFace(const FontFace&) = delete;
    FontFace& operator=(const FontFace&) = delete;

    int size() const {return _size;}

    // ascender in px above the baseline
    int ascent() const;

    // advance width of the whole string, px
    int width(const std::string& text);

    // (x, y) is the left end of the baseline; vertical text runs bottom to top
    void draw(Canvas& canvas, int x, int y, const std::string& text, Color c, bool vertical = false);
};

#endif
