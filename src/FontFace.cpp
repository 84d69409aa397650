#include <sstream>

#include "Errors.hpp"

#include "FontFace.hpp"

FontFace::FontFace(const std::string& path, int pixel_size) : _size(pixel_size) {
    if (FT_Init_FreeType(&_library) != 0) {
        throw IOError("could not initialise FreeType");
    }
    if (FT_New_Face(_library, path.c_str(), 0, &_face) != 0) {
        FT_Done_FreeType(_library);
        throw IOError("could not open font " + path);
    }
    if (FT_Set_Pixel_Sizes(_face, 0, pixel_size) != 0) {
        FT_Done_Face(_face);
        FT_Done_FreeType(_library);
        std::ostringstream ss;
        ss << "font " << path << " has no " << pixel_size << "px size";
        throw IOError(ss.str());
    }
}

FontFace::~FontFace() {
    FT_Done_Face(_face);
    FT_Done_FreeType(_library);
}

int FontFace::ascent() const {
    return (int) (_face->size->metrics.ascender >> 6);
}

int FontFace::width(const std::string& text) {
    int w = 0;
    for (unsigned char ch : text) {
        if (FT_Load_Char(_face, ch, FT_LOAD_DEFAULT) != 0) {
            continue;
        }
        w += (int) (_face->glyph->advance.x >> 6);
    }
    return w;
}

void FontFace::draw(Canvas& canvas, int x, int y, const std::string& text, Color c, bool vertical) {
    int pen = 0;
    for (unsigned char ch : text) {
        // glyphs missing from the face are skipped
        if (FT_Load_Char(_face, ch, FT_LOAD_RENDER) != 0) {
            continue;
        }
        FT_GlyphSlot g          = _face->glyph;
        const FT_Bitmap& bmp    = g->bitmap;

        for (unsigned int row = 0; row < bmp.rows; row++) {
            for (unsigned int col = 0; col < bmp.width; col++) {
                unsigned char v = bmp.buffer[row * bmp.pitch + col];
                if (v == 0) {
                    continue;
                }
                // glyph pixel relative to the baseline origin
                int gx = pen + g->bitmap_left + (int) col;
                int gy = (int) row - g->bitmap_top;
                float alpha = v / 255.0f;
                if (vertical) {
                    canvas.blend(x + gy, y - gx, c, alpha);
                } else {
                    canvas.blend(x + gx, y + gy, c, alpha);
                }
            }
        }
        pen += (int) (g->advance.x >> 6);
    }
}
