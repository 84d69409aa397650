#include <csetjmp>
#include <cstdio>
#include <string>

#include <png.h>

#include "Errors.hpp"

#include "Png.hpp"

namespace {

// owns the file handle and libpng write structs of one encode
struct PngWriter {
    std::FILE*  file    = nullptr;
    png_structp png     = nullptr;
    png_infop   info    = nullptr;

    ~PngWriter() {
        if (png) {
            png_destroy_write_struct(&png, info ? &info : nullptr);
        }
        if (file) {
            std::fclose(file);
        }
    }
};

void on_error(png_structp png, png_const_charp msg) {
    std::string* err = static_cast<std::string*>(png_get_error_ptr(png));
    if (err) {
        *err = msg;
    }
    png_longjmp(png, 1);
}

void on_warning(png_structp, png_const_charp) {}

// setjmp must not share a frame with objects that have destructors
bool encode(PngWriter& w, const Canvas& canvas) {
    if (setjmp(png_jmpbuf(w.png))) {
        return false;
    }

    png_init_io(w.png, w.file);
    png_set_IHDR(w.png, w.info, canvas.width(), canvas.height(), 8,
        PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE,
        PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(w.png, w.info);

    for (int y = 0; y < canvas.height(); y++) {
        png_write_row(w.png, const_cast<png_bytep>(canvas.row(y)));
    }

    png_write_end(w.png, nullptr);
    return true;
}

}

void Png::write(const std::string& path, const Canvas& canvas) {
    PngWriter w;
    std::string err;

    w.file = std::fopen(path.c_str(), "wb");
    if (!w.file) {
        throw IOError("could not open " + path + " for writing");
    }

    w.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, &err, on_error, on_warning);
    if (!w.png) {
        throw IOError("could not create png write struct");
    }

    w.info = png_create_info_struct(w.png);
    if (!w.info) {
        throw IOError("could not create png info struct");
    }

    if (!encode(w, canvas)) {
        throw IOError("png encoding of " + path + " failed: " + err);
    }

    if (std::fflush(w.file) != 0 || std::ferror(w.file)) {
        throw IOError("could not write " + path);
    }

    // close errors are write errors too, the destructor only covers throws
    std::FILE* file = w.file;
    w.file = nullptr;
    if (std::fclose(file) != 0) {
        throw IOError("could not close " + path);
    }
}
