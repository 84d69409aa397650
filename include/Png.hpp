#ifndef PNG_HPP
#define PNG_HPP

#include <string>

#include "Canvas.hpp"

namespace Png {

// 8-bit RGB png, throws IOError on failure
void write(const std::string& path, const Canvas& canvas);

}

#endif
