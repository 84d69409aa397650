#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// invalid physical input (non-positive wavelength, temperature, ...)
class DomainError : public std::domain_error {
public:
    explicit DomainError(const std::string& msg) : std::domain_error(msg) {}
};

// empty or mismatched wavelength / radiance sequences
class ShapeError : public std::length_error {
public:
    explicit ShapeError(const std::string& msg) : std::length_error(msg) {}
};

// unreadable config, unwritable frame or archive
class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& msg) : std::runtime_error(msg) {}
};

#endif
