#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <highfive/H5DataSet.hpp>
#include <highfive/H5DataSpace.hpp>
#include <highfive/H5File.hpp>
namespace H5 = HighFive;

#include "Errors.hpp"

#include "Functions.hpp"

size_t Functions::pad_width(size_t count, size_t width) {
    size_t digits = 1;
    for (size_t last = count > 0 ? count - 1 : 0; last >= 10; last /= 10) {
        digits++;
    }
    return digits > width ? digits : width;
}

std::string Functions::frame_name(const std::string& prefix, size_t index, size_t width, const std::string& ext) {
    std::ostringstream ss;
    ss << prefix << std::setw((int) width) << std::setfill('0') << index << ext;
    return ss.str();
}

void Functions::writeDataSet(H5::File* file, const std::vector<double>& data, std::string key) {
    if (!file->exist(key)) {
        H5::DataSet ds = file->createDataSet<double>(key, H5::DataSpace::From(data));
        ds.write(data);
    }
}

void Functions::writeDataSet(H5::File* file, const std::vector<std::vector<double>>& data, std::string key) {
    for (const auto& row : data) {
        if (row.size() != data[0].size()) {
            throw ShapeError("ragged rows in dataset " + key);
        }
    }
    if (!file->exist(key)) {
        H5::DataSet ds = file->createDataSet<double>(key, H5::DataSpace::From(data));
        ds.write(data);
    }
}

// check if dir path exists
bool Functions::isdir(std::string path) {
    return std::filesystem::is_directory(path);
}

// create dir if not exists
void Functions::mkdir(std::string path) {
    // if not exist create outdir
    if (!isdir(path)) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            throw IOError("could not create directory " + path + ": " + ec.message());
        }
    }
}
