#ifndef FUNCTIONS_HPP
#define FUNCTIONS_HPP

#include <string>
#include <vector>

#include <highfive/H5File.hpp>
namespace H5 = HighFive;

namespace Functions {

// zero padding width able to number count frames, at least width digits
size_t pad_width(size_t count, size_t width);

// prefix + zero padded index + ext, e.g. frame007.png
std::string frame_name(const std::string& prefix, size_t index, size_t width, const std::string& ext);

// 1D dataset
void writeDataSet(H5::File* file, const std::vector<double>& data, std::string key);

// 2D dataset, rows must have equal length
void writeDataSet(H5::File* file, const std::vector<std::vector<double>>& data, std::string key);

// check if dir path exists
bool isdir(std::string path);

// create dir (and parents) if not exists
void mkdir(std::string path);

}

#endif
