#ifndef SWEEP_HPP
#define SWEEP_HPP

#include <string>
#include <vector>

#include "Config.hpp"
#include "Frame.hpp"

class Plotter;

namespace Sweep {

// one processed temperature
struct Record {
    size_t              index;
    double              temperature;
    std::string         path;
    Frame::PeakPoint    peak;
    std::vector<double> radiance;
};

// <outdir>/<prefix><index><ext>, padded wide enough for count frames
std::string frame_path(const Config& cfg, size_t index, size_t count);

// compute, render and persist sweep frame index
Record frame(const Config& cfg, const std::vector<double>& wl, double T, size_t index, size_t count, Plotter& plotter);

// <outdir>/spectra.h5 with wavelength, temperature, radiance and peak datasets
void archive(const Config& cfg, const std::vector<double>& wl, const std::vector<Record>& records);

// whole sweep in this process, in temperature order
std::vector<Record> serial(const Config& cfg);

// stop all workers
void terminate(int n_workers);

// Function for MPI master process, frames handed out in batches of n_workers
std::vector<Record> master(const Config& cfg, int n_workers);

// Function for MPI slave processes
void slave(const Config& cfg);

}

#endif
