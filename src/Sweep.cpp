#include <algorithm>
#include <iostream>
#include <mpi.h>
#include <sstream>
#include <stdexcept>

#include <highfive/H5DataSet.hpp>
#include <highfive/H5DataSpace.hpp>
#include <highfive/H5File.hpp>
namespace H5 = HighFive;

#include "Functions.hpp"
namespace fn = Functions;

#include "Constants.hpp"
namespace cs = Constants;

#include "Plotter.hpp"
#include "Radiation.hpp"

#include "Sweep.hpp"

namespace {

std::vector<double> grid(const Config& cfg) {
    return Radiation::linspace(cfg.wl_low, cfg.wl_high, (size_t) cfg.wl_n);
}

void progress(const Config& cfg, size_t done, size_t count) {
    if (!cfg.verbose || count == 0) {
        return;
    }
    size_t one_percent = count / 100;
    if (one_percent == 0 || done % one_percent == 0 || done == count) {
        std::cout << "Sweep ... " << (int) (100.0 * (double) done / (double) count) << "%\t\r" << std::flush;
    }
}

}

std::string Sweep::frame_path(const Config& cfg, size_t index, size_t count) {
    size_t width = fn::pad_width(count, (size_t) cfg.pad);
    return cfg.outdir + "/" + fn::frame_name(cfg.prefix, index, width, cfg.ext);
}

Sweep::Record Sweep::frame(const Config& cfg, const std::vector<double>& wl, double T, size_t index, size_t count, Plotter& plotter) {
    Radiation::validate(wl, T);

    Record r;
    r.index         = index;
    r.temperature   = T;
    r.radiance      = Radiation::compute(wl, T);

    Frame::Result res = Frame::render(r.radiance, T, wl, frame_path(cfg, index, count), plotter);
    r.path  = res.path;
    r.peak  = res.peak;
    return r;
}

void Sweep::archive(const Config& cfg, const std::vector<double>& wl, const std::vector<Record>& records) {
    std::vector<double> temps;
    std::vector<std::vector<double>> radiance;
    std::vector<std::vector<double>> peaks;
    for (const Record& r : records) {
        temps.push_back(r.temperature);
        radiance.push_back(r.radiance);
        peaks.push_back({r.peak.wavelength, r.peak.radiance});
    }

    H5::File file(cfg.outdir + "/spectra.h5", H5::File::Overwrite);
    fn::writeDataSet(&file, wl, "wavelength");
    fn::writeDataSet(&file, temps, "temperature");
    fn::writeDataSet(&file, radiance, "radiance");
    fn::writeDataSet(&file, peaks, "peak");
}

std::vector<Sweep::Record> Sweep::serial(const Config& cfg) {
    fn::mkdir(cfg.outdir);

    std::vector<double> wl      = grid(cfg);
    std::vector<double> temps   = Radiation::temperature_range(cfg.temp_low, cfg.temp_high, cfg.temp_step);
    SpectrumPlotter plotter(cfg.width, cfg.height, cfg.y_max, cfg.font);

    std::vector<Record> records;
    records.reserve(temps.size());
    for (size_t i = 0; i < temps.size(); i++) {
        records.push_back(frame(cfg, wl, temps[i], i, temps.size(), plotter));
        progress(cfg, i + 1, temps.size());
    }

    if (cfg.h5) {
        archive(cfg, wl, records);
    }

    // info msg.
    if (cfg.verbose) {
        std::cout << std::endl << "Done ... " << records.size() << " frames in " << cfg.outdir << std::endl;
    }
    return records;
}

void Sweep::terminate(int n_workers) {
    double task[2] = {0.0, 0.0};
    for (int slave = 1; slave <= n_workers; slave++) {
        MPI_Send(task, 2, MPI_DOUBLE, slave, cs::mpi::STOP, MPI_COMM_WORLD);
    }
}

std::vector<Sweep::Record> Sweep::master(const Config& cfg, int n_workers) {
    // MPI status flag holder
    MPI_Status status;

    fn::mkdir(cfg.outdir);

    std::vector<double> wl      = grid(cfg);
    std::vector<double> temps   = Radiation::temperature_range(cfg.temp_low, cfg.temp_high, cfg.temp_step);
    size_t count                = temps.size();

    // reply: peak index, peak wavelength, peak radiance, series
    std::vector<double> reply(wl.size() + 3);
    std::vector<Record> records(count);

    double task[2];
    size_t s = 0;
    size_t idx;
    int slave;
    bool failed = false;
    std::ostringstream failures;

    while (true) {
        // out
        for (slave = 1; slave <= n_workers; slave++) {
            idx     = s + slave - 1;
            bool skip = idx >= count;
            task[0] = (double) idx;
            task[1] = skip ? 0.0 : temps[idx];
            MPI_Send(task, 2, MPI_DOUBLE, slave, skip ? cs::mpi::SKIP : cs::mpi::COMPUTE, MPI_COMM_WORLD);
        }

        // in
        for (slave = 1; slave <= n_workers; slave++) {
            idx     = s + slave - 1;

            MPI_Recv(reply.data(), (int) reply.size(), MPI_DOUBLE, slave, MPI_ANY_TAG, MPI_COMM_WORLD, &status);

            if (status.MPI_TAG == cs::mpi::COMPUTE) {
                Record& r       = records[idx];
                r.index         = idx;
                r.temperature   = temps[idx];
                r.path          = frame_path(cfg, idx, count);
                r.peak          = {(size_t) reply[0], reply[1], reply[2]};
                r.radiance.assign(reply.begin() + 3, reply.end());
            } else if (status.MPI_TAG == cs::mpi::FAILED) {
                failed = true;
                failures << " " << idx << " (" << temps[idx] << " K, worker " << slave << ")";
            }
        }

        if (failed) {
            terminate(n_workers);
            throw std::runtime_error("sweep aborted, failed frames:" + failures.str());
        }

        s += n_workers;
        progress(cfg, s < count ? s : count, count);
        if (s >= count) {break;}
    }

    // end slaves
    terminate(n_workers);

    if (cfg.h5) {
        archive(cfg, wl, records);
    }

    // info msg.
    if (cfg.verbose) {
        std::cout << std::endl << "Done ... " << count << " frames in " << cfg.outdir << std::endl;
    }
    return records;
}

void Sweep::slave(const Config& cfg) {
    /** MPI status flag **/
    MPI_Status status;

    int rank;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);

    std::vector<double> wl      = grid(cfg);
    std::vector<double> temps   = Radiation::temperature_range(cfg.temp_low, cfg.temp_high, cfg.temp_step);
    // font warning from the first worker only
    SpectrumPlotter plotter(cfg.width, cfg.height, cfg.y_max, cfg.font, rank == 1);

    std::vector<double> reply(wl.size() + 3, 0.0);
    double task[2];
    int tag;

    while (true) {
        MPI_Recv(task, 2, MPI_DOUBLE, 0, MPI_ANY_TAG, MPI_COMM_WORLD, &status);

        if (status.MPI_TAG == cs::mpi::STOP) {break;}

        tag = status.MPI_TAG;
        if (status.MPI_TAG == cs::mpi::COMPUTE) {
            size_t idx = (size_t) task[0];
            try {
                Record r = frame(cfg, wl, task[1], idx, temps.size(), plotter);
                reply[0] = (double) r.peak.index;
                reply[1] = r.peak.wavelength;
                reply[2] = r.peak.radiance;
                std::copy(r.radiance.begin(), r.radiance.end(), reply.begin() + 3);
            } catch (const std::exception& e) {
                // reported to the master through the reply tag
                std::cerr << "[rank " << rank << "] frame " << idx << ": " << e.what() << std::endl;
                tag = cs::mpi::FAILED;
            }
        }

        MPI_Send(reply.data(), (int) reply.size(), MPI_DOUBLE, 0, tag, MPI_COMM_WORLD);
    }
}
