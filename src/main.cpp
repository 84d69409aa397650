#include <exception>
#include <iostream>
#include <mpi.h>

#include "argparse-cpp/Argument.h"
#include "argparse-cpp/ArgumentParser.h"

#include "Constants.hpp"
namespace cs = Constants;

#include "Config.hpp"
#include "Sweep.hpp"

// sweep task "branch"
void sweep(int rank, int n_workers, const Config& cfg) {
    // single process, no workers to hand frames to
    if (n_workers == 0) {
        Sweep::serial(cfg);
        return;
    }

    // Process specific call
    if (rank == cs::mpi::MASTER) {
        Sweep::master(cfg, n_workers);
    } else {
        Sweep::slave(cfg);
    }
}

int main(int argc, char **argv) {
    // MPI init
    int rank, size, n_workers; // mpi process rank, num of mpi processes
    MPI_Init(&argc, &argv);
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);
    n_workers = size-1;

    // create and init argParser
    ArgumentParser* p = new ArgumentParser();
    Config::init(p);

    // parse cli passed arguments
    if (!p->parse(argc, argv)) {
        if (rank == cs::mpi::MASTER) {
            std::cout << *p; // prints out help msg.
        }
        delete p;
        MPI_Finalize();
        return 0;
    }

    int status = 0;
    try {
        Config cfg = Config::from_parser(p);
        cfg.validate();

        // Always start on new line
        if (rank == cs::mpi::MASTER && cfg.verbose) {
            std::cout << std::endl;
        }

        sweep(rank, n_workers, cfg);
    } catch (const std::exception& e) {
        std::cerr << "[rank " << rank << "] error: " << e.what() << std::endl;
        status = 1;
    }

    // Destroy Arg. parser object
    delete p;

    // a failing rank cannot leave the others blocked in MPI_Recv
    if (status != 0 && n_workers > 0) {
        MPI_Abort(MPI_COMM_WORLD, status);
    }

    // terminate mpi execution env
    MPI_Finalize();

    return status;
}
