#ifndef CONSTANTS_HPP
#define CONSTANTS_HPP

namespace Constants {
    namespace mpi {
        // rank 
        const int MASTER    = 0;

        // compute tags
        const int COMPUTE   = 1;
        const int STOP      = 2;
        const int SKIP      = 3;
        const int FAILED    = 4;
    }

    // Planck's const
    const double h      = 6.62607015e-34; // J * s
    
    // Boltzmann's constant
    const double k      = 1.380649e-23; // J * K^-1

    // Speed of light
    const double c      = 299792458.0; // m * s^-1

    namespace plot {
        // fixed radiance axis, keeps one scale over a whole sweep
        const double Y_MAX  = 7e13; // W * m^-3 * sr^-1

        const int WIDTH     = 640;
        const int HEIGHT    = 480;

        // plot area margins (px)
        const int LEFT      = 84;
        const int RIGHT     = 24;
        const int TOP       = 36;
        const int BOTTOM    = 56;
    }
} 

#endif
