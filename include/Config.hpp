#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>

#include "Constants.hpp"

class ArgumentParser;

// Parameters of one temperature sweep.
struct Config {
    // output
    std::string outdir;
    std::string prefix  = "frame";
    std::string ext     = ".png";
    int pad             = 3;
    bool h5             = true;

    // temperature sequence (K), high included
    double temp_low     = 4500.0;
    double temp_high    = 7000.0;
    double temp_step    = 25.0;

    // wavelength grid (m)
    double wl_low       = 100e-9;
    double wl_high      = 2e-6;
    int wl_n            = 1000;

    // frame layout
    double y_max        = Constants::plot::Y_MAX;
    int width           = Constants::plot::WIDTH;
    int height          = Constants::plot::HEIGHT;
    std::string font    = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";

    bool verbose        = false;

    // register all sweep arguments
    static void init(ArgumentParser* p);

    // CLI values, overridden by the members of --config (json) when given
    static Config from_parser(ArgumentParser* p);

    // overrides the fields present in a json file
    static void load_json(const std::string& path, Config& cfg);

    // DomainError on any value the sweep cannot run with
    void validate() const;
};

#endif
