#include <fstream>
#include <iterator>
#include <sstream>

#include "argparse-cpp/Argument.h"
#include "argparse-cpp/ArgumentParser.h"

#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
namespace json = rapidjson;

#include "Errors.hpp"

#include "Config.hpp"

namespace {

void json_double(const json::Document& d, const char* key, double& out) {
    if (!d.HasMember(key)) {return;}
    if (!d[key].IsNumber()) {
        throw DomainError(std::string("config member '") + key + "' must be a number");
    }
    out = d[key].GetDouble();
}

void json_int(const json::Document& d, const char* key, int& out) {
    if (!d.HasMember(key)) {return;}
    if (!d[key].IsInt()) {
        throw DomainError(std::string("config member '") + key + "' must be an integer");
    }
    out = d[key].GetInt();
}

void json_string(const json::Document& d, const char* key, std::string& out) {
    if (!d.HasMember(key)) {return;}
    if (!d[key].IsString()) {
        throw DomainError(std::string("config member '") + key + "' must be a string");
    }
    out = d[key].GetString();
}

void json_bool(const json::Document& d, const char* key, bool& out) {
    if (!d.HasMember(key)) {return;}
    if (!d[key].IsBool()) {
        throw DomainError(std::string("config member '") + key + "' must be true or false");
    }
    out = d[key].GetBool();
}

}

void Config::init(ArgumentParser* p) {
    Config def;

    // ---------------
    // Run parameters
    // ---------------

    /**
     * Verbosity
     * default: false
     */
    Argument<bool>* verbose = new Argument<bool>("verbose", false);
    verbose->setShorthand("v");
    verbose->setHelp("Enables verbose mode.");
    p->addArgument(verbose);

    /**
     * Json sweep description
     * - its members override the matching arguments
     */
    Argument<std::string>* config = new Argument<std::string>("config");
    config->setHelp("Json file with sweep parameters.");
    p->addArgument(config);

    // --------------
    // Input / Output
    // --------------

    /**
     * Frame output directory
     */
    Argument<std::string>* outdir = new Argument<std::string>("outdir");
    outdir->setRequired(true);
    outdir->setShorthand("o");
    outdir->setHelp("Output frame directory (use --outdir=PATH).");
    p->addArgument(outdir);

    p->addArgument(new Argument<std::string>("prefix", def.prefix, "Frame file name prefix."));
    p->addArgument(new Argument<std::string>("ext", def.ext, "Frame file name extension."));
    p->addArgument(new Argument<int>("pad", def.pad, "Minimal zero padding of the frame index."));
    p->addArgument(new Argument<bool>("h5", def.h5, "Write spectra.h5 with all series (--h5=false to skip)."));

    // ------------------
    // Sweep parameters
    // ------------------

    p->addArgument(new Argument<double>("temp_low", def.temp_low, "First temperature [K]."));
    p->addArgument(new Argument<double>("temp_high", def.temp_high, "Last temperature [K], included."));
    p->addArgument(new Argument<double>("temp_step", def.temp_step, "Temperature step [K]."));

    p->addArgument(new Argument<double>("wl_low", def.wl_low, "Shortest wavelength [m] (use --wl_low=1e-7)."));
    p->addArgument(new Argument<double>("wl_high", def.wl_high, "Longest wavelength [m]."));
    p->addArgument(new Argument<int>("wl_n", def.wl_n, "Number of wavelength points."));

    // ------------------
    // Frame parameters
    // ------------------

    p->addArgument(new Argument<double>("y_max", def.y_max, "Fixed upper bound of the radiance axis."));
    p->addArgument(new Argument<int>("width", def.width, "Frame width [px]."));
    p->addArgument(new Argument<int>("height", def.height, "Frame height [px]."));
    p->addArgument(new Argument<std::string>("font", def.font, "TrueType font for labels."));
}

Config Config::from_parser(ArgumentParser* p) {
    Config cfg;

    if (!p->isSet("outdir") && !p->isSet("config")) {
        throw DomainError("missing --outdir");
    }
    if (p->isSet("outdir")) {
        cfg.outdir = p->s("outdir");
    }

    cfg.prefix      = p->s("prefix");
    cfg.ext         = p->s("ext");
    cfg.pad         = p->i("pad");
    cfg.h5          = p->b("h5");
    cfg.temp_low    = p->d("temp_low");
    cfg.temp_high   = p->d("temp_high");
    cfg.temp_step   = p->d("temp_step");
    cfg.wl_low      = p->d("wl_low");
    cfg.wl_high     = p->d("wl_high");
    cfg.wl_n        = p->i("wl_n");
    cfg.y_max       = p->d("y_max");
    cfg.width       = p->i("width");
    cfg.height      = p->i("height");
    cfg.font        = p->s("font");
    cfg.verbose     = p->b("verbose");

    if (p->isSet("config")) {
        load_json(p->s("config"), cfg);
    }
    return cfg;
}

void Config::load_json(const std::string& path, Config& cfg) {
    std::ifstream infile(path);
    if (!infile) {
        throw IOError("could not read config " + path);
    }
    std::string content((std::istreambuf_iterator<char>(infile)), std::istreambuf_iterator<char>());

    json::Document d;
    d.Parse(content.c_str());
    if (d.HasParseError()) {
        std::ostringstream ss;
        ss << "config " << path << " offset " << d.GetErrorOffset() << ": "
           << json::GetParseError_En(d.GetParseError());
        throw IOError(ss.str());
    }
    if (!d.IsObject()) {
        throw IOError("config " + path + " is not a json object");
    }

    json_string(d, "outdir", cfg.outdir);
    json_string(d, "prefix", cfg.prefix);
    json_string(d, "ext", cfg.ext);
    json_int(d, "pad", cfg.pad);
    json_bool(d, "h5", cfg.h5);
    json_double(d, "temp_low", cfg.temp_low);
    json_double(d, "temp_high", cfg.temp_high);
    json_double(d, "temp_step", cfg.temp_step);
    json_double(d, "wl_low", cfg.wl_low);
    json_double(d, "wl_high", cfg.wl_high);
    json_int(d, "wl_n", cfg.wl_n);
    json_double(d, "y_max", cfg.y_max);
    json_int(d, "width", cfg.width);
    json_int(d, "height", cfg.height);
    json_string(d, "font", cfg.font);
    json_bool(d, "verbose", cfg.verbose);
}

void Config::validate() const {
    std::ostringstream ss;
    if (outdir.empty()) {
        ss << "output directory is not set";
    } else if (!(temp_low > 0.0) || !(temp_high > 0.0)) {
        ss << "temperatures must be positive (" << temp_low << " .. " << temp_high << " K)";
    } else if (temp_high < temp_low) {
        ss << "temp_high " << temp_high << " K is below temp_low " << temp_low << " K";
    } else if (!(temp_step > 0.0)) {
        ss << "temp_step must be positive, got " << temp_step;
    } else if (!(wl_low > 0.0) || !(wl_high > 0.0)) {
        ss << "wavelengths must be positive (" << wl_low << " .. " << wl_high << " m)";
    } else if (wl_n < 1) {
        ss << "wl_n must be at least 1, got " << wl_n;
    } else if (wl_n > 1 && !(wl_low < wl_high)) {
        ss << "wl_low " << wl_low << " m must be below wl_high " << wl_high << " m";
    } else if (!(y_max > 0.0)) {
        ss << "y_max must be positive, got " << y_max;
    } else if (width <= Constants::plot::LEFT + Constants::plot::RIGHT
            || height <= Constants::plot::TOP + Constants::plot::BOTTOM) {
        ss << "frame size " << width << "x" << height << " is too small";
    } else if (pad < 1) {
        ss << "pad must be at least 1, got " << pad;
    } else {
        return;
    }
    throw DomainError(ss.str());
}
