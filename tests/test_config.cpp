#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "argparse-cpp/Argument.h"
#include "argparse-cpp/ArgumentParser.h"

#include "Config.hpp"
#include "Errors.hpp"

#include "TestDir.hpp"

namespace {

Config valid() {
    Config cfg;
    cfg.outdir = "/tmp/frames";
    return cfg;
}

void write(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

}

TEST(Config, DefaultsDescribeTheReferenceSweep) {
    Config cfg;
    EXPECT_EQ(cfg.prefix, "frame");
    EXPECT_EQ(cfg.ext, ".png");
    EXPECT_EQ(cfg.pad, 3);
    EXPECT_EQ(cfg.temp_low, 4500.0);
    EXPECT_EQ(cfg.temp_high, 7000.0);
    EXPECT_EQ(cfg.temp_step, 25.0);
    EXPECT_EQ(cfg.wl_low, 100e-9);
    EXPECT_EQ(cfg.wl_high, 2e-6);
    EXPECT_EQ(cfg.wl_n, 1000);
    EXPECT_EQ(cfg.y_max, 7e13);
    EXPECT_NO_THROW(valid().validate());
}

TEST(Config, ValidateRejectsUnusableValues) {
    Config cfg = valid();
    cfg.outdir.clear();
    EXPECT_THROW(cfg.validate(), DomainError);

    cfg = valid(); cfg.temp_low = 0.0;
    EXPECT_THROW(cfg.validate(), DomainError);

    cfg = valid(); cfg.temp_high = 4000.0;
    EXPECT_THROW(cfg.validate(), DomainError);

    cfg = valid(); cfg.temp_step = 0.0;
    EXPECT_THROW(cfg.validate(), DomainError);

    cfg = valid(); cfg.wl_low = -1e-7;
    EXPECT_THROW(cfg.validate(), DomainError);

    cfg = valid(); cfg.wl_low = 3e-6;
    EXPECT_THROW(cfg.validate(), DomainError);

    cfg = valid(); cfg.wl_n = 0;
    EXPECT_THROW(cfg.validate(), DomainError);

    cfg = valid(); cfg.y_max = 0.0;
    EXPECT_THROW(cfg.validate(), DomainError);

    cfg = valid(); cfg.width = 64;
    EXPECT_THROW(cfg.validate(), DomainError);

    cfg = valid(); cfg.pad = 0;
    EXPECT_THROW(cfg.validate(), DomainError);
}

TEST(Config, JsonOverridesPresentMembers) {
    TestDir dir;
    std::string path = dir.file("sweep.json");
    write(path, R"({"outdir": "out", "temp_low": 5000, "temp_step": 50.5, "wl_n": 200, "h5": false, "prefix": "bb"})");

    Config cfg = valid();
    Config::load_json(path, cfg);
    EXPECT_EQ(cfg.outdir, "out");
    EXPECT_EQ(cfg.temp_low, 5000.0);
    EXPECT_EQ(cfg.temp_step, 50.5);
    EXPECT_EQ(cfg.wl_n, 200);
    EXPECT_FALSE(cfg.h5);
    EXPECT_EQ(cfg.prefix, "bb");
    // untouched
    EXPECT_EQ(cfg.temp_high, 7000.0);
    EXPECT_EQ(cfg.y_max, 7e13);
}

TEST(Config, JsonErrors) {
    TestDir dir;
    Config cfg = valid();

    EXPECT_THROW(Config::load_json(dir.file("missing.json"), cfg), IOError);

    write(dir.file("broken.json"), "{\"temp_low\": ");
    EXPECT_THROW(Config::load_json(dir.file("broken.json"), cfg), IOError);

    write(dir.file("array.json"), "[1, 2]");
    EXPECT_THROW(Config::load_json(dir.file("array.json"), cfg), IOError);

    write(dir.file("type.json"), R"({"wl_n": "many"})");
    EXPECT_THROW(Config::load_json(dir.file("type.json"), cfg), DomainError);
}

TEST(Config, FromCommandLine) {
    ArgumentParser* p = new ArgumentParser();
    Config::init(p);

    std::vector<std::string> args = {"bbsweep", "--outdir=/tmp/frames", "--temp_low=5000", "--wl_n=50", "--wl_high=1e-6", "--verbose"};
    std::vector<char*> argv;
    for (std::string& a : args) {
        argv.push_back(&a[0]);
    }
    int argc = (int) argv.size();
    ASSERT_TRUE(p->parse(argc, argv.data()));

    Config cfg = Config::from_parser(p);
    EXPECT_EQ(cfg.outdir, "/tmp/frames");
    EXPECT_EQ(cfg.temp_low, 5000.0);
    EXPECT_EQ(cfg.temp_high, 7000.0);
    EXPECT_EQ(cfg.wl_n, 50);
    EXPECT_EQ(cfg.wl_high, 1e-6);
    EXPECT_TRUE(cfg.verbose);
    EXPECT_NO_THROW(cfg.validate());

    delete p;
}
