#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "Canvas.hpp"
#include "Errors.hpp"
#include "Png.hpp"

#include "TestDir.hpp"

namespace {

std::vector<unsigned char> slurp(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<unsigned char>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

unsigned int be32(const std::vector<unsigned char>& b, size_t off) {
    return (b[off] << 24) | (b[off+1] << 16) | (b[off+2] << 8) | b[off+3];
}

}

TEST(Canvas, StartsWithBackground) {
    Canvas c(4, 3, Colors::BLACK);
    EXPECT_EQ(c.width(), 4);
    EXPECT_EQ(c.height(), 3);
    EXPECT_EQ(c.data().size(), 4u * 3u * 3u);
    EXPECT_EQ(c.at(3, 2), Colors::BLACK);
}

TEST(Canvas, RejectsEmptySize) {
    EXPECT_THROW(Canvas(0, 10), DomainError);
    EXPECT_THROW(Canvas(10, -1), DomainError);
}

TEST(Canvas, SetIgnoresOutsidePixels) {
    Canvas c(4, 4);
    c.set(1, 2, Colors::RED);
    c.set(-1, 0, Colors::RED);
    c.set(4, 4, Colors::RED);
    EXPECT_EQ(c.at(1, 2), Colors::RED);
    EXPECT_EQ(c.at(0, 0), Colors::WHITE);
    EXPECT_THROW(c.at(4, 0), DomainError);
}

TEST(Canvas, LineCoversEndpoints) {
    Canvas c(20, 20);
    c.line(2, 3, 17, 12, Colors::BLUE);
    EXPECT_EQ(c.at(2, 3), Colors::BLUE);
    EXPECT_EQ(c.at(17, 12), Colors::BLUE);
    EXPECT_EQ(c.at(2, 12), Colors::WHITE);
}

TEST(Canvas, DashedLineHasGaps) {
    Canvas c(40, 5);
    c.dashed_line(0, 2, 39, 2, Colors::RED, 4, 4);
    EXPECT_EQ(c.at(1, 2), Colors::RED);
    EXPECT_EQ(c.at(6, 2), Colors::WHITE);
    EXPECT_EQ(c.at(9, 2), Colors::RED);
}

TEST(Canvas, ClipLimitsDrawing) {
    Canvas c(10, 10);
    c.clip(2, 2, 8, 8);
    c.line(0, 5, 9, 5, Colors::BLACK);
    EXPECT_EQ(c.at(1, 5), Colors::WHITE);
    EXPECT_EQ(c.at(2, 5), Colors::BLACK);
    EXPECT_EQ(c.at(7, 5), Colors::BLACK);
    EXPECT_EQ(c.at(8, 5), Colors::WHITE);
    c.unclip();
    c.set(0, 0, Colors::BLACK);
    EXPECT_EQ(c.at(0, 0), Colors::BLACK);
}

TEST(Canvas, BlendMixesColors) {
    Canvas c(1, 1, Colors::WHITE);
    c.blend(0, 0, Colors::BLACK, 0.5f);
    Color m = c.at(0, 0);
    EXPECT_NEAR(m.r, 128, 1);
    EXPECT_NEAR(m.g, 128, 1);
    c.blend(0, 0, Colors::RED, 1.0f);
    EXPECT_EQ(c.at(0, 0), Colors::RED);
}

TEST(Png, WritesHeaderWithCanvasSize) {
    TestDir dir;
    Canvas c(33, 17);
    c.line(0, 0, 32, 16, Colors::BLUE);
    std::string path = dir.file("out.png");
    Png::write(path, c);

    std::vector<unsigned char> b = slurp(path);
    ASSERT_GT(b.size(), 33u);
    EXPECT_EQ(std::string(b.begin(), b.begin() + 8), std::string("\x89PNG\r\n\x1a\n", 8));
    EXPECT_EQ(std::string(b.begin() + 12, b.begin() + 16), "IHDR");
    EXPECT_EQ(be32(b, 16), 33u);
    EXPECT_EQ(be32(b, 20), 17u);
    EXPECT_EQ(b[24], 8);  // bit depth
    EXPECT_EQ(b[25], 2);  // rgb
}

TEST(Png, UnopenablePathThrows) {
    TestDir dir;
    EXPECT_THROW(Png::write(dir.file("no/such/dir/out.png"), Canvas(2, 2)), IOError);
}

TEST(Png, FullDeviceReportsWriteError) {
    if (!std::filesystem::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full not available";
    }
    // open succeeds, the data only fails once flushed or closed
    EXPECT_THROW(Png::write("/dev/full", Canvas(64, 64)), IOError);
}
