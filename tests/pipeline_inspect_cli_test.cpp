#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

std::vector<std::string> read_lines(const char* path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line))
        lines.push_back(line);
    return lines;
}

int run(const std::string& args, const char* out) {
    std::string cmd = "./batchflow_inspect " + args + " > " + out + " 2> /dev/null";
    return std::system(cmd.c_str());
}

} // namespace

TEST(PipelineInspectCli, MinibatchShapes) {
    const char* path = "inspect_minibatches.txt";
    ASSERT_EQ(run("5 4 3 8 8 --batch-size 3 --no-shuffle", path), 0);
    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "epoch 0 batch 0 default f32[5,3,3,8,8]");
    EXPECT_EQ(lines[1], "epoch 0 batch 1 default f32[5,1,3,8,8]");
    std::remove(path);
}

TEST(PipelineInspectCli, PadThenCrop) {
    const char* path = "inspect_crop.txt";
    ASSERT_EQ(run("2 6 1 8 8 --iterator online --pad 2 --crop 10 9 --flip 0.5 --noise 0.1 "
                  "--epochs 2 --seed 3",
                  path),
              0);
    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 12u);
    EXPECT_EQ(lines[0], "epoch 0 batch 0 default f32[2,1,1,10,9]");
    EXPECT_EQ(lines[11], "epoch 1 batch 5 default f32[2,1,1,10,9]");
    std::remove(path);
}

TEST(PipelineInspectCli, Undivided) {
    const char* path = "inspect_undivided.txt";
    ASSERT_EQ(run("3 7 2 4 4 --iterator undivided", path), 0);
    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "epoch 0 batch 0 default f32[3,7,2,4,4]");
    std::remove(path);
}

TEST(PipelineInspectCli, CropLargerThanImageFails) {
    const char* path = "inspect_bad_crop.txt";
    EXPECT_NE(run("5 4 3 8 8 --crop 9 8", path), 0);
    std::remove(path);
}

TEST(PipelineInspectCli, BadArgumentsFail) {
    const char* path = "inspect_bad_args.txt";
    EXPECT_NE(run("5 4 3", path), 0);
    EXPECT_NE(run("5 4 3 8 eight", path), 0);
    EXPECT_NE(run("5 4 3 8 8 --unknown", path), 0);
    EXPECT_NE(run("5 4 3 8 8 --iterator sideways", path), 0);
    EXPECT_NE(run("5 4 3 8 8 --batch-size 0", path), 0);
    std::remove(path);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
