/**
 * @file test_vecs_file.cpp
 * @brief .fvecs / .bvecs / .ivecs reading and writing
 */

#include <gtest/gtest.h>
#include <io/vecs_file.hpp>
#include "../test_helpers.hpp"
#include <cstdint>
#include <cstdio>
#include <fstream>

using namespace Annex;

class VecsFileTest : public ::testing::Test {
protected:
    void TearDown() override { std::remove(path_.c_str()); }

    void write_raw(const std::vector<char>& bytes) {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

    std::string path_ = test::temp_path("vecs_file.vecs");
};

TEST_F(VecsFileTest, FloatRecordsRoundTrip) {
    const auto data = test::random_dataset<float>(25, 7, 1);
    write_vecs(path_, data.view());

    const auto loaded = read_vecs<float>(path_);
    ASSERT_EQ(loaded.rows(), 25u);
    ASSERT_EQ(loaded.cols(), 7u);
    for (size_t i = 0; i < 25; ++i) {
        for (size_t d = 0; d < 7; ++d) EXPECT_EQ(loaded[i][d], data[i][d]);
    }
}

TEST_F(VecsFileTest, ByteRecordLayout) {
    // dim = 3 as little-endian int32, then three bytes, twice
    write_raw({3, 0, 0, 0, 1, 2, 3, 3, 0, 0, 0, 4, 5, 6});

    const auto loaded = read_vecs<uint8_t>(path_);
    ASSERT_EQ(loaded.rows(), 2u);
    EXPECT_EQ(loaded[0][0], 1);
    EXPECT_EQ(loaded[1][2], 6);
}

TEST_F(VecsFileTest, MaxRowsLimitsTheLoad) {
    const auto data = test::random_dataset<int32_t>(10, 4, 2, 1000.0);
    write_vecs(path_, data.view());

    const auto first = read_vecs<int32_t>(path_, 3);
    ASSERT_EQ(first.rows(), 3u);
    EXPECT_EQ(first[2][3], data[2][3]);
}

TEST_F(VecsFileTest, TruncatedFileIsIoError) {
    write_raw({3, 0, 0, 0, 1, 2, 3, 3, 0, 0, 0, 4});
    EXPECT_THROW(read_vecs<uint8_t>(path_), IoError);
}

TEST_F(VecsFileTest, InconsistentDimensionIsIoError) {
    write_raw({2, 0, 0, 0, 1, 2, 1, 0, 0, 0, 3, 4});
    EXPECT_THROW(read_vecs<uint8_t>(path_), IoError);
}

TEST_F(VecsFileTest, EmptyOrMissingFileIsIoError) {
    write_raw({});
    EXPECT_THROW(read_vecs<float>(path_), IoError);
    EXPECT_THROW(read_vecs<float>(test::temp_path("missing.fvecs")), IoError);
}

TEST_F(VecsFileTest, MappedFileExposesContents) {
    write_raw({'a', 'b', 'c'});
    const MappedFile file(path_);
    ASSERT_EQ(file.size(), 3u);
    EXPECT_EQ(file.data()[1], 'b');
    EXPECT_EQ(file.path(), path_);
}
