#include "strata_test_utils.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace strata;
using namespace strata::testing;

class IOTest : public ContextTest {
  protected:
    void SetUp() override {
        ContextTest::SetUp();
        path_ = (std::filesystem::temp_directory_path() /
                 ("strata_io_test_" + std::to_string(::getpid()) + ".strata"))
                    .string();
    }

    void TearDown() override { std::remove(path_.c_str()); }

    Tensor round_trip(const Tensor &tensor) {
        std::stringstream stream;
        io::encode(tensor, stream);
        return io::decode(context, stream);
    }

    std::string path_;
};

TEST(DTypeNames, NamesIdentifyStoredTypes) {
    EXPECT_EQ(dtype_name(DType::UInt16), "uint16");
    EXPECT_EQ(dtype_from_name("float64"), DType::Float64);
    EXPECT_EQ(dtype_from_name(dtype_name(DType::Bool)), DType::Bool);
    EXPECT_THROW(dtype_from_name("float16"), TypeError);
    EXPECT_TRUE(is_valid_dtype(static_cast<uint8_t>(DType::Float64)));
    EXPECT_FALSE(is_valid_dtype(200));
}

TEST_F(IOTest, DenseTensorRoundTrips) {
    auto t = Iota(context, {2, 3});
    auto decoded = round_trip(t);
    EXPECT_EQ(decoded.extents(), ShapeArray({2, 3}));
    EXPECT_EQ(decoded.dtype(), DType::Float32);
    EXPECT_EQ(decoded.offset(), 0);
    EXPECT_FALSE(decoded.is_shared());
    EXPECT_FALSE(SharesStorage(t, decoded));
    ExpectTensorEquals<float>(decoded, {0, 1, 2, 3, 4, 5});
}

TEST_F(IOTest, StridedViewIsWrittenDensely) {
    auto t = Iota(context, {3, 4});
    auto view = t.slice({0, 1}, {3, 4}, {2, 2}).transposed();
    auto decoded = round_trip(view);
    EXPECT_EQ(decoded.extents(), ShapeArray({2, 2}));
    EXPECT_TRUE(decoded.is_row_major());
    EXPECT_EQ(decoded.storage()->count(), 4);
    ExpectTensorEquals<float>(decoded, {1, 9, 3, 11});
}

TEST_F(IOTest, BroadcastViewIsExpanded) {
    auto t = Tensor::repeating<int32_t>(context, 4, {2, 3});
    auto decoded = round_trip(t);
    EXPECT_EQ(decoded.storage()->count(), 6);
    EXPECT_EQ(decoded.strides(), ShapeArray({3, 1}));
    ExpectTensorEquals<int32_t>(decoded, {4, 4, 4, 4, 4, 4});
}

TEST_F(IOTest, EmptyTensorRoundTrips) {
    auto t = Tensor::empty(context, {0, 3}, DType::Int8);
    auto decoded = round_trip(t);
    EXPECT_EQ(decoded.extents(), ShapeArray({0, 3}));
    EXPECT_EQ(decoded.count(), 0);
    EXPECT_EQ(decoded.dtype(), DType::Int8);
}

TEST_F(IOTest, BadMagicIsRejected) {
    std::stringstream stream;
    io::encode(Iota(context, {2}), stream);
    std::string bytes = stream.str();
    bytes[0] = 'X';
    std::stringstream corrupted(bytes);
    EXPECT_THROW(io::decode(context, corrupted), FileFormatError);
}

TEST_F(IOTest, TruncatedDataIsRejected) {
    std::stringstream stream;
    io::encode(Iota(context, {16}), stream);
    std::string bytes = stream.str();
    std::stringstream truncated(bytes.substr(0, bytes.size() - 4));
    EXPECT_THROW(io::decode(context, truncated), FileFormatError);

    std::stringstream header_only(bytes.substr(0, 8));
    EXPECT_THROW(io::decode(context, header_only), FileFormatError);
}

TEST_F(IOTest, FileFormatErrorIsSerializationError) {
    std::stringstream empty;
    EXPECT_THROW(io::decode(context, empty), SerializationError);
}

TEST_F(IOTest, SaveAndLoadFile) {
    auto t = ops::filled_with_index(context, {2, 2, 2}, DType::Int64, 100);
    io::save(t, path_);
    EXPECT_EQ(io::detect_format(path_), io::FileFormat::Strata);

    auto loaded = io::load(context, path_);
    EXPECT_EQ(loaded.extents(), ShapeArray({2, 2, 2}));
    ExpectTensorEquals<int64_t>(loaded,
                                {100, 101, 102, 103, 104, 105, 106, 107});
}

TEST_F(IOTest, MissingFileRaisesSerializationError) {
    EXPECT_THROW(io::load(context, path_ + ".missing"), SerializationError);
    EXPECT_THROW(io::detect_format(path_ + ".missing"), SerializationError);
}

TEST_F(IOTest, DetectFormatLeavesStreamPosition) {
    std::stringstream stream;
    io::encode(Iota(context, {3}), stream);
    EXPECT_EQ(io::detect_format(stream), io::FileFormat::Strata);
    auto decoded = io::decode(context, stream);
    ExpectTensorEquals<float>(decoded, {0, 1, 2});

    std::stringstream other("not a tensor");
    EXPECT_EQ(io::detect_format(other), io::FileFormat::Unknown);
    std::stringstream short_stream("ab");
    EXPECT_EQ(io::detect_format(short_stream), io::FileFormat::Unknown);
}
