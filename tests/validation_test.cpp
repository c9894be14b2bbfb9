#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>

#include <batchflow/validation.hpp>

#include "tensor_helpers.hpp"

using namespace batchflow;
using batchflow::test::iota_tensor;

namespace {

// Minimal array type: only provides the shape query.
struct ShapeOnly {
    std::vector<std::size_t> dims;
    const std::vector<std::size_t>& shape() const { return dims; }
};

static_assert(has_shape_v<Tensor>);
static_assert(has_shape_v<ShapeOnly>);
static_assert(!has_shape_v<int>);
static_assert(!has_shape_v<std::vector<float>>);

} // namespace

TEST(CheckDataFormat, ReturnsCommonSequenceCount) {
    NamedTensors data{{"default", iota_tensor({5, 4, 3, 8, 8})}, {"targets", iota_tensor({5, 4, 1})}};
    EXPECT_EQ(check_data_format(data), 4u);
}

TEST(CheckDataFormat, AcceptsAnyTypeWithShape) {
    std::map<std::string, ShapeOnly> data{{"a", {{2, 7, 1}}}, {"b", {{2, 7, 3, 3}}}};
    EXPECT_EQ(check_data_format(data), 7u);
}

TEST(CheckDataFormat, RejectsLessThanThreeDimensions) {
    NamedTensors data{{"default", iota_tensor({5, 4})}};
    EXPECT_THROW(check_data_format(data), IteratorValidationError);
}

TEST(CheckDataFormat, RejectsArraysWithoutShape) {
    NamedTensors data{{"default", Tensor{}}};
    try {
        check_data_format(data);
        FAIL() << "expected IteratorValidationError";
    } catch (const IteratorValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("no shape"), std::string::npos);
    }
}

TEST(CheckDataFormat, RejectsMismatchedSequenceCounts) {
    NamedTensors data{{"default", iota_tensor({5, 4, 3})}, {"targets", iota_tensor({5, 3, 1})}};
    try {
        check_data_format(data);
        FAIL() << "expected IteratorValidationError";
    } catch (const IteratorValidationError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("sequences"), std::string::npos);
        EXPECT_NE(msg.find("targets: 3"), std::string::npos);
    }
}

TEST(CheckDataFormat, RejectsMismatchedTimeSteps) {
    NamedTensors data{{"default", iota_tensor({5, 4, 3})}, {"targets", iota_tensor({6, 4, 1})}};
    try {
        check_data_format(data);
        FAIL() << "expected IteratorValidationError";
    } catch (const IteratorValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("time steps"), std::string::npos);
    }
}

TEST(CheckDataFormat, RejectsEmptyDataset) {
    NamedTensors data;
    EXPECT_THROW(check_data_format(data), IteratorValidationError);
}

TEST(RequireName, ListsAvailableKeys) {
    DataLayout layout{{"default", {Tensor::DType::Float32, {1, 1, 1}}}};
    EXPECT_NO_THROW(require_name(layout, "default"));
    try {
        require_name(layout, "missing");
        FAIL() << "expected IteratorValidationError";
    } catch (const IteratorValidationError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("missing"), std::string::npos);
        EXPECT_NE(msg.find("[default]"), std::string::npos);
    }
}

TEST(RequireImageData, OnlyAcceptsFiveDimensions) {
    DataLayout layout{{"images", {Tensor::DType::Float32, {1, 2, 3, 4, 5}}},
                      {"targets", {Tensor::DType::Float32, {1, 2, 3}}}};
    EXPECT_EQ(require_image_data(layout, "images").shape[4], 5u);
    EXPECT_THROW(require_image_data(layout, "targets"), IteratorValidationError);
}

TEST(RequireSameNames, ComparesKeySets) {
    std::map<std::string, double> a{{"x", 1.0}, {"y", 2.0}};
    std::map<std::string, std::size_t> b{{"x", 1}, {"y", 2}};
    std::map<std::string, double> c{{"x", 1.0}};
    std::map<std::string, double> d{{"x", 1.0}, {"z", 2.0}};
    EXPECT_NO_THROW(require_same_names(a, b, "mismatch"));
    EXPECT_THROW(require_same_names(a, c, "mismatch"), IteratorValidationError);
    EXPECT_THROW(require_same_names(a, d, "mismatch"), IteratorValidationError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
