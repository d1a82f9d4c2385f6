#include <griddet/core/error.hpp>
#include <griddet/core/grid_layout.hpp>
#include <griddet/core/image_size.hpp>
#include <griddet/vision/box_resolver.hpp>
#include <griddet/vision/layout_decoder.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <vector>

namespace gv = griddet::vision;
namespace gc = griddet::core;

namespace {

std::size_t geometry_index(const gc::GridLayout& l, std::size_t row, std::size_t col,
                           std::size_t box, std::size_t component) {
  return l.geometry_offset() +
         ((row * l.grid_size + col) * l.boxes_per_cell + box) * 4 + component;
}

}  // namespace

TEST(BoxResolver, ColumnOffsetsXAndRowOffsetsY) {
  // Off-diagonal cell so that swapping row and col changes the result.
  const gc::GridLayout layout{3, 1, 1};
  std::vector<float> raw(layout.total_size(), 0.f);
  raw[geometry_index(layout, 0, 2, 0, gv::kCx)] = 0.5f;
  raw[geometry_index(layout, 0, 2, 0, gv::kCy)] = 0.5f;
  raw[geometry_index(layout, 0, 2, 0, gv::kW)] = 0.5f;
  raw[geometry_index(layout, 0, 2, 0, gv::kH)] = 0.5f;

  auto decoded = gv::decode_layout(raw, layout);
  ASSERT_TRUE(decoded.has_value());
  auto boxes = gv::resolve_boxes(decoded->geometry, gc::ImageSize{300, 600});
  ASSERT_TRUE(boxes.has_value());

  const gc::BBox& b = boxes->at(0, 2, 0);
  EXPECT_NEAR(b.cx, 250.f, 1e-3f);  // (0.5 + col 2) / 3 * 300
  EXPECT_NEAR(b.cy, 100.f, 1e-3f);  // (0.5 + row 0) / 3 * 600
  EXPECT_NEAR(b.w, 75.f, 1e-3f);    // 0.5^2 * 300
  EXPECT_NEAR(b.h, 150.f, 1e-3f);   // 0.5^2 * 600
}

TEST(BoxResolver, ZeroRawGeometryLandsOnCellCorner) {
  const gc::GridLayout layout{4, 1, 2};
  std::vector<float> raw(layout.total_size(), 0.f);
  auto decoded = gv::decode_layout(raw, layout);
  ASSERT_TRUE(decoded.has_value());
  auto boxes = gv::resolve_boxes(decoded->geometry, gc::ImageSize{400, 200});
  ASSERT_TRUE(boxes.has_value());
  EXPECT_EQ(boxes->grid_size(), 4u);
  EXPECT_EQ(boxes->boxes_per_cell(), 2u);
  EXPECT_FLOAT_EQ(boxes->at(3, 1, 1).cx, 100.f);
  EXPECT_FLOAT_EQ(boxes->at(3, 1, 1).cy, 150.f);
  EXPECT_EQ(boxes->at(3, 1, 1).w, 0.f);
}

TEST(BoxResolver, SizesAreSquaredNotRooted) {
  const gc::GridLayout layout{1, 1, 1};
  std::vector<float> raw(layout.total_size(), 0.f);
  raw[geometry_index(layout, 0, 0, 0, gv::kW)] = 0.25f;
  raw[geometry_index(layout, 0, 0, 0, gv::kH)] = 0.75f;
  auto decoded = gv::decode_layout(raw, layout);
  ASSERT_TRUE(decoded.has_value());
  auto boxes = gv::resolve_boxes(decoded->geometry, gc::ImageSize{64, 64});
  ASSERT_TRUE(boxes.has_value());
  EXPECT_FLOAT_EQ(boxes->at(0, 0, 0).w, 4.f);
  EXPECT_FLOAT_EQ(boxes->at(0, 0, 0).h, 36.f);
}

TEST(BoxResolver, RejectsNonPositiveImageSize) {
  const gc::GridLayout layout{1, 1, 1};
  std::vector<float> raw(layout.total_size(), 0.f);
  auto decoded = gv::decode_layout(raw, layout);
  ASSERT_TRUE(decoded.has_value());

  for (const gc::ImageSize size : {gc::ImageSize{0, 10}, gc::ImageSize{10, 0},
                                   gc::ImageSize{-5, 10}, gc::ImageSize{10, -1}}) {
    auto boxes = gv::resolve_boxes(decoded->geometry, size);
    ASSERT_FALSE(boxes.has_value());
    EXPECT_EQ(boxes.error(), gc::DetectError::InvalidImageSize);
  }
}

TEST(BoxResolver, InputBufferIsNotModified) {
  const gc::GridLayout layout{2, 3, 2};
  std::vector<float> raw(layout.total_size());
  for (std::size_t i = 0; i < raw.size(); ++i) raw[i] = 0.01f * static_cast<float>(i);
  const std::vector<float> before = raw;

  auto decoded = gv::decode_layout(raw, layout);
  ASSERT_TRUE(decoded.has_value());
  auto boxes = gv::resolve_boxes(decoded->geometry, gc::ImageSize{640, 480});
  ASSERT_TRUE(boxes.has_value());
  (void)gv::fuse_scores(decoded->class_probs, decoded->confidences);

  EXPECT_EQ(raw, before);
}

TEST(ScoreFusion, FullOuterProductPerCell) {
  const gc::GridLayout layout{2, 3, 2};
  std::vector<float> raw(layout.total_size(), 0.f);
  for (std::size_t cell = 0; cell < 4; ++cell) {
    for (std::size_t c = 0; c < 3; ++c) {
      raw[cell * 3 + c] = 0.1f * static_cast<float>(c + 1);
    }
    for (std::size_t b = 0; b < 2; ++b) {
      raw[layout.confidence_offset() + cell * 2 + b] =
          0.5f + 0.25f * static_cast<float>(b) + 0.01f * static_cast<float>(cell);
    }
  }
  auto decoded = gv::decode_layout(raw, layout);
  ASSERT_TRUE(decoded.has_value());

  const gv::ScoreTensor scores =
      gv::fuse_scores(decoded->class_probs, decoded->confidences);
  EXPECT_EQ(scores.grid_size(), 2u);
  EXPECT_EQ(scores.boxes_per_cell(), 2u);
  EXPECT_EQ(scores.num_classes(), 3u);
  EXPECT_EQ(scores.data().size(), 24u);

  for (std::size_t row = 0; row < 2; ++row) {
    for (std::size_t col = 0; col < 2; ++col) {
      for (std::size_t b = 0; b < 2; ++b) {
        for (std::size_t c = 0; c < 3; ++c) {
          EXPECT_FLOAT_EQ(scores(row, col, b, c),
                          decoded->class_probs(row, col, c) *
                              decoded->confidences(row, col, b));
        }
      }
    }
  }
}
