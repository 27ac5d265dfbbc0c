#include <gtest/gtest.h>

#include "ImageTensor.hpp"

#include <QColor>

#include <limits>

using namespace infu;

TEST(ImageTensorTest, PlanarLayoutAndRange)
{
  QImage img{2, 1, QImage::Format_RGB888};
  img.setPixelColor(0, 0, QColor{255, 0, 0});
  img.setPixelColor(1, 0, QColor{0, 0, 255});

  auto t = to_tensor(img);
  ASSERT_EQ(t.width, 2);
  ASSERT_EQ(t.height, 1);
  ASSERT_EQ(t.data.size(), 6u);

  // R plane, G plane, B plane
  EXPECT_FLOAT_EQ(t.data[0], 1.f);
  EXPECT_FLOAT_EQ(t.data[1], -1.f);
  EXPECT_FLOAT_EQ(t.data[2], -1.f);
  EXPECT_FLOAT_EQ(t.data[3], -1.f);
  EXPECT_FLOAT_EQ(t.data[4], -1.f);
  EXPECT_FLOAT_EQ(t.data[5], 1.f);
}

TEST(ImageTensorTest, ConvertsOtherFormats)
{
  QImage img{3, 2, QImage::Format_ARGB32};
  img.fill(QColor{0, 255, 0});
  auto t = to_tensor(img);
  ASSERT_EQ(t.data.size(), 18u);
  EXPECT_FLOAT_EQ(t.data[6], 1.f);
}

TEST(ImageTensorTest, NullImageIsEmpty)
{
  EXPECT_TRUE(to_tensor(QImage{}).empty());
}

TEST(ImageTensorTest, BlackTensor)
{
  auto t = black_tensor(4, 3);
  ASSERT_EQ(t.data.size(), 36u);
  for (float v : t.data)
    EXPECT_FLOAT_EQ(v, -1.f);

  auto img = to_image(t.data.data(), t.width, t.height);
  EXPECT_EQ(img.pixelColor(2, 1), QColor(0, 0, 0));
}

TEST(ImageTensorTest, OutOfRangeValuesAreClamped)
{
  const float chw[3] = {4.f, -7.f, 1.f};
  auto img = to_image(chw, 1, 1);
  ASSERT_FALSE(img.isNull());
  EXPECT_EQ(img.pixelColor(0, 0), QColor(255, 0, 255));
}

TEST(ImageTensorTest, NonFiniteValuesAreWellDefined)
{
  const float chw[3] = {
      std::numeric_limits<float>::quiet_NaN(), std::numeric_limits<float>::infinity(),
      -std::numeric_limits<float>::infinity()};
  auto img = to_image(chw, 1, 1);
  ASSERT_FALSE(img.isNull());
  EXPECT_EQ(img.pixelColor(0, 0), QColor(0, 255, 0));
}

TEST(ImageTensorTest, RejectsInvalidInput)
{
  EXPECT_TRUE(to_image(nullptr, 4, 4).isNull());
  const float one[3] = {};
  EXPECT_TRUE(to_image(one, 0, 1).isNull());
}
