#include "ImageTensor.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace infu
{

ImageTensor to_tensor(const QImage& image)
{
  ImageTensor res;
  if (image.isNull())
    return res;

  const QImage src = image.convertToFormat(QImage::Format_RGB888);
  const int image_height = src.height();
  const int image_width = src.width();
  res.width = image_width;
  res.height = image_height;
  res.data.resize(3 * image_height * image_width);

  auto host_tensor = res.data.data();
  for (int h = 0; h < image_height; ++h)
  {
    const uint8_t* line = src.constScanLine(h);
    for (int w = 0; w < image_width; ++w)
    {
      auto src_pixel = line + w * 3;
      // Store in CHW order
      host_tensor[0 * image_height * image_width + h * image_width + w]
          = src_pixel[0] / 127.5f - 1.f;
      host_tensor[1 * image_height * image_width + h * image_width + w]
          = src_pixel[1] / 127.5f - 1.f;
      host_tensor[2 * image_height * image_width + h * image_width + w]
          = src_pixel[2] / 127.5f - 1.f;
    }
  }
  return res;
}

ImageTensor black_tensor(int width, int height)
{
  ImageTensor res;
  res.width = width;
  res.height = height;
  res.data.assign(3 * width * height, -1.f);
  return res;
}

QImage to_image(const float* chw, int image_width, int image_height)
{
  if (!chw || image_width <= 0 || image_height <= 0)
    return {};

  QImage res{image_width, image_height, QImage::Format_RGB888};
  if (res.isNull())
    return res;

  // NaN maps to 0
  auto to_u8 = [](float v) {
    if (std::isnan(v))
      return uint8_t{0};
    return static_cast<uint8_t>((std::clamp(v, -1.f, 1.f) + 1.f) * 127.5f);
  };

  // NCHW -> NHWC for the final image
  for (int h = 0; h < image_height; ++h)
  {
    uint8_t* line = res.scanLine(h);
    for (int w = 0; w < image_width; ++w)
    {
      auto dst_pixel = line + w * 3;
      dst_pixel[0] = to_u8(chw[0 * image_height * image_width + h * image_width + w]);
      dst_pixel[1] = to_u8(chw[1 * image_height * image_width + h * image_width + w]);
      dst_pixel[2] = to_u8(chw[2 * image_height * image_width + h * image_width + w]);
    }
  }
  return res;
}

}
