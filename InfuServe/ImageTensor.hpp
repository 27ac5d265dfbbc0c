#pragma once

#include <QImage>

#include <vector>

namespace infu
{

// Planar (CHW) RGB image with values in [-1, 1], the layout the pipeline
// plugin consumes and produces.
struct ImageTensor
{
  int width{0};
  int height{0};
  std::vector<float> data;

  bool empty() const noexcept { return data.empty(); }
};

ImageTensor to_tensor(const QImage& image);
ImageTensor black_tensor(int width, int height);
QImage to_image(const float* chw, int width, int height);

}
