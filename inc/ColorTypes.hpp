#ifndef _COLOR_TYPES_HPP_
#define _COLOR_TYPES_HPP_

#include "PCH.h"

struct Rgb
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    bool operator==(const Rgb &) const = default;
};

struct ColorCluster
{
    Rgb color;
    size_t pixelCount = 0;
    int id = 0;
    // 行优先扫描时第一个归入该簇的像素下标，用于同计数排序
    size_t firstPixel = 0;
};

#endif
