#ifndef _RASTERIMAGE_HPP_
#define _RASTERIMAGE_HPP_

#include "PCH.h"

/**
 * @brief 解码后的 RGBA8888 像素网格
 *
 * 每个像素固定 4 字节 (R,G,B,A)，行优先，左上角为原点。
 * 只允许移动，不允许隐式复制；需要副本时显式调用 clone()。
 */
class RasterImage
{
public:
    static constexpr int kChannels = 4;

    // 默认构造函数（创建一个空对象）
    RasterImage() = default;

    /**
     * @brief 主构造函数
     * @param width 宽度
     * @param height 高度
     * @param pixels RGBA 像素数据 (会被移动进类内)
     * @throw std::invalid_argument 如果像素数据大小与尺寸不匹配
     */
    RasterImage(int width, int height, std::vector<std::uint8_t> pixels)
        : m_width(width), m_height(height), m_pixels(std::move(pixels))
    {
        if (m_width < 0 || m_height < 0)
        {
            throw std::invalid_argument("RasterImage: negative dimensions");
        }

        size_t expectedSize = static_cast<size_t>(m_width) * m_height * kChannels;
        if (m_pixels.size() != expectedSize)
        {
            throw std::invalid_argument("RasterImage: Pixel data size does not match width * height * 4");
        }
    }

    ~RasterImage() = default;

    RasterImage(const RasterImage &) = delete;
    RasterImage &operator=(const RasterImage &) = delete;

    RasterImage(RasterImage &&other) noexcept
        : m_width(std::exchange(other.m_width, 0)), m_height(std::exchange(other.m_height, 0)), m_pixels(std::move(other.m_pixels))
    {
    }

    RasterImage &operator=(RasterImage &&other) noexcept
    {
        if (this != &other)
        {
            m_width = std::exchange(other.m_width, 0);
            m_height = std::exchange(other.m_height, 0);
            m_pixels = std::move(other.m_pixels);
        }
        return *this;
    }

    // 显式深拷贝，预处理阶段在副本上工作，不修改解码缓冲
    RasterImage clone() const
    {
        return RasterImage(m_width, m_height, m_pixels);
    }

    int width() const
    {
        return m_width;
    }
    int height() const
    {
        return m_height;
    }
    size_t pixelCount() const
    {
        return static_cast<size_t>(m_width) * m_height;
    }

    const std::vector<std::uint8_t> &pixels() const
    {
        return m_pixels;
    }

    const std::uint8_t *data() const
    {
        return m_pixels.data();
    }
    std::uint8_t *data()
    {
        return m_pixels.data();
    }

    bool isEmpty() const
    {
        return m_pixels.empty() || m_width == 0 || m_height == 0;
    }

private:
    int m_width = 0;
    int m_height = 0;
    std::vector<std::uint8_t> m_pixels;
};

#endif
