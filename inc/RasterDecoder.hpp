#ifndef _RASTER_DECODER_HPP_
#define _RASTER_DECODER_HPP_

#include "PCH.h"
#include "RasterImage.hpp"

// 位图解码：OpenCV 为主，stb_image 兜底 (GIF 等 OpenCV 可能不支持的格式)
class RasterDecoder
{
public:
    /**
     * @brief 解码内存中的位图文件，多帧格式只取第一帧
     * @throw PipelineError(DecodeError) 两个解码器都拒绝时
     */
    static RasterImage decode(const std::vector<std::uint8_t> &bytes);

private:
    static std::optional<RasterImage> decodeWithOpenCV(const std::vector<std::uint8_t> &bytes);
    static std::optional<RasterImage> decodeWithStb(const std::vector<std::uint8_t> &bytes, std::string &reason);
};

#endif
