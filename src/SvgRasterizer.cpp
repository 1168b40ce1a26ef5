#include "SvgRasterizer.hpp"
#include "ImageOps.hpp"
#include "PipelineError.hpp"

#include <QByteArray>
#include <QImage>
#include <QPainter>
#include <QtSvg/QSvgRenderer>

RasterImage SvgRasterizer::render(const std::vector<std::uint8_t> &svgBytes, int targetSize)
{
    QByteArray content(reinterpret_cast<const char *>(svgBytes.data()), static_cast<qsizetype>(svgBytes.size()));

    QSvgRenderer renderer(content);
    if (!renderer.isValid())
        throw PipelineError(ErrorKind::DecodeError, "SVG document could not be parsed");

    // 优先 viewBox，其次 width/height；都没有时画成正方形
    QSizeF natural = renderer.viewBoxF().size();
    if (natural.isEmpty())
        natural = QSizeF(renderer.defaultSize());
    if (natural.isEmpty())
        natural = QSizeF(targetSize, targetSize);

    const double scale = targetSize / std::max(natural.width(), natural.height());
    const int w = std::max(1, qRound(natural.width() * scale));
    const int h = std::max(1, qRound(natural.height() * scale));

    QImage canvas(w, h, QImage::Format_ARGB32_Premultiplied);
    if (canvas.isNull())
        throw PipelineError(ErrorKind::DecodeError, std::format("cannot allocate {}x{} SVG canvas", w, h));
    canvas.fill(Qt::transparent);

    {
        QPainter painter(&canvas);
        painter.setRenderHint(QPainter::Antialiasing, true);
        painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
        renderer.render(&painter, QRectF(0, 0, w, h));
    }

    spdlog::debug("[SvgRasterizer] Rendered SVG at {}x{}", w, h);
    return ImageOps::fromQImage(canvas);
}
