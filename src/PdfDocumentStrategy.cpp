#include "PdfDocumentStrategy.hpp"
#include "FormatClassifier.hpp"
#include "ImageOps.hpp"
#include "PipelineError.hpp"

#include <QFile>
#include <QImage>
#include <QTemporaryDir>
#include <QtPdf/QPdfDocument>

namespace
{
std::string_view describe(QPdfDocument::Error error)
{
    switch (error)
    {
    case QPdfDocument::Error::None:
        return "none";
    case QPdfDocument::Error::FileNotFound:
        return "file not found";
    case QPdfDocument::Error::InvalidFileFormat:
        return "invalid file format";
    case QPdfDocument::Error::IncorrectPassword:
        return "document is password protected";
    case QPdfDocument::Error::UnsupportedSecurityScheme:
        return "unsupported security scheme";
    case QPdfDocument::Error::DataNotYetAvailable:
        return "data not yet available";
    default:
        break;
    }
    return "unknown error";
}
} // namespace

PdfDocumentStrategy::PdfDocumentStrategy(int targetSize)
    : m_targetSize(targetSize)
{
}

bool PdfDocumentStrategy::accepts(const SourceFile &file) const
{
    return FormatClassifier::isPdf(file.bytes());
}

RasterImage PdfDocumentStrategy::convert(const SourceFile &file, const ConversionBudget &budget) const
{
    if (budget.stopToken.stop_requested())
        throw PipelineError(ErrorKind::Cancelled, "conversion cancelled");

    // 同步加载接口只接受文件路径，先落到本次尝试独占的临时目录
    QTemporaryDir workDir;
    if (!workDir.isValid())
        throw PipelineError(ErrorKind::ConversionFailed, std::format("cannot create temp dir: {}", workDir.errorString().toStdString()));

    const QString inputPath = workDir.filePath("input.pdf");
    {
        QFile staged(inputPath);
        if (!staged.open(QIODevice::WriteOnly) ||
            staged.write(reinterpret_cast<const char *>(file.bytes().data()), static_cast<qint64>(file.bytes().size())) != static_cast<qint64>(file.bytes().size()))
        {
            throw PipelineError(ErrorKind::ConversionFailed, std::format("cannot stage input: {}", staged.errorString().toStdString()));
        }
    }

    QPdfDocument document;
    QPdfDocument::Error error = document.load(inputPath);
    if (error != QPdfDocument::Error::None)
        throw PipelineError(ErrorKind::ConversionFailed, std::format("cannot open PDF: {}", describe(error)));
    if (document.pageCount() < 1)
        throw PipelineError(ErrorKind::ConversionFailed, "PDF has no pages");

    QSizeF pagePoints = document.pagePointSize(0);
    if (pagePoints.isEmpty())
        throw PipelineError(ErrorKind::ConversionFailed, "first PDF page has no size");

    const double scale = m_targetSize / std::max(pagePoints.width(), pagePoints.height());
    const QSize renderSize(std::max(1, qRound(pagePoints.width() * scale)), std::max(1, qRound(pagePoints.height() * scale)));

    QImage page = document.render(0, renderSize);
    document.close();
    if (page.isNull())
        throw PipelineError(ErrorKind::ConversionFailed, "PDF page rendering failed");

    spdlog::debug("[PdfDocument] Rendered {} at {}x{}", file.filename(), renderSize.width(), renderSize.height());
    return ImageOps::fromQImage(page);
}
