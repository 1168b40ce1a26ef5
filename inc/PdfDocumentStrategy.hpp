#ifndef _PDF_DOCUMENT_STRATEGY_HPP_
#define _PDF_DOCUMENT_STRATEGY_HPP_

#include "ConversionStrategy.hpp"

// 进程内 PDF 渲染 (QtPdf)，用于 PDF 兼容的 AI 文件和 PDF 本身
class PdfDocumentStrategy : public ConversionStrategy
{
public:
    explicit PdfDocumentStrategy(int targetSize);

    std::string_view name() const override
    {
        return "pdf-document";
    }

    bool accepts(const SourceFile &file) const override;
    RasterImage convert(const SourceFile &file, const ConversionBudget &budget) const override;

private:
    int m_targetSize;
};

#endif
