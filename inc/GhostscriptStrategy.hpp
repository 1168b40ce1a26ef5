#ifndef _GHOSTSCRIPT_STRATEGY_HPP_
#define _GHOSTSCRIPT_STRATEGY_HPP_

#include "ConversionStrategy.hpp"

// 调用外部 Ghostscript 进程，把 PostScript / EPS / PDF 第一页渲染为带 alpha 的 PNG
class GhostscriptStrategy : public ConversionStrategy
{
public:
    GhostscriptStrategy(std::string executable, int dpi);

    std::string_view name() const override
    {
        return "ghostscript";
    }

    bool accepts(const SourceFile &file) const override;
    RasterImage convert(const SourceFile &file, const ConversionBudget &budget) const override;

    // 组装 gs 命令行参数 (不含可执行文件本身)
    std::vector<std::string> buildArguments(const std::string &inputPath, const std::string &outputPath) const;

private:
    std::string m_executable;
    int m_dpi;
};

#endif
