#ifndef _EXTRACTION_PIPELINE_HPP_
#define _EXTRACTION_PIPELINE_HPP_

#include "ColorExtractor.hpp"
#include "ExtractionResult.hpp"
#include "ExtractorOptions.hpp"
#include "PCH.h"
#include "Preprocessor.hpp"
#include "RasterizerChain.hpp"
#include "ResultAssembler.hpp"

/**
 * @class ExtractionPipeline
 * @brief 单个文件的完整流程: 分类 -> 栅格化 -> 预处理 -> 聚类 -> 组装
 *
 * 构造后只读，同一个实例可以被多个工作线程同时调用；
 * 每次调用的中间图像只属于该次调用。
 */
class ExtractionPipeline
{
public:
    explicit ExtractionPipeline(const ExtractorOptions &options);
    ExtractionPipeline(const ExtractorOptions &options, std::vector<std::unique_ptr<ConversionStrategy>> strategies);

    /**
     * @brief 处理一个文件，文件级错误全部转为 ErrorDescriptor
     * @throw std::bad_alloc 内存耗尽时向上传播，由调用方终止整个批次
     */
    ExtractionOutcome process(const std::string &filename,
                              const std::vector<std::uint8_t> &bytes,
                              std::stop_token stopToken = {}) const;

    // 与 process 相同，但错误以 PipelineError 抛出
    ExtractionResult run(const std::string &filename,
                         const std::vector<std::uint8_t> &bytes,
                         std::stop_token stopToken = {}) const;

    const ExtractorOptions &options() const
    {
        return m_options;
    }

private:
    ExtractorOptions m_options;
    RasterizerChain m_rasterizer;
    Preprocessor m_preprocessor;
    ColorExtractor m_extractor;
    ResultAssembler m_assembler;
};

#endif
