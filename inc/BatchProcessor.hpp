#ifndef _BATCH_PROCESSOR_HPP_
#define _BATCH_PROCESSOR_HPP_

#include "ExtractionPipeline.hpp"
#include "ExtractionResult.hpp"
#include "PCH.h"
#include "SimpleThreadPool.hpp"

struct InputFile
{
    std::string filename;
    std::vector<std::uint8_t> bytes;
};

/**
 * @class BatchProcessor
 * @brief 在固定大小的线程池上并行处理一批文件
 *
 * 每个文件恰好处理一次，结果按请求顺序返回。
 * stopToken 触发后，排队中的文件不再开始，进行中的文件尽快中止，
 * 两者都以 ErrorKind::Cancelled 报告；已完成的结果保留。
 */
class BatchProcessor
{
public:
    // threads 为 0 时按 CPU 核数，最少 2
    BatchProcessor(const ExtractionPipeline &pipeline, size_t threads);

    /**
     * @throw std::bad_alloc 任一文件内存耗尽时，取消其余文件并向上传播
     */
    std::vector<ExtractionOutcome> processBatch(const std::vector<InputFile> &files, std::stop_token stopToken = {});

    size_t workerCount() const
    {
        return m_pool.size();
    }

private:
    const ExtractionPipeline &m_pipeline;
    SimpleThreadPool m_pool;
};

#endif
