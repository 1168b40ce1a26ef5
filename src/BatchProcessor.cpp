#include "BatchProcessor.hpp"

BatchProcessor::BatchProcessor(const ExtractionPipeline &pipeline, size_t threads)
    : m_pipeline(pipeline), m_pool(threads)
{
}

std::vector<ExtractionOutcome> BatchProcessor::processBatch(const std::vector<InputFile> &files, std::stop_token stopToken)
{
    // 外部取消和内部中止 (内存耗尽) 共用一个 stop_source
    std::stop_source batchStop;
    std::stop_callback forwardStop(stopToken, [&batchStop]()
                                   { batchStop.request_stop(); });

    spdlog::info("[Batch] processing {} files on {} workers", files.size(), m_pool.size());

    auto task = [this](const InputFile &file, std::stop_token token) -> ExtractionOutcome
    {
        if (token.stop_requested())
            return ErrorDescriptor{file.filename, ErrorKind::Cancelled, "request cancelled before processing started"};
        return m_pipeline.process(file.filename, file.bytes, token);
    };

    std::vector<std::future<ExtractionOutcome>> futures;
    futures.reserve(files.size());
    for (const auto &file : files)
        futures.push_back(m_pool.enqueue(task, std::cref(file), batchStop.get_token()));

    std::vector<ExtractionOutcome> outcomes;
    outcomes.reserve(files.size());

    for (size_t i = 0; i < futures.size(); ++i)
    {
        try
        {
            outcomes.push_back(futures[i].get());
        }
        catch (...)
        {
            // 文件级错误已在 pipeline 内部转换，能到这里的只有 bad_alloc 之类的致命错误
            spdlog::error("[Batch] fatal error while processing {}, aborting batch", files[i].filename);
            batchStop.request_stop();
            // 任务引用着 files，返回前必须全部结束
            for (size_t j = i + 1; j < futures.size(); ++j)
                futures[j].wait();
            throw;
        }
    }

    auto failed = std::ranges::count_if(outcomes, [](const ExtractionOutcome &o)
                                          { return std::holds_alternative<ErrorDescriptor>(o); });
    spdlog::info("[Batch] done: {} ok, {} failed", static_cast<std::ptrdiff_t>(outcomes.size()) - failed, failed);
    return outcomes;
}
