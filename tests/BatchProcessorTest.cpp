#include "BatchProcessor.hpp"
#include "TestImages.hpp"

#include <gtest/gtest.h>

namespace
{
InputFile pngFile(const std::string &name, Rgb color)
{
    return InputFile{name, TestImages::encode(TestImages::solid(8, 8, color), ".png")};
}

InputFile epsFile(const std::string &name)
{
    return InputFile{name, TestImages::bytesOf("%!PS-Adobe-3.0 EPSF-3.0\n")};
}

// 先睡一会再出图，用来制造乱序完成
FakeStrategy::Behavior slowProduce(Rgb color, std::chrono::milliseconds delay)
{
    return [color, delay](const SourceFile &, const ConversionBudget &)
    {
        std::this_thread::sleep_for(delay);
        return TestImages::solid(8, 8, color);
    };
}

// 一直阻塞到请求被取消
FakeStrategy::Behavior blockUntilCancelled(std::atomic<int> &started)
{
    return [&started](const SourceFile &, const ConversionBudget &budget) -> RasterImage
    {
        ++started;
        auto giveUp = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!budget.stopToken.stop_requested() && std::chrono::steady_clock::now() < giveUp)
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        throw PipelineError(ErrorKind::Cancelled, "conversion cancelled");
    };
}

std::vector<std::unique_ptr<ConversionStrategy>> single(FakeStrategy::Behavior behavior)
{
    std::vector<std::unique_ptr<ConversionStrategy>> strategies;
    strategies.push_back(std::make_unique<FakeStrategy>("fake", std::move(behavior)));
    return strategies;
}

bool isCancelled(const ExtractionOutcome &outcome)
{
    const auto *error = std::get_if<ErrorDescriptor>(&outcome);
    return error && error->kind == ErrorKind::Cancelled;
}
} // namespace

TEST(BatchProcessorTest, ResultsFollowRequestOrder)
{
    ExtractionPipeline pipeline(ExtractorOptions{}, single(slowProduce({200, 40, 40}, std::chrono::milliseconds(150))));
    BatchProcessor batch(pipeline, 3);

    std::vector<InputFile> files = {
        epsFile("slow.eps"),
        pngFile("quick.png", {40, 40, 200}),
        InputFile{"notes.txt", TestImages::bytesOf("plain text")},
    };
    auto outcomes = batch.processBatch(files);

    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_EQ(outcomeFilename(outcomes[0]), "slow.eps");
    EXPECT_EQ(outcomeFilename(outcomes[1]), "quick.png");
    EXPECT_EQ(outcomeFilename(outcomes[2]), "notes.txt");

    ASSERT_TRUE(std::holds_alternative<ExtractionResult>(outcomes[0]));
    EXPECT_EQ(std::get<ExtractionResult>(outcomes[0]).colors, (std::vector<std::string>{"#C82828"}));
    ASSERT_TRUE(std::holds_alternative<ExtractionResult>(outcomes[1]));
    EXPECT_EQ(std::get<ExtractionResult>(outcomes[1]).colors, (std::vector<std::string>{"#2828C8"}));
}

TEST(BatchProcessorTest, OneBadFileDoesNotStopSiblings)
{
    ExtractionPipeline pipeline{ExtractorOptions{}};
    BatchProcessor batch(pipeline, 2);

    auto truncated = TestImages::encode(TestImages::solid(16, 16, {1, 2, 3}), ".png");
    truncated.resize(10);

    std::vector<InputFile> files = {
        pngFile("a.png", {0, 0, 0}),
        InputFile{"broken.png", truncated},
        pngFile("c.png", {255, 255, 255}),
    };
    auto outcomes = batch.processBatch(files);

    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_EQ(std::get<ExtractionResult>(outcomes[0]).colors, (std::vector<std::string>{"black"}));
    ASSERT_TRUE(std::holds_alternative<ErrorDescriptor>(outcomes[1]));
    EXPECT_EQ(std::get<ErrorDescriptor>(outcomes[1]).kind, ErrorKind::DecodeError);
    EXPECT_EQ(std::get<ExtractionResult>(outcomes[2]).colors, (std::vector<std::string>{"white"}));
}

TEST(BatchProcessorTest, CancellationKeepsCompletedResults)
{
    std::atomic<int> started{0};
    ExtractionPipeline pipeline(ExtractorOptions{}, single(blockUntilCancelled(started)));
    BatchProcessor batch(pipeline, 2);

    std::vector<InputFile> files = {
        pngFile("done.png", {90, 30, 150}),
        epsFile("stuck1.eps"),
        epsFile("stuck2.eps"),
        pngFile("queued.png", {10, 10, 10}),
    };

    std::stop_source cancel;
    auto running = std::async(std::launch::async, [&]()
                              { return batch.processBatch(files, cancel.get_token()); });

    // 两个工作线程都卡在转换里之后再取消，此时 queued.png 还没开始
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (started.load() < 2 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ASSERT_EQ(started.load(), 2);
    cancel.request_stop();

    auto outcomes = running.get();
    ASSERT_EQ(outcomes.size(), 4u);
    ASSERT_TRUE(std::holds_alternative<ExtractionResult>(outcomes[0]));
    EXPECT_EQ(std::get<ExtractionResult>(outcomes[0]).colors, (std::vector<std::string>{"#5A1E96"}));
    EXPECT_TRUE(isCancelled(outcomes[1]));
    EXPECT_TRUE(isCancelled(outcomes[2]));
    EXPECT_TRUE(isCancelled(outcomes[3]));
    EXPECT_EQ(outcomeFilename(outcomes[3]), "queued.png");
}

TEST(BatchProcessorTest, PoolHasAtLeastTwoWorkers)
{
    EXPECT_EQ(SimpleThreadPool::resolveThreadCount(1), 2u);
    EXPECT_GE(SimpleThreadPool::resolveThreadCount(0), 2u);
    EXPECT_EQ(SimpleThreadPool::resolveThreadCount(6), 6u);

    ExtractionPipeline pipeline{ExtractorOptions{}};
    BatchProcessor batch(pipeline, 1);
    EXPECT_EQ(batch.workerCount(), 2u);
}

TEST(BatchProcessorTest, EmptyBatch)
{
    ExtractionPipeline pipeline{ExtractorOptions{}};
    BatchProcessor batch(pipeline, 2);
    EXPECT_TRUE(batch.processBatch({}).empty());
}
