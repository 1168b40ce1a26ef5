#ifndef _EXTRACTOR_OPTIONS_HPP_
#define _EXTRACTOR_OPTIONS_HPP_

#include "ColorTypes.hpp"
#include "PCH.h"

/**
 * @brief 提取流程的全部可调参数
 *
 * 默认值即推荐值。来源优先级：默认值 < INI 配置文件 < 命令行。
 */
struct ExtractorOptions
{
    // --- 聚类 ---
    int maxClusters = 12;
    int maxIterations = 50;
    // RGB 欧氏距离，小于该值的两个中心会被合并
    double mergeThreshold = 24.0;
    // 占比低于该值的簇视为噪声
    double minClusterFraction = 0.005;
    // 每个通道与 255 / 0 的差都不超过该值时命名为 white / black
    int namedTolerance = 10;
    size_t maxSamples = 200000;

    // --- 预处理 ---
    int analysisMaxDimension = 800;
    bool denoise = true;
    bool colorConstancy = true;
    double maxGrayWorldGain = 1.25;
    double minChannelMean = 8.0;
    Rgb background{255, 255, 255};

    // --- 栅格化 ---
    int vectorTargetSize = 1024;
    int maxRasterDimension = 2000;
    int ghostscriptDpi = 150;
    std::string ghostscriptPath = "gs";
    int conversionTimeoutMs = 30000;

    // --- 输出与调度 ---
    int previewMaxDimension = 256;
    unsigned workerThreads = 0; // 0 表示按 CPU 核数
    size_t maxBatchSize = 100;

    /**
     * @brief 检查参数取值范围
     * @throw std::invalid_argument 任一参数非法
     */
    void validate() const;

    /**
     * @brief 从 INI 文件的 [extractor] 分组覆盖参数，文件中没有的键保持原值
     * @throw std::invalid_argument 文件不可读或格式错误
     */
    void loadFromIni(const std::string &path);
};

/**
 * @brief 解析日志级别名 (trace/debug/info/warn/error/critical/off，以及 spdlog 的简写)
 * @throw std::invalid_argument 名字不认识
 */
spdlog::level::level_enum parseLogLevel(const std::string &name);

#endif
