#ifndef _CONVERSION_STRATEGY_HPP_
#define _CONVERSION_STRATEGY_HPP_

#include "PCH.h"
#include "RasterImage.hpp"
#include "SourceFile.hpp"

// 单次转换尝试的资源预算
struct ConversionBudget
{
    std::chrono::milliseconds timeout{30000};
    std::stop_token stopToken;
};

/**
 * @brief 矢量/印刷格式 (AI / EPS / PDF) 的栅格化策略接口
 *
 * 转换链按顺序尝试各个策略，单个策略失败不影响后续策略。
 * 中间产物 (临时文件等) 必须在 convert() 返回前释放，无论成功与否。
 */
class ConversionStrategy
{
public:
    virtual ~ConversionStrategy() = default;

    virtual std::string_view name() const = 0;

    // 内容不适用时返回 false，转换链直接跳过，不算作失败
    virtual bool accepts(const SourceFile &file) const = 0;

    /**
     * @throw PipelineError 失败时抛出；Timeout 表示超出预算，Cancelled 表示请求被取消
     */
    virtual RasterImage convert(const SourceFile &file, const ConversionBudget &budget) const = 0;
};

#endif
