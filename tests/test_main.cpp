#include "PCH.h"

#include <QGuiApplication>
#include <gtest/gtest.h>

int main(int argc, char **argv)
{
    // SVG / PDF 渲染需要 QGuiApplication，测试环境没有显示器
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
        qputenv("QT_QPA_PLATFORM", "offscreen");

    QGuiApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);

    spdlog::set_level(spdlog::level::off);
    return RUN_ALL_TESTS();
}
