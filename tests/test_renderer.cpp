#include "consolebar/bar/renderer.hpp"
#include "consolebar/common/error_codes.hpp"
#include "recording_terminal.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <limits>

using consolebar::bar::BarConfig;
using consolebar::bar::BarRenderer;
using consolebar::common::ConsoleBarException;
using consolebar::common::ErrorCode;
using consolebar::test_support::RecordingTerminal;

namespace {

BarConfig plainConfig(int bar_length) {
    BarConfig config;
    config.bar_length = bar_length;
    config.text_space = 0;
    config.show_percentage = false;
    config.bar_opening = "[";
    config.bar_closing = "]";
    return config;
}

}

TEST(BarRendererTest, FillMatchesFloorAndSegmentsSumToLength) {
    for (int length : {0, 1, 7, 10, 30, 64}) {
        for (int i = 0; i <= 20; ++i) {
            double progress = i / 20.0;
            std::string buffer = BarRenderer::composeBar(plainConfig(length), progress, std::nullopt);
            
            auto fills = std::count(buffer.begin(), buffer.end(), '#');
            auto empties = std::count(buffer.begin(), buffer.end(), '-');
            
            EXPECT_EQ(fills, static_cast<long>(std::floor(progress * length))) << "length=" << length << " progress=" << progress;
            EXPECT_EQ(fills + empties, length);
        }
    }
}

TEST(BarRendererTest, ThirtyFivePercentOfTen) {
    BarConfig config;
    config.bar_length = 10;
    config.show_percentage = false;
    
    std::string buffer = BarRenderer::composeBar(config, 0.35, std::nullopt);
    
    EXPECT_EQ(buffer, "[ ###------- ] ");
}

TEST(BarRendererTest, ProgressAboveOneClampsToFullBar) {
    std::string buffer = BarRenderer::composeBar(plainConfig(10), 1.7, std::nullopt);
    EXPECT_EQ(buffer, "[##########]");
}

TEST(BarRendererTest, NegativeProgressClampsToEmptyBar) {
    EXPECT_EQ(BarRenderer::computeFill(-0.5, 10), 0);
    EXPECT_EQ(BarRenderer::composeBar(plainConfig(4), -3.0, std::nullopt), "[----]");
}

TEST(BarRendererTest, NonFiniteProgressIsComputationError) {
    for (double progress : {std::numeric_limits<double>::quiet_NaN(),
                            std::numeric_limits<double>::infinity(),
                            -std::numeric_limits<double>::infinity()}) {
        try {
            BarRenderer::computeFill(progress, 10);
            FAIL() << "expected COMPUTATION_ERROR for " << progress;
        } catch (const ConsoleBarException& e) {
            EXPECT_EQ(e.code(), ErrorCode::COMPUTATION_ERROR);
        }
    }
}

TEST(BarRendererTest, ShortTextIsPaddedToTextSpace) {
    BarConfig config = plainConfig(4);
    config.text_space = 12;
    
    std::string buffer = BarRenderer::composeBar(config, 0.5, std::string("Copying"));
    
    EXPECT_EQ(buffer.find(config.bar_opening), 12u);
    EXPECT_EQ(buffer, "Copying     [##--]");
}

TEST(BarRendererTest, LongTextIsNotTruncated) {
    BarConfig config = plainConfig(2);
    config.text_space = 3;
    
    EXPECT_EQ(BarRenderer::composeBar(config, 1.0, std::string("Extracting")), "Extracting[##]");
}

TEST(BarRendererTest, AbsentTextSkipsPadding) {
    BarConfig config = plainConfig(3);
    config.text_space = 40;
    
    std::string buffer = BarRenderer::composeBar(config, 0.0, std::nullopt);
    
    EXPECT_EQ(buffer.rfind(config.bar_opening, 0), 0u);
    EXPECT_EQ(buffer, "[---]");
}

TEST(BarRendererTest, PercentageFollowsClosingAfterOneSpace) {
    BarConfig config;
    config.bar_length = 4;
    
    EXPECT_EQ(BarRenderer::composeBar(config, 0.5, std::nullopt), "[ ##-- ]  50%");
}

TEST(BarRendererTest, NegativeLengthInConfigIsRejected) {
    BarConfig config = plainConfig(-1);
    try {
        BarRenderer::composeBar(config, 0.5, std::nullopt);
        FAIL() << "expected INVALID_ARGUMENT";
    } catch (const ConsoleBarException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_ARGUMENT);
    }
}

TEST(BarRendererTest, ShorterRenderGetsBlankAndBackspacePairs) {
    size_t last_length = 0;
    
    std::string first = BarRenderer::finalize("0123456789", last_length);
    EXPECT_EQ(first, "0123456789");
    EXPECT_EQ(last_length, 10u);
    
    std::string second = BarRenderer::finalize("abcd", last_length);
    EXPECT_EQ(second, "abcd" + std::string(6, ' ') + std::string(6, '\b'));
    EXPECT_EQ(last_length, 4u);
    
    std::string third = BarRenderer::finalize("abcdefg", last_length);
    EXPECT_EQ(third, "abcdefg");
    EXPECT_EQ(last_length, 7u);
}

TEST(BarRendererTest, EmitRestoresCursorAndVisibility) {
    RecordingTerminal terminal;
    terminal.placeCursor(7, 12);
    
    BarRenderer::emit(terminal, 3, "hello");
    
    EXPECT_EQ(terminal.line(3), "hello");
    EXPECT_EQ(terminal.cursor().column, 7);
    EXPECT_EQ(terminal.cursor().row, 12);
    EXPECT_TRUE(terminal.cursorVisible());
    
    using Kind = RecordingTerminal::CallKind;
    auto calls = terminal.calls();
    ASSERT_EQ(calls.size(), 6u);
    EXPECT_EQ(calls[0].kind, Kind::QUERY);
    EXPECT_EQ(calls[1].kind, Kind::VISIBILITY);
    EXPECT_FALSE(calls[1].visible);
    EXPECT_EQ(calls[2].kind, Kind::MOVE);
    EXPECT_EQ(calls[2].column, 0);
    EXPECT_EQ(calls[2].row, 3);
    EXPECT_EQ(calls[3].kind, Kind::WRITE);
    EXPECT_EQ(calls[4].kind, Kind::MOVE);
    EXPECT_EQ(calls[5].kind, Kind::VISIBILITY);
    EXPECT_TRUE(calls[5].visible);
}

TEST(BarRendererTest, EmitShowsCursorAgainWhenWriteFails) {
    RecordingTerminal terminal;
    terminal.placeCursor(3, 8);
    terminal.failWrites(1);
    
    EXPECT_THROW(BarRenderer::emit(terminal, 1, "[##]"), ConsoleBarException);
    
    EXPECT_TRUE(terminal.cursorVisible());
    EXPECT_EQ(terminal.cursor().column, 3);
    EXPECT_EQ(terminal.cursor().row, 8);
    EXPECT_EQ(terminal.line(1), "");
}
