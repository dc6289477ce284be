#include "test_base.hpp"
#include "core/bitmap_decode_service.hpp"
#include "core/intake_errors.hpp"
#include "core/preview_sizing_engine.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <chrono>
#include <random>

class PreviewSizingEngineTest : public TestBase
{
protected:
    static FileDescriptor pngFile(const std::string &name, int width, int height)
    {
        cv::Mat image(height, width, CV_8UC3, cv::Scalar(0, 0, 0));
        std::vector<uchar> encoded;
        EXPECT_TRUE(cv::imencode(".png", image, encoded));
        return FileDescriptor::fromBytes(name, "image/png", ByteBuffer(encoded.begin(), encoded.end()));
    }
};

TEST_F(PreviewSizingEngineTest, ParsesAspectRatioStrings)
{
    EXPECT_NEAR(PreviewSizingEngine::getNumericAspectRatioFromString("4:3"), 4.0 / 3.0, 1e-9);
    EXPECT_DOUBLE_EQ(PreviewSizingEngine::getNumericAspectRatioFromString("16:9"), 16.0 / 9.0);
    EXPECT_DOUBLE_EQ(PreviewSizingEngine::getNumericAspectRatioFromString("1:1"), 1.0);
    EXPECT_DOUBLE_EQ(PreviewSizingEngine::getNumericAspectRatioFromString("1.5:0.5"), 3.0);
    EXPECT_DOUBLE_EQ(PreviewSizingEngine::getNumericAspectRatioFromString(" 3 : 2 "), 1.5);
}

TEST_F(PreviewSizingEngineTest, RejectsMalformedAspectRatios)
{
    for (const std::string bad : {"", "4", "4:", ":3", "4/3", "a:b", "4:3:2", "-4:3", "4:0", "0:3"})
    {
        EXPECT_THROW(PreviewSizingEngine::getNumericAspectRatioFromString(bad), InvalidFormatError) << bad;
    }
}

TEST_F(PreviewSizingEngineTest, PanelLayouts)
{
    EXPECT_EQ(PreviewSizingEngine::parsePanelLayout("integrated"), PanelLayout::INTEGRATED);
    EXPECT_EQ(PreviewSizingEngine::parsePanelLayout("Compact"), PanelLayout::COMPACT);
    EXPECT_EQ(PreviewSizingEngine::parsePanelLayout("CIRCLE"), PanelLayout::CIRCLE);
    EXPECT_THROW(PreviewSizingEngine::parsePanelLayout("square"), InvalidFormatError);
    EXPECT_THROW(PreviewSizingEngine::parsePanelLayout("c\xC3\xADrcle"), InvalidFormatError);
    EXPECT_EQ(PreviewSizingEngine::panelLayoutName(PanelLayout::CIRCLE), "circle");
}

TEST_F(PreviewSizingEngineTest, CircleLayoutForcesSquareRatio)
{
    PreviewOptions options;
    options.panel_layout = PanelLayout::CIRCLE;
    options.aspect_ratio = 16.0 / 9.0;
    options.max_height = 1000.0;

    EXPECT_DOUBLE_EQ(PreviewSizingEngine::resolveAspectRatio(options, ImageDimensions{400, 100}), 1.0);
    EXPECT_DOUBLE_EQ(PreviewSizingEngine::computeHeight(options, std::nullopt, 300.0), 300.0);
}

TEST_F(PreviewSizingEngineTest, AspectRatioFallbacks)
{
    PreviewOptions options;
    EXPECT_DOUBLE_EQ(PreviewSizingEngine::resolveAspectRatio(options, std::nullopt), 1.0);
    EXPECT_DOUBLE_EQ(PreviewSizingEngine::resolveAspectRatio(options, ImageDimensions{200, 100}), 2.0);

    options.aspect_ratio = 4.0 / 3.0;
    EXPECT_DOUBLE_EQ(PreviewSizingEngine::resolveAspectRatio(options, ImageDimensions{200, 100}), 4.0 / 3.0);
}

TEST_F(PreviewSizingEngineTest, BaseHeightFromWidthAndRatio)
{
    PreviewOptions options;
    options.aspect_ratio = 2.0;
    options.min_height = 0.0;
    options.max_height = 10000.0;
    EXPECT_DOUBLE_EQ(PreviewSizingEngine::computeHeight(options, std::nullopt, 400.0), 200.0);

    options.zoom_factor = 1.5;
    EXPECT_DOUBLE_EQ(PreviewSizingEngine::computeHeight(options, std::nullopt, 400.0), 300.0);
}

TEST_F(PreviewSizingEngineTest, FixedHeightIgnoresWidth)
{
    PreviewOptions options;
    options.fixed_height = 120.0;
    EXPECT_DOUBLE_EQ(PreviewSizingEngine::computeHeight(options, std::nullopt, 50.0), 120.0);
    EXPECT_DOUBLE_EQ(PreviewSizingEngine::computeHeight(options, std::nullopt, 5000.0), 120.0);
}

TEST_F(PreviewSizingEngineTest, ClampsToMinAndMax)
{
    PreviewOptions options; // 44..256
    options.aspect_ratio = 1.0;
    EXPECT_DOUBLE_EQ(PreviewSizingEngine::computeHeight(options, std::nullopt, 10.0), 44.0);
    EXPECT_DOUBLE_EQ(PreviewSizingEngine::computeHeight(options, std::nullopt, 1000.0), 256.0);
    EXPECT_DOUBLE_EQ(PreviewSizingEngine::computeHeight(options, std::nullopt, 0.0), 44.0);
}

TEST_F(PreviewSizingEngineTest, NoUpscaleClampsToNaturalHeight)
{
    PreviewOptions options;
    options.upscale = false;
    options.aspect_ratio = 1.0;

    // Base height 200, natural height 80
    EXPECT_DOUBLE_EQ(PreviewSizingEngine::computeHeight(options, ImageDimensions{80, 80}, 200.0), 80.0);

    options.upscale = true;
    EXPECT_DOUBLE_EQ(PreviewSizingEngine::computeHeight(options, ImageDimensions{80, 80}, 200.0), 200.0);
}

TEST_F(PreviewSizingEngineTest, HeightStaysWithinBoundsAndNeverUpscales)
{
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> width_dist(0.0, 2000.0);
    std::uniform_real_distribution<double> zoom_dist(0.25, 3.0);
    std::uniform_int_distribution<uint32_t> natural_dist(1, 1500);

    for (int i = 0; i < 1000; ++i)
    {
        PreviewOptions options;
        options.upscale = false;
        options.min_height = 44.0;
        options.max_height = 256.0;
        options.zoom_factor = 1.0;
        if (i % 3 == 0)
            options.aspect_ratio = 4.0 / 3.0;
        if (i % 5 == 0)
            options.fixed_height = 150.0;

        ImageDimensions natural{natural_dist(rng), natural_dist(rng)};
        double width = width_dist(rng);
        double height = PreviewSizingEngine::computeHeight(options, natural, width);

        EXPECT_GE(height, options.min_height);
        EXPECT_LE(height, options.max_height);
        // Only the minimum bound may lift a preview above its natural height
        EXPECT_LE(height, std::max<double>(natural.height, options.min_height));

        options.zoom_factor = zoom_dist(rng);
        height = PreviewSizingEngine::computeHeight(options, natural, width);
        EXPECT_GE(height, options.min_height);
        EXPECT_LE(height, options.max_height);
    }
}

TEST_F(PreviewSizingEngineTest, PreviewEligibility)
{
    PreviewOptions options;
    FileDescriptor image = makeFile("a.png", "image/png", 5000);

    EXPECT_FALSE(PreviewSizingEngine::isPreviewDisallowed(image, options));
    EXPECT_TRUE(PreviewSizingEngine::isPreviewDisallowed(makeFile("a.txt", "text/plain", 10), options));

    options.max_file_size = 4096;
    EXPECT_TRUE(PreviewSizingEngine::isPreviewDisallowed(image, options));
    options.max_file_size = 5000;
    EXPECT_FALSE(PreviewSizingEngine::isPreviewDisallowed(image, options));

    options.allow_image_preview = false;
    EXPECT_TRUE(PreviewSizingEngine::isPreviewDisallowed(image, options));
}

TEST_F(PreviewSizingEngineTest, ValidateOptions)
{
    PreviewOptions options;
    EXPECT_NO_THROW(PreviewSizingEngine::validateOptions(options));

    options.min_height = 300.0;
    EXPECT_THROW(PreviewSizingEngine::validateOptions(options), std::invalid_argument);

    options = PreviewOptions();
    options.zoom_factor = 0.0;
    EXPECT_THROW(PreviewSizingEngine::validateOptions(options), std::invalid_argument);

    options = PreviewOptions();
    options.fixed_height = -1.0;
    EXPECT_THROW(PreviewSizingEngine::validateOptions(options), std::invalid_argument);

    EXPECT_THROW(PreviewSizingEngine engine(options), std::invalid_argument);
}

TEST_F(PreviewSizingEngineTest, SessionRecomputesLazily)
{
    PreviewSizingEngine engine;
    engine.setFile(makeFile("a.png", "image/png", 10));
    engine.setNaturalDimensions({400, 200});
    engine.setContainerWidth(300.0);
    engine.setContainerWidth(320.0);
    engine.setContainerWidth(200.0);

    PreviewGeometry geometry = engine.geometry();
    EXPECT_EQ(engine.recomputeCount(), 1u);
    EXPECT_DOUBLE_EQ(geometry.aspect_ratio, 2.0);
    EXPECT_DOUBLE_EQ(geometry.height, 100.0);
    EXPECT_TRUE(geometry.allowed);

    // Unchanged inputs do not trigger work
    engine.setContainerWidth(200.0);
    engine.geometry();
    EXPECT_EQ(engine.recomputeCount(), 1u);

    engine.setContainerWidth(100.0);
    EXPECT_DOUBLE_EQ(engine.geometry().height, 50.0);
    EXPECT_EQ(engine.recomputeCount(), 2u);
}

TEST_F(PreviewSizingEngineTest, OptionChangeTriggersRecompute)
{
    PreviewSizingEngine engine;
    engine.setContainerWidth(100.0);
    EXPECT_DOUBLE_EQ(engine.geometry().height, 100.0);

    PreviewOptions options = engine.options();
    options.panel_layout = PanelLayout::CIRCLE;
    options.zoom_factor = 2.0;
    engine.setOptions(options);
    EXPECT_DOUBLE_EQ(engine.geometry().height, 200.0);

    engine.setOptions(options);
    engine.geometry();
    EXPECT_EQ(engine.recomputeCount(), 2u);
}

TEST_F(PreviewSizingEngineTest, NaturalSizeStates)
{
    PreviewSizingEngine engine;
    EXPECT_EQ(engine.naturalSizeState(), NaturalSizeState::NONE);

    engine.setFile(makeFile("notes.txt", "text/plain", 10));
    EXPECT_EQ(engine.naturalSizeState(), NaturalSizeState::NONE);
    EXPECT_FALSE(engine.geometry().allowed);

    engine.setFile(makeFile("a.png", "image/png", 10));
    EXPECT_EQ(engine.naturalSizeState(), NaturalSizeState::PENDING);
    EXPECT_FALSE(engine.waitForNaturalSize(std::chrono::milliseconds(10)));

    engine.setNaturalDimensions({10, 20});
    EXPECT_EQ(engine.naturalSizeState(), NaturalSizeState::KNOWN);
    EXPECT_TRUE(engine.waitForNaturalSize(std::chrono::milliseconds(10)));
    EXPECT_EQ(engine.naturalDimensions()->height, 20u);
}

TEST_F(PreviewSizingEngineTest, ResolvesNaturalSizeThroughDecoder)
{
    BitmapDecodeService decoder;
    PreviewOptions options;
    options.upscale = false;
    PreviewSizingEngine engine(options);
    engine.setContainerWidth(500.0);
    engine.setFile(pngFile("photo.png", 120, 60), &decoder);

    ASSERT_TRUE(engine.waitForNaturalSize(std::chrono::seconds(10)));
    ASSERT_EQ(engine.naturalSizeState(), NaturalSizeState::KNOWN);
    EXPECT_EQ(engine.naturalDimensions()->width, 120u);

    // Width 500 / ratio 2 = 250, clamped to the natural height of 60
    PreviewGeometry geometry = engine.geometry();
    EXPECT_DOUBLE_EQ(geometry.aspect_ratio, 2.0);
    EXPECT_DOUBLE_EQ(geometry.height, 60.0);
}

TEST_F(PreviewSizingEngineTest, NaturalSizeResolvesForImageWhosePreviewIsDisabled)
{
    BitmapDecodeService decoder;
    PreviewOptions disabled;
    disabled.allow_image_preview = false;
    PreviewSizingEngine engine(disabled);
    engine.setContainerWidth(400.0);
    engine.setFile(pngFile("hidden.png", 200, 100), &decoder);
    EXPECT_FALSE(engine.geometry().allowed);

    ASSERT_TRUE(engine.waitForNaturalSize(std::chrono::seconds(10)));
    EXPECT_EQ(engine.naturalSizeState(), NaturalSizeState::KNOWN);

    // Re-enabling the preview uses the natural ratio 200:100
    engine.setOptions(PreviewOptions());
    PreviewGeometry geometry = engine.geometry();
    EXPECT_TRUE(geometry.allowed);
    EXPECT_DOUBLE_EQ(geometry.aspect_ratio, 2.0);
    EXPECT_DOUBLE_EQ(geometry.height, 200.0);
}

TEST_F(PreviewSizingEngineTest, NaturalSizeResolvesWhenSizeLimitIsRaised)
{
    BitmapDecodeService decoder;
    FileDescriptor file = pngFile("big.png", 90, 30);
    PreviewOptions limited;
    limited.max_file_size = file.size() - 1;
    PreviewSizingEngine engine(limited);
    engine.setFile(file, &decoder);
    EXPECT_FALSE(engine.geometry().allowed);

    ASSERT_TRUE(engine.waitForNaturalSize(std::chrono::seconds(10)));
    ASSERT_EQ(engine.naturalSizeState(), NaturalSizeState::KNOWN);
    EXPECT_EQ(engine.naturalDimensions()->width, 90u);

    PreviewOptions raised = limited;
    raised.max_file_size = file.size();
    engine.setOptions(raised);
    EXPECT_TRUE(engine.geometry().allowed);
    EXPECT_DOUBLE_EQ(engine.geometry().aspect_ratio, 3.0);
}

TEST_F(PreviewSizingEngineTest, FailedDecodeLeavesNoNaturalSize)
{
    BitmapDecodeService decoder;
    PreviewSizingEngine engine;
    engine.setFile(FileDescriptor::fromBytes("bad.png", "image/png", ByteBuffer(64, 1)), &decoder);

    ASSERT_TRUE(engine.waitForNaturalSize(std::chrono::seconds(10)));
    EXPECT_EQ(engine.naturalSizeState(), NaturalSizeState::NONE);
    EXPECT_FALSE(engine.naturalDimensions().has_value());
}

TEST_F(PreviewSizingEngineTest, ReplacedFileDiscardsStaleDecode)
{
    BitmapDecodeService decoder;
    PreviewSizingEngine engine;
    engine.setFile(pngFile("first.png", 300, 100), &decoder);
    engine.setFile(makeFile("second.png", "image/png", 10));
    engine.setNaturalDimensions({50, 50});

    // Let the first decode finish; its result must not overwrite the second file's size
    decoder.terminate();
    EXPECT_EQ(engine.naturalSizeState(), NaturalSizeState::KNOWN);
    EXPECT_EQ(engine.naturalDimensions()->width, 50u);
}

TEST_F(PreviewSizingEngineTest, TerminatedDecoderLeavesNoNaturalSize)
{
    BitmapDecodeService decoder;
    decoder.terminate();

    PreviewSizingEngine engine;
    engine.setFile(pngFile("late.png", 10, 10), &decoder);
    EXPECT_EQ(engine.naturalSizeState(), NaturalSizeState::NONE);
}

TEST_F(PreviewSizingEngineTest, EngineMayBeDestroyedBeforeDecodeCompletes)
{
    BitmapDecodeService decoder;
    {
        PreviewSizingEngine engine;
        engine.setFile(pngFile("gone.png", 64, 64), &decoder);
    }
    decoder.terminate();
    SUCCEED();
}
