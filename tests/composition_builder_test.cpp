#include <gtest/gtest.h>
#include "core/composition_builder.h"
#include "core/cutout_error.h"

namespace {

cv::Mat cutout(const cv::Size &size)
{
    return cv::Mat(size, CV_8UC4, cv::Scalar(0, 0, 255, 255));
}

} // namespace

TEST(CompositionBuilderTest, SubjectCompositionHasOneFittedLayer)
{
    CompositionBuilder builder;
    cv::Mat background(50, 50, CV_8UC3, cv::Scalar(0, 255, 0));

    Composition composition = builder.createSubjectComposition(QStringLiteral("Portrait"),
                                                               cutout(cv::Size(400, 1000)),
                                                               background, cv::Size(1000, 1000));

    ASSERT_EQ(composition.count(), 1);
    const Layer &layer = composition.layers().first();
    EXPECT_EQ(layer.kind, LayerKind::Subject);
    EXPECT_EQ(layer.order, 0);
    EXPECT_EQ(layer.name, QStringLiteral("Portrait"));
    EXPECT_NEAR(layer.transform.scale, 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(layer.transform.offsetX, 0.0);
    EXPECT_TRUE(composition.hasBackground());
    EXPECT_EQ(composition.canvasSize(), cv::Size(1000, 1000));
}

TEST(CompositionBuilderTest, SubjectCompositionValidatesInput)
{
    CompositionBuilder builder;

    try {
        builder.createSubjectComposition(QStringLiteral("A"), cutout(cv::Size(10, 10)), cv::Mat(), cv::Size(0, 10));
        FAIL() << "expected CutoutError";
    } catch (const CutoutError &e) {
        EXPECT_EQ(e.kind(), CutoutError::Kind::InvalidGeometry);
    }

    try {
        builder.createSubjectComposition(QStringLiteral("B"), cv::Mat(), cv::Mat(), cv::Size(10, 10));
        FAIL() << "expected CutoutError";
    } catch (const CutoutError &e) {
        EXPECT_EQ(e.kind(), CutoutError::Kind::InvalidInput);
    }
}

TEST(CompositionBuilderTest, OneCompositionPerUsableSubject)
{
    CompositionBuilder builder;
    const QList<cv::Mat> cutouts{cutout(cv::Size(20, 40)), cv::Mat(), cutout(cv::Size(30, 30))};

    QList<Composition> compositions = builder.createCompositionsForSubjects(cutouts, cv::Mat(), cv::Size(200, 200));

    ASSERT_EQ(compositions.size(), 2);
    EXPECT_EQ(compositions.at(0).name(), QStringLiteral("Subject 1"));
    EXPECT_EQ(compositions.at(1).name(), QStringLiteral("Subject 2"));
    EXPECT_EQ(compositions.at(1).layers().first().pixels.size(), cv::Size(30, 30));
}

TEST(CompositionBuilderTest, NoUsableSubjectIsReported)
{
    CompositionBuilder builder;
    const QList<cv::Mat> cutouts{cv::Mat(), cv::Mat()};

    try {
        builder.createCompositionsForSubjects(cutouts, cv::Mat(), cv::Size(200, 200));
        FAIL() << "expected CutoutError";
    } catch (const CutoutError &e) {
        EXPECT_EQ(e.kind(), CutoutError::Kind::NoSubjectDetected);
    }
}

TEST(CompositionBuilderTest, RescaleOnlyTouchesSubjectsPastThreshold)
{
    CompositionBuilder builder;
    Composition composition = builder.createSubjectComposition(QStringLiteral("Subject 1"),
                                                               cutout(cv::Size(100, 100)),
                                                               cv::Mat(), cv::Size(400, 400));
    Layer text;
    text.kind = LayerKind::Text;
    text.pixels = cutout(cv::Size(100, 100));
    const QUuid textId = composition.append(text);

    const QUuid subjectId = composition.layers().first().id;
    ASSERT_DOUBLE_EQ(composition.layer(subjectId)->transform.scale, 1.0);

    // 0.5 * 194 / 100 = 0.97 is within the threshold of 1.0
    EXPECT_EQ(builder.rescaleSubjectLayers(composition, cv::Size(194, 194)), 0);
    EXPECT_DOUBLE_EQ(composition.layer(subjectId)->transform.scale, 1.0);

    EXPECT_EQ(builder.rescaleSubjectLayers(composition, cv::Size(100, 100)), 1);
    EXPECT_NEAR(composition.layer(subjectId)->transform.scale, 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(composition.layer(textId)->transform.scale, 1.0);

    EXPECT_THROW(builder.rescaleSubjectLayers(composition, cv::Size(-1, 100)), CutoutError);
}

TEST(CompositionBuilderTest, ExportSkipsCompositionsThatFailToRender)
{
    CompositionBuilder builder;
    Composition good = builder.createSubjectComposition(QStringLiteral("Good"), cutout(cv::Size(10, 10)),
                                                        cv::Mat(), cv::Size(32, 32));
    Composition bad = good;
    bad.setCanvasSize(cv::Size(0, 0));

    const QList<cv::Mat> rendered = builder.exportCompositions({good, bad, good});

    ASSERT_EQ(rendered.size(), 2);
    EXPECT_EQ(rendered.at(0).size(), cv::Size(32, 32));
    EXPECT_EQ(rendered.at(0).type(), CV_8UC4);
}
