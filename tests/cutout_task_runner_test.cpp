#include <gtest/gtest.h>
#include <QCoreApplication>
#include <QElapsedTimer>
#include "core/cutout_task_runner.h"
#include "test_helpers.h"

using testing_helpers::discMask;

namespace {

bool waitForIdle(const CutoutTaskRunner &runner, int timeoutMs = 10000)
{
    QElapsedTimer timer;
    timer.start();
    while (!runner.isIdle() && timer.elapsed() < timeoutMs) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
    }
    return runner.isIdle();
}

struct Delivered {
    quint64 generation = 0;
    cv::Mat image;
};

} // namespace

TEST(CutoutTaskRunnerTest, RefinementIsDeliveredWithItsGeneration)
{
    CutoutTaskRunner runner;
    QList<Delivered> results;
    QObject::connect(&runner, &CutoutTaskRunner::maskRefined, [&results](quint64 generation, const cv::Mat &mask) {
        results.append(Delivered{generation, mask});
    });

    const quint64 generation = runner.submitRefine(discMask(cv::Size(32, 32), cv::Point(16, 16), 10), cv::Size(64, 64));
    EXPECT_FALSE(runner.isIdle());
    ASSERT_TRUE(waitForIdle(runner));

    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results.first().generation, generation);
    EXPECT_EQ(results.first().image.size(), cv::Size(64, 64));
    EXPECT_EQ(results.first().image.type(), CV_32FC1);
}

TEST(CutoutTaskRunnerTest, OlderSubmissionIsDroppedAsStale)
{
    CutoutTaskRunner runner;
    QList<quint64> delivered;
    QList<quint64> dropped;
    QObject::connect(&runner, &CutoutTaskRunner::maskRefined,
                     [&delivered](quint64 generation, const cv::Mat &) { delivered.append(generation); });
    QObject::connect(&runner, &CutoutTaskRunner::staleResultDropped,
                     [&dropped](CutoutTaskRunner::TaskKind kind, quint64 generation) {
                         EXPECT_EQ(kind, CutoutTaskRunner::TaskKind::Refine);
                         dropped.append(generation);
                     });

    const cv::Mat raw = discMask(cv::Size(48, 48), cv::Point(24, 24), 14);
    const quint64 first = runner.submitRefine(raw);
    const quint64 second = runner.submitRefine(raw);
    EXPECT_GT(second, first);
    ASSERT_TRUE(waitForIdle(runner));

    EXPECT_EQ(delivered, QList<quint64>{second});
    EXPECT_EQ(dropped, QList<quint64>{first});
}

TEST(CutoutTaskRunnerTest, FailuresAreReportedNotThrown)
{
    CutoutTaskRunner runner;
    QList<CutoutTaskRunner::TaskKind> failedKinds;
    QList<CutoutError::Kind> errors;
    QObject::connect(&runner, &CutoutTaskRunner::taskFailed,
                     [&](CutoutTaskRunner::TaskKind kind, quint64, CutoutError::Kind error, const QString &message) {
                         failedKinds.append(kind);
                         errors.append(error);
                         EXPECT_FALSE(message.isEmpty());
                     });

    runner.submitRefine(cv::Mat());
    ASSERT_TRUE(waitForIdle(runner));
    ASSERT_EQ(failedKinds.size(), 1);
    EXPECT_EQ(failedKinds.first(), CutoutTaskRunner::TaskKind::Refine);
    EXPECT_EQ(errors.first(), CutoutError::Kind::InvalidInput);

    runner.submitRender(Composition(QStringLiteral("Broken"), cv::Size(0, 0)));
    ASSERT_TRUE(waitForIdle(runner));
    ASSERT_EQ(failedKinds.size(), 2);
    EXPECT_EQ(failedKinds.last(), CutoutTaskRunner::TaskKind::Render);
    EXPECT_EQ(errors.last(), CutoutError::Kind::InvalidGeometry);

    runner.submitComposite(cv::Mat(), cv::Mat(8, 8, CV_8UC3, cv::Scalar::all(90)));
    ASSERT_TRUE(waitForIdle(runner));
    ASSERT_EQ(failedKinds.size(), 3);
    EXPECT_EQ(failedKinds.last(), CutoutTaskRunner::TaskKind::Composite);
    EXPECT_EQ(errors.last(), CutoutError::Kind::CompositingFailed);
}

TEST(CutoutTaskRunnerTest, TaskKindsHaveIndependentGenerations)
{
    CutoutTaskRunner runner;
    int cutouts = 0;
    int renders = 0;
    QObject::connect(&runner, &CutoutTaskRunner::cutoutReady, [&cutouts](quint64, const cv::Mat &) { ++cutouts; });
    QObject::connect(&runner, &CutoutTaskRunner::renderReady, [&renders](quint64, const cv::Mat &raster) {
        EXPECT_EQ(raster.size(), cv::Size(24, 16));
        ++renders;
    });

    runner.submitComposite(cv::Mat::ones(8, 8, CV_32F), cv::Mat(8, 8, CV_8UC3, cv::Scalar::all(90)));
    runner.submitRender(Composition(QStringLiteral("Canvas"), cv::Size(24, 16)));
    ASSERT_TRUE(waitForIdle(runner));

    EXPECT_EQ(cutouts, 1);
    EXPECT_EQ(renders, 1);
    EXPECT_EQ(runner.currentGeneration(CutoutTaskRunner::TaskKind::Composite), 1u);
    EXPECT_EQ(runner.currentGeneration(CutoutTaskRunner::TaskKind::Render), 1u);
    EXPECT_EQ(runner.currentGeneration(CutoutTaskRunner::TaskKind::Refine), 0u);
}

TEST(CutoutTaskRunnerTest, CancelAllDropsEverythingInFlight)
{
    CutoutTaskRunner runner;
    int delivered = 0;
    int dropped = 0;
    QObject::connect(&runner, &CutoutTaskRunner::maskRefined, [&delivered](quint64, const cv::Mat &) { ++delivered; });
    QObject::connect(&runner, &CutoutTaskRunner::cutoutReady, [&delivered](quint64, const cv::Mat &) { ++delivered; });
    QObject::connect(&runner, &CutoutTaskRunner::staleResultDropped,
                     [&dropped](CutoutTaskRunner::TaskKind, quint64) { ++dropped; });

    runner.submitRefine(cv::Mat::ones(64, 64, CV_32F));
    runner.submitComposite(cv::Mat::ones(8, 8, CV_32F), cv::Mat(8, 8, CV_8UC3, cv::Scalar::all(90)));
    runner.cancelAll();
    ASSERT_TRUE(waitForIdle(runner));

    EXPECT_EQ(delivered, 0);
    EXPECT_EQ(dropped, 2);
}

TEST(CutoutTaskRunnerTest, InputsAreCopiedAtSubmission)
{
    CutoutTaskRunner runner;
    cv::Mat result;
    QObject::connect(&runner, &CutoutTaskRunner::cutoutReady,
                     [&result](quint64, const cv::Mat &cutout) { result = cutout; });

    cv::Mat mask = cv::Mat::ones(8, 8, CV_32F);
    runner.submitComposite(mask, cv::Mat(8, 8, CV_8UC3, cv::Scalar(0, 0, 255)));
    mask.setTo(cv::Scalar(0.0));
    ASSERT_TRUE(waitForIdle(runner));

    ASSERT_FALSE(result.empty());
    EXPECT_EQ(result.at<cv::Vec4b>(4, 4), cv::Vec4b(0, 0, 255, 255));
}

TEST(CutoutTaskRunnerTest, SupersededRenderIsDroppedAndLatestDelivered)
{
    CutoutTaskRunner runner;
    QList<quint64> delivered;
    QList<quint64> dropped;
    int failures = 0;
    QObject::connect(&runner, &CutoutTaskRunner::renderReady,
                     [&delivered](quint64 generation, const cv::Mat &) { delivered.append(generation); });
    QObject::connect(&runner, &CutoutTaskRunner::staleResultDropped,
                     [&dropped](CutoutTaskRunner::TaskKind kind, quint64 generation) {
                         EXPECT_EQ(kind, CutoutTaskRunner::TaskKind::Render);
                         dropped.append(generation);
                     });
    QObject::connect(&runner, &CutoutTaskRunner::taskFailed,
                     [&failures](CutoutTaskRunner::TaskKind, quint64, CutoutError::Kind, const QString &) {
                         ++failures;
                     });

    Composition composition(QStringLiteral("Export"), cv::Size(640, 480));
    for (int i = 0; i < 8; ++i) {
        Layer layer;
        layer.pixels = cv::Mat(480, 640, CV_8UC4, cv::Scalar(0, 0, 255, 255));
        composition.append(layer);
    }

    const quint64 first = runner.submitRender(composition);
    const quint64 second = runner.submitRender(composition);
    ASSERT_TRUE(waitForIdle(runner));

    // The first render either stopped at a layer boundary or finished; both are dropped
    EXPECT_EQ(dropped, QList<quint64>{first});
    EXPECT_EQ(delivered, QList<quint64>{second});
    EXPECT_EQ(failures, 0);
}
