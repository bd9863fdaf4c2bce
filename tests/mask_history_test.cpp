#include <gtest/gtest.h>
#include "algorithms/mask_editing/mask_history.h"
#include "core/cutout_settings.h"

namespace {

cv::Mat filled(float value)
{
    return cv::Mat(4, 4, CV_32F, cv::Scalar(value));
}

} // namespace

TEST(MaskHistoryTest, PopReturnsSnapshotsInReverseOrder)
{
    MaskHistory history(5);
    history.push(filled(0.1f));
    history.push(filled(0.2f));

    EXPECT_FLOAT_EQ(history.pop().at<float>(0, 0), 0.2f);
    EXPECT_FLOAT_EQ(history.pop().at<float>(0, 0), 0.1f);
    EXPECT_TRUE(history.isEmpty());
    EXPECT_TRUE(history.pop().empty());
}

TEST(MaskHistoryTest, FullStackEvictsOldestSnapshot)
{
    MaskHistory history(3);
    for (int i = 1; i <= 5; ++i) {
        history.push(filled(i / 10.0f));
    }

    EXPECT_EQ(history.size(), 3);
    EXPECT_EQ(history.evictedCount(), 2);
    EXPECT_FLOAT_EQ(history.pop().at<float>(0, 0), 0.5f);
    EXPECT_FLOAT_EQ(history.pop().at<float>(0, 0), 0.4f);
    EXPECT_FLOAT_EQ(history.pop().at<float>(0, 0), 0.3f);
}

TEST(MaskHistoryTest, SnapshotsAreDeepCopies)
{
    MaskHistory history;
    cv::Mat live = filled(0.25f);
    history.push(live);
    live.setTo(cv::Scalar(0.9));

    EXPECT_FLOAT_EQ(history.pop().at<float>(2, 2), 0.25f);
}

TEST(MaskHistoryTest, CapacityIsAtLeastOne)
{
    MaskHistory history(0);
    EXPECT_EQ(history.capacity(), 1);

    history.push(filled(0.1f));
    history.push(filled(0.2f));
    EXPECT_EQ(history.size(), 1);
}

TEST(MaskHistoryTest, DefaultCapacityIsFifteen)
{
    EXPECT_EQ(MaskHistory().capacity(), 15);
    EXPECT_EQ(EditorSettings().historyCapacity, 15);
}
