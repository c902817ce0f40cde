#include "component_labeler.hpp"
#include "union_find.hpp"
#include "pixel_grid.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>
#include <random>

class ComponentLabelerTest : public ::testing::Test {
protected:
    Labeling run(const cv::Mat& mask, int connectivity, int min_area = 1) {
        LabelingParams p;
        p.connectivity = connectivity;
        p.min_area = min_area;
        Labeling out;
        EXPECT_EQ(label_components(mask, cv::Mat(), p, out), SegError::NONE);
        return out;
    }

    // Invariants every labeling must satisfy, with no filtering.
    void check_invariants(const cv::Mat& mask, const Labeling& lab) {
        ASSERT_EQ(lab.labels.type(), CV_32SC1);
        ASSERT_EQ(lab.labels.size(), mask.size());
        std::vector<int> counted(lab.blobs.size() + 1, 0);
        std::vector<cv::Point> first(lab.blobs.size() + 1, cv::Point(-1, -1));
        for (int y = 0; y < mask.rows; ++y) {
            for (int x = 0; x < mask.cols; ++x) {
                const int id = lab.labels.at<int>(y, x);
                ASSERT_EQ(id != 0, mask.at<uchar>(y, x) != 0);
                ASSERT_GE(id, 0);
                ASSERT_LE(id, (int)lab.blobs.size());
                ++counted[id];
                if (id > 0 && first[id].x < 0) first[id] = cv::Point(x, y);
            }
        }
        int total = 0;
        for (size_t i = 0; i < lab.blobs.size(); ++i) {
            const Blob& b = lab.blobs[i];
            EXPECT_EQ(b.id, (int)i + 1);
            EXPECT_EQ(b.area, counted[b.id]);
            EXPECT_GE(b.centroid.x, b.box.min_x);
            EXPECT_LE(b.centroid.x, b.box.max_x);
            EXPECT_GE(b.centroid.y, b.box.min_y);
            EXPECT_LE(b.centroid.y, b.box.max_y);
            if (i > 0) {
                // raster order of each blob's first pixel follows its id
                const cv::Point a = first[b.id - 1], c = first[b.id];
                EXPECT_TRUE(a.y < c.y || (a.y == c.y && a.x < c.x));
            }
            total += b.area;
        }
        EXPECT_EQ(total, cv::countNonZero(mask));
    }
};

TEST_F(ComponentLabelerTest, AllBackgroundYieldsNoBlobs) {
    cv::Mat mask(4, 4, CV_8UC1, cv::Scalar(0));
    Labeling lab = run(mask, 4);
    EXPECT_TRUE(lab.blobs.empty());
    EXPECT_EQ(cv::countNonZero(lab.labels), 0);
}

TEST_F(ComponentLabelerTest, SingleCenterPixel) {
    Labeling lab = run(mask_from_rows({ "...", ".#.", "..." }), 4);
    ASSERT_EQ(lab.blobs.size(), 1u);
    const Blob& b = lab.blobs[0];
    EXPECT_EQ(b.id, 1);
    EXPECT_EQ(b.area, 1);
    EXPECT_EQ(b.box.min_x, 1);
    EXPECT_EQ(b.box.min_y, 1);
    EXPECT_EQ(b.box.max_x, 1);
    EXPECT_EQ(b.box.max_y, 1);
    EXPECT_DOUBLE_EQ(b.centroid.x, 1.0);
    EXPECT_DOUBLE_EQ(b.centroid.y, 1.0);
    EXPECT_EQ(lab.labels.at<int>(1, 1), 1);
}

TEST_F(ComponentLabelerTest, DiagonalTouchDependsOnConnectivity) {
    cv::Mat mask = mask_from_rows({
        "#....",
        "#....",
        "###..",
        "...##",
        ".....",
    });

    Labeling four = run(mask, 4);
    check_invariants(mask, four);
    ASSERT_EQ(four.blobs.size(), 2u);
    EXPECT_EQ(four.blobs[0].area, 5);
    EXPECT_EQ(four.blobs[1].area, 2);
    EXPECT_EQ(four.labels.at<int>(3, 3), 2);

    Labeling eight = run(mask, 8);
    check_invariants(mask, eight);
    ASSERT_EQ(eight.blobs.size(), 1u);
    EXPECT_EQ(eight.blobs[0].area, 7);
    EXPECT_EQ(eight.blobs[0].box.max_x, 4);
    EXPECT_EQ(eight.blobs[0].box.max_y, 3);
}

TEST_F(ComponentLabelerTest, TopRightNeighborMergesUnderEightConnectivity) {
    cv::Mat mask = mask_from_rows({
        ".#",
        "#.",
    });
    EXPECT_EQ(run(mask, 4).blobs.size(), 2u);
    EXPECT_EQ(run(mask, 8).blobs.size(), 1u);
}

TEST_F(ComponentLabelerTest, ProvisionalLabelsMergeIntoOne) {
    cv::Mat mask = mask_from_rows({
        "#.#.#",
        "#.#.#",
        "#####",
    });
    Labeling lab = run(mask, 4);
    check_invariants(mask, lab);
    ASSERT_EQ(lab.blobs.size(), 1u);
    EXPECT_EQ(lab.blobs[0].area, 11);
}

TEST_F(ComponentLabelerTest, IdsFollowFirstDiscovery) {
    cv::Mat mask = mask_from_rows({
        "...#",
        "#..#",
        "#...",
    });
    Labeling lab = run(mask, 4);
    ASSERT_EQ(lab.blobs.size(), 2u);
    EXPECT_EQ(lab.labels.at<int>(0, 3), 1);
    EXPECT_EQ(lab.labels.at<int>(1, 0), 2);
    EXPECT_DOUBLE_EQ(lab.blobs[0].centroid.x, 3.0);
    EXPECT_DOUBLE_EQ(lab.blobs[0].centroid.y, 0.5);
}

TEST_F(ComponentLabelerTest, MinAreaDropsSmallBlobsAndRenumbers) {
    cv::Mat mask = mask_from_rows({
        "#...",
        "..##",
        "...#",
    });
    Labeling lab = run(mask, 4, 2);
    ASSERT_EQ(lab.blobs.size(), 1u);
    EXPECT_EQ(lab.blobs[0].id, 1);
    EXPECT_EQ(lab.blobs[0].area, 3);
    EXPECT_EQ(lab.labels.at<int>(0, 0), 0);
    EXPECT_EQ(lab.labels.at<int>(1, 2), 1);
    EXPECT_EQ(cv::countNonZero(lab.labels), 3);
}

TEST_F(ComponentLabelerTest, RandomMasksAgreeWithOpenCv) {
    std::mt19937 rng(1234);
    std::bernoulli_distribution fg(0.45);
    for (int round = 0; round < 20; ++round) {
        cv::Mat mask(15 + round, 20, CV_8UC1);
        for (int y = 0; y < mask.rows; ++y)
            for (int x = 0; x < mask.cols; ++x)
                mask.at<uchar>(y, x) = fg(rng) ? 255 : 0;

        for (int conn : { 4, 8 }) {
            Labeling lab = run(mask, conn);
            check_invariants(mask, lab);
            cv::Mat cv_labels;
            const int n = cv::connectedComponents(mask, cv_labels, conn, CV_32S);
            EXPECT_EQ((int)lab.blobs.size(), n - 1);

            Labeling again = run(mask, conn);
            EXPECT_EQ(cv::countNonZero(lab.labels != again.labels), 0);
        }
    }
}

TEST_F(ComponentLabelerTest, ColorIsRoundedMeanOfMembers) {
    cv::Mat mask = mask_from_rows({ "##." });
    cv::Mat grid = make_grid(3, 1, cv::Vec4b(0, 0, 0, 255));
    grid.at<cv::Vec4b>(0, 0) = cv::Vec4b(10, 20, 30, 0);
    grid.at<cv::Vec4b>(0, 1) = cv::Vec4b(11, 20, 33, 0);
    grid.at<cv::Vec4b>(0, 2) = cv::Vec4b(255, 255, 255, 255);

    LabelingParams p;
    Labeling lab;
    ASSERT_EQ(label_components(mask, grid, p, lab), SegError::NONE);
    ASSERT_EQ(lab.blobs.size(), 1u);
    EXPECT_EQ(lab.blobs[0].color, cv::Vec3b(11, 20, 32));
}

TEST_F(ComponentLabelerTest, RejectsInvalidParameters) {
    cv::Mat mask = mask_from_rows({ "#" });
    Labeling lab;
    LabelingParams p;

    p.connectivity = 6;
    EXPECT_EQ(label_components(mask, cv::Mat(), p, lab), SegError::BAD_CONNECTIVITY);
    p.connectivity = 4;
    p.min_area = -1;
    EXPECT_EQ(label_components(mask, cv::Mat(), p, lab), SegError::BAD_MIN_AREA);
    p.min_area = 1;
    EXPECT_EQ(label_components(cv::Mat(1, 1, CV_32SC1, cv::Scalar(1)), cv::Mat(), p, lab), SegError::BAD_GRID);
    EXPECT_EQ(label_components(mask, make_grid(2, 2), p, lab), SegError::SIZE_MISMATCH);
    EXPECT_TRUE(lab.blobs.empty());
    EXPECT_TRUE(lab.labels.empty());
}

TEST(DisjointSet, UnionFindBasics) {
    DisjointSet ds;
    for (int i = 0; i < 6; ++i) EXPECT_EQ(ds.make_set(), i);
    ds.unite(1, 2);
    ds.unite(3, 4);
    EXPECT_EQ(ds.find(1), ds.find(2));
    EXPECT_NE(ds.find(2), ds.find(3));
    ds.unite(2, 4);
    EXPECT_EQ(ds.find(1), ds.find(3));
    EXPECT_EQ(ds.find(5), 5);
    EXPECT_EQ(ds.size(), 6);
}

TEST(DisjointSet, LongChainResolves) {
    DisjointSet ds;
    const int n = 100000;
    for (int i = 0; i < n; ++i) ds.make_set();
    for (int i = 1; i < n; ++i) ds.unite(i - 1, i);
    const int root = ds.find(0);
    EXPECT_EQ(ds.find(n - 1), root);
}
