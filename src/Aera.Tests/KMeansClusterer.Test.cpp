#include "pch.h"

#include "Aera/kmeans_clusterer.h"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace {
aera::FeatureMatrix create_blobs(int points_per_blob) {
    const double centres[3][2] = {{0.0, 0.0}, {100.0, 0.0}, {0.0, 100.0}};
    auto data = aera::FeatureMatrix(3 * points_per_blob, 2);
    auto row = Eigen::Index{0};
    for (const auto &centre : centres) {
        for (auto i = 0; i < points_per_blob; i++) {
            data(row, 0) = centre[0] + 0.1 * (i % 4);
            data(row, 1) = centre[1] + 0.1 * (i % 3);
            row++;
        }
    }

    return data;
}
} // anonymous namespace

TEST(TestKMeansClusterer, ClusterCountFromPopulationSize) {
    using namespace aera;

    ASSERT_EQ(2, KMeansClusterer::cluster_count(0));
    ASSERT_EQ(2, KMeansClusterer::cluster_count(1));
    ASSERT_EQ(2, KMeansClusterer::cluster_count(4));
    ASSERT_EQ(3, KMeansClusterer::cluster_count(9));
    ASSERT_EQ(3, KMeansClusterer::cluster_count(12));
    ASSERT_EQ(4, KMeansClusterer::cluster_count(13));
    ASSERT_EQ(5, KMeansClusterer::cluster_count(25));
    ASSERT_EQ(6, KMeansClusterer::cluster_count(36));
    ASSERT_EQ(6, KMeansClusterer::cluster_count(50));
    ASSERT_EQ(6, KMeansClusterer::cluster_count(1000000));
}

TEST(TestKMeansClusterer, SeparatedBlobsRecovered) {
    using namespace aera;

    const auto blob_size = 10;
    auto data = create_blobs(blob_size);
    auto kmeans = KMeansClusterer{};
    auto labels = kmeans.fit_predict(data, 3);

    ASSERT_EQ(static_cast<std::size_t>(data.rows()), labels.size());
    auto blob_labels = std::set<int>{};
    for (auto blob = 0; blob < 3; blob++) {
        auto first = labels[static_cast<std::size_t>(blob * blob_size)];
        for (auto i = 0; i < blob_size; i++) {
            ASSERT_EQ(first, labels[static_cast<std::size_t>(blob * blob_size + i)]);
        }

        blob_labels.insert(first);
    }

    ASSERT_EQ(3, blob_labels.size());
    ASSERT_EQ(3, kmeans.centroids().rows());
    ASSERT_LT(kmeans.inertia(), 10.0);
    ASSERT_LE(1, kmeans.iterations());
}

TEST(TestKMeansClusterer, LabelsWithinRange) {
    using namespace aera;

    auto data = create_blobs(7);
    auto kmeans = KMeansClusterer{};
    auto labels = kmeans.fit_predict(data);
    auto clusters = KMeansClusterer::cluster_count(static_cast<std::size_t>(data.rows()));
    for (auto label : labels) {
        ASSERT_LE(0, label);
        ASSERT_GT(clusters, label);
    }
}

TEST(TestKMeansClusterer, IdenticalRowsShareCluster) {
    using namespace aera;

    auto data = FeatureMatrix::Zero(50, feature_count).eval();
    auto kmeans = KMeansClusterer{};
    auto labels = kmeans.fit_predict(data);

    ASSERT_EQ(50, labels.size());
    ASSERT_TRUE(std::all_of(labels.begin(), labels.end(), [](auto v) { return v == 0; }));
    ASSERT_DOUBLE_EQ(0.0, kmeans.inertia());
}

TEST(TestKMeansClusterer, SingleRowWithTwoClusters) {
    using namespace aera;

    auto data = FeatureMatrix::Zero(1, feature_count).eval();
    auto kmeans = KMeansClusterer{};
    auto labels = kmeans.fit_predict(data);
    ASSERT_EQ(std::vector<int>{0}, labels);
}

TEST(TestKMeansClusterer, DeterministicForSameInput) {
    using namespace aera;

    auto data = FeatureMatrix::Random(60, 4).eval();
    auto first = KMeansClusterer{}.fit_predict(data);
    auto second = KMeansClusterer{}.fit_predict(data);
    ASSERT_EQ(first, second);
}

TEST(TestKMeansClusterer, InvalidArgumentsThrow) {
    using namespace aera;

    auto kmeans = KMeansClusterer{};
    ASSERT_THROW(kmeans.fit_predict(FeatureMatrix(0, 2)), std::invalid_argument);
    ASSERT_THROW(kmeans.fit_predict(FeatureMatrix::Zero(3, 2).eval(), 0), std::invalid_argument);
}
