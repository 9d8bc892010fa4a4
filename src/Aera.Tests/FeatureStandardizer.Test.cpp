#include "pch.h"

#include "Aera/feature_standardizer.h"
#include "mock_repository.h"

#include <stdexcept>

namespace {
std::vector<aera::core::EntityRecord> create_varied_population(int size) {
    auto result = std::vector<aera::core::EntityRecord>{};
    for (auto i = 0; i < size; i++) {
        auto entity = aera::testing::create_entity(std::to_string(i), "c1", "s1");
        entity.household_size = 1 + (i % 5);
        entity.medication_dependency = (i % 2 == 0);
        entity.insulin_dependency = (i % 3 == 0);
        entity.oxygen_powered_device = (i % 4 == 0);
        entity.mobility_limitation = (i % 5 == 0);
        entity.transportation_access = (i % 6 != 0);
        entity.financial_strain = (i % 7 == 0);
        entity.risk_score = 0.5 * i;
        result.push_back(entity);
    }

    return result;
}
} // anonymous namespace

TEST(TestFeatureStandardizer, FeatureNamesOrder) {
    using namespace aera;

    const auto &names = feature_names();
    ASSERT_EQ(feature_count, static_cast<Eigen::Index>(names.size()));
    ASSERT_EQ("risk_score", names.front());
    ASSERT_EQ("financial_strain", names.back());
}

TEST(TestFeatureStandardizer, BuildFeaturesDefaults) {
    using namespace aera;

    auto population = std::vector<core::EntityRecord>{aera::testing::create_entity("a", "c1", "s1")};
    auto features = FeatureStandardizer::build_features(population);

    ASSERT_EQ(1, features.rows());
    ASSERT_EQ(feature_count, features.cols());
    ASSERT_DOUBLE_EQ(0.0, features(0, static_cast<Eigen::Index>(Feature::risk_score)));
    ASSERT_DOUBLE_EQ(1.0, features(0, static_cast<Eigen::Index>(Feature::household_size)));
    ASSERT_DOUBLE_EQ(0.0, features(0, static_cast<Eigen::Index>(Feature::insulin_dependency)));
    ASSERT_DOUBLE_EQ(1.0, features(0, static_cast<Eigen::Index>(Feature::transportation_access)));
    ASSERT_DOUBLE_EQ(0.0, features(0, static_cast<Eigen::Index>(Feature::financial_strain)));
}

TEST(TestFeatureStandardizer, ColumnsZeroMeanUnitDeviation) {
    using namespace aera;

    auto features = FeatureStandardizer::build_features(create_varied_population(42));
    auto standardizer = FeatureStandardizer{};
    auto scaled = standardizer.fit_transform(features);

    ASSERT_EQ(features.rows(), scaled.rows());
    ASSERT_EQ(feature_count, static_cast<Eigen::Index>(standardizer.summaries().size()));
    for (auto col = Eigen::Index{0}; col < scaled.cols(); col++) {
        auto mean = scaled.col(col).mean();
        auto variance = (scaled.col(col).array() - mean).square().mean();
        ASSERT_NEAR(0.0, mean, 1e-9);
        ASSERT_NEAR(1.0, variance, 1e-9);
    }
}

TEST(TestFeatureStandardizer, ConstantColumnIsZero) {
    using namespace aera;

    auto population = create_varied_population(20);
    for (auto &entity : population) {
        entity.household_size = 4.0;
    }

    auto standardizer = FeatureStandardizer{};
    auto scaled = standardizer.fit_transform(FeatureStandardizer::build_features(population));
    auto column = static_cast<Eigen::Index>(Feature::household_size);
    for (auto row = Eigen::Index{0}; row < scaled.rows(); row++) {
        ASSERT_EQ(0.0, scaled(row, column));
    }
}

TEST(TestFeatureStandardizer, SingleRowIsAllZero) {
    using namespace aera;

    auto standardizer = FeatureStandardizer{};
    auto scaled = standardizer.fit_transform(
        FeatureStandardizer::build_features(create_varied_population(1)));
    ASSERT_TRUE(scaled.isZero());
}

TEST(TestFeatureStandardizer, EmptyMatrixThrows) {
    using namespace aera;

    auto standardizer = FeatureStandardizer{};
    ASSERT_THROW(standardizer.fit_transform(FeatureMatrix(0, feature_count)),
                 std::invalid_argument);
}
