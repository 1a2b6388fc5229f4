#include <atomic>
#include <cmath>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "defect_predictor.hpp"
#include "errors.hpp"
#include "test_util.hpp"

using namespace raydef;
using raydef::testutil::TempDir;
using raydef::testutil::line_samples;
using raydef::testutil::write_file;

namespace {

/* defects = 2·size exactly → size 50 gives K = 100 */
std::string train_to(const TempDir& tmp, const std::string& name = "model.bin")
{
    const std::string path = tmp.file(name);
    VolumeEstimator est(path);
    est.persist(est.fit(line_samples({{10,20},{20,40},{30,60},{40,80}})));
    return path;
}

}  // namespace

TEST(DefectPredictor, EndToEnd)
{
    TempDir tmp;
    DefectPredictor p(train_to(tmp));
    EXPECT_FALSE(p.ready());

    DefectForecast f = p.predict(50, 10);
    EXPECT_TRUE(p.ready());
    EXPECT_EQ(f.total_defects_estimated, 100);
    ASSERT_EQ(f.monthly_distribution.size(), 15u);
    ASSERT_EQ(f.projected_months.size(), 15u);
    EXPECT_DOUBLE_EQ(f.monthly_distribution[0], 6.06);
    EXPECT_DOUBLE_EQ(f.monthly_distribution[3], 15.16);
    EXPECT_EQ(f.projected_months.front(), 1);
    EXPECT_EQ(f.projected_months.back(), 15);
}

TEST(DefectPredictor, LengthInvariantAcrossInputs)
{
    TempDir tmp;
    DefectPredictor p(train_to(tmp));
    for (double size : {0.0, 3.0, 48.5, 500.0})
        for (double d : {0.6, 1.0, 2.5, 9.0, 18.0, 36.0}) {
            DefectForecast f = p.predict(size, d);
            const std::size_t h = static_cast<std::size_t>(std::floor(d * 1.5));
            ASSERT_EQ(f.monthly_distribution.size(), h);
            ASSERT_EQ(f.projected_months.size(), h);
            for (std::size_t i = 0; i < h; ++i)
                EXPECT_EQ(f.projected_months[i], static_cast<int>(i + 1));
        }
    EXPECT_EQ(p.loads(), 1u);
}

TEST(DefectPredictor, MissingArtifactIsUnavailable)
{
    TempDir tmp;
    DefectPredictor p(tmp.file("missing.bin"));
    EXPECT_FALSE(p.warm_up());
    EXPECT_THROW(p.predict(10, 6), ModelUnavailable);
    EXPECT_FALSE(p.ready());

    /* once a model shows up the next request picks it up */
    VolumeEstimator est(tmp.file("missing.bin"));
    est.persist(FittedModel{1.0, 0.0, 2, 1.0});
    EXPECT_EQ(p.predict(10, 6).total_defects_estimated, 10);
    EXPECT_TRUE(p.ready());
}

TEST(DefectPredictor, CorruptArtifactPropagates)
{
    TempDir tmp;
    write_file(tmp.file("model.bin"), std::string("\xa1\x61\x78\x01", 4));  // {"x":1}
    DefectPredictor p(tmp.file("model.bin"));
    EXPECT_THROW(p.predict(10, 6), CorruptArtifact);
    EXPECT_THROW(p.warm_up(), CorruptArtifact);
    EXPECT_FALSE(p.ready());
}

TEST(DefectPredictor, BadArgumentsRejectedBeforeLoading)
{
    TempDir tmp;
    DefectPredictor p(train_to(tmp));
    EXPECT_THROW(p.predict(10, 0),   InvalidDuration);
    EXPECT_THROW(p.predict(10, -2),  InvalidDuration);
    EXPECT_THROW(p.predict(NAN, 5),  InvalidInput);
    EXPECT_FALSE(p.ready());
    EXPECT_EQ(p.loads(), 0u);
}

TEST(DefectPredictor, ReloadKeepsLastGoodModel)
{
    TempDir tmp;
    const std::string path = train_to(tmp);
    DefectPredictor p(path);
    ASSERT_TRUE(p.warm_up());
    const FittedModel before = *p.model();

    write_file(path, "garbage");
    EXPECT_THROW(p.reload(), CorruptArtifact);
    EXPECT_TRUE(p.ready());
    EXPECT_EQ(*p.model(), before);
    EXPECT_EQ(p.predict(50, 10).total_defects_estimated, 100);

    std::remove(path.c_str());
    EXPECT_FALSE(p.reload());
    EXPECT_TRUE(p.ready());
    EXPECT_EQ(*p.model(), before);

    VolumeEstimator est(path);
    est.persist(FittedModel{3.0, 0.0, 2, 1.0});
    EXPECT_TRUE(p.reload());
    EXPECT_EQ(p.predict(50, 10).total_defects_estimated, 150);
    EXPECT_EQ(p.loads(), 2u);
}

TEST(DefectPredictor, InstallMakesReadyWithoutDisk)
{
    TempDir tmp;
    DefectPredictor p(tmp.file("never_written.bin"));
    p.install(FittedModel{0.5, 2.0, 2, 1.0});
    EXPECT_TRUE(p.ready());
    EXPECT_EQ(p.loads(), 0u);
    EXPECT_EQ(p.predict(20, 4).total_defects_estimated, 12);
}

TEST(DefectPredictor, ConcurrentFirstRequestsLoadOnce)
{
    TempDir tmp;
    DefectPredictor p(train_to(tmp));

    constexpr int N = 32;
    std::atomic<int> go{0}, ok{0};
    std::vector<std::thread> pool;
    for (int i = 0; i < N; ++i)
        pool.emplace_back([&] {
            while (go.load() == 0) std::this_thread::yield();
            DefectForecast f = p.predict(50, 10);
            if (f.total_defects_estimated == 100 && f.projected_months.size() == 15) ++ok;
        });
    go.store(1);
    for (auto& t : pool) t.join();

    EXPECT_EQ(ok.load(), N);
    EXPECT_EQ(p.loads(), 1u);
    EXPECT_TRUE(p.ready());
}
