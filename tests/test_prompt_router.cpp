#include "prompt/prompt_router.hpp"
#include "infer/mockinfer.hpp"
#include "common/error.hpp"
#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>
#include <chrono>
#include <thread>

namespace
{
    object::Candidate make_candidate(float score)
    {
        object::Candidate c;
        c.score = score;
        c.area = 1;
        return c;
    }

    // 按设定返回固定 masks / scores / logits 的后端
    class ScriptedPointBackend : public SegmentationBackend
    {
    public:
        std::string name() const override { return "scripted"; }
        std::shared_ptr<EncoderState> encode_image(const cv::Mat &) override { return std::make_shared<EncoderState>(); }
        InferResult predict_text(EncoderState &, const std::string &, float) override { return {}; }
        PointPrediction predict_points(EncoderState &, const std::vector<PointPrompt> &,
                                       const std::optional<cv::Mat> &, bool) override
        {
            return prediction;
        }
        InferResult predict_geometric(EncoderState &, const std::vector<GeometricPrompt> &, float) override { return {}; }
        void reset_prompts(EncoderState &) override {}

        void add(const cv::Mat &mask, float score, float logit_value)
        {
            prediction.masks.push_back(mask);
            prediction.scores.push_back(score);
            prediction.logits.push_back(cv::Mat(16, 16, CV_32FC1, cv::Scalar(logit_value)));
        }

        PointPrediction prediction;
    };

    cv::Mat disc_mask(int size, int cx, int cy, int r)
    {
        cv::Mat m = cv::Mat::zeros(size, size, CV_8UC1);
        cv::circle(m, cv::Point(cx, cy), r, cv::Scalar(1), cv::FILLED);
        return m;
    }

    class PromptRouterTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            backend = std::make_shared<MockInfer>();
            store = std::make_shared<session::SessionStore>(backend);
            router = std::make_unique<prompt::PromptRouter>(store, backend, config::PromptConfig());
            store->register_image("img", cv::Mat(200, 200, CV_8UC3, cv::Scalar::all(0)));
        }

        prompt::PointsPrompt points(std::vector<PointPrompt> pts, bool reset_mask = false)
        {
            prompt::PointsPrompt p;
            p.points = std::move(pts);
            p.reset_mask = reset_mask;
            return p;
        }

        bool has_logits() { return store->get_refinement_logits("img").has_value(); }

        std::shared_ptr<MockInfer> backend;
        std::shared_ptr<session::SessionStore> store;
        std::unique_ptr<prompt::PromptRouter> router;
    };
}

TEST(FilterCandidates, KeepsBestWhenAllBelowThreshold)
{
    object::CandidateArray in = {make_candidate(0.9f), make_candidate(0.3f), make_candidate(0.1f)};
    auto out = prompt::filter_candidates(in, 0.5f);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_FLOAT_EQ(out[0].score, 0.9f);

    out = prompt::filter_candidates({make_candidate(0.2f), make_candidate(0.4f)}, 0.99f);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_FLOAT_EQ(out[0].score, 0.4f);
}

TEST(FilterCandidates, SortsDescending)
{
    object::CandidateArray in = {make_candidate(0.6f), make_candidate(0.2f), make_candidate(0.8f), make_candidate(0.7f)};
    auto out = prompt::filter_candidates(in, 0.5f);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_FLOAT_EQ(out[0].score, 0.8f);
    EXPECT_FLOAT_EQ(out[1].score, 0.7f);
    EXPECT_FLOAT_EQ(out[2].score, 0.6f);

    EXPECT_TRUE(prompt::filter_candidates({}, 0.5f).empty());
}

TEST_F(PromptRouterTest, TextPromptProducesCenteredDisc)
{
    prompt::TextPrompt p;
    p.text = "person";
    auto results = router->segment_text("img", p);
    ASSERT_EQ(results.size(), 1u);

    const auto &r = results[0];
    EXPECT_NEAR(r.score, 0.95f, 1e-6);
    EXPECT_EQ(r.mask_rle.height, 200);
    EXPECT_EQ(r.mask_rle.width, 200);
    EXPECT_EQ(r.area, mask::area(r.mask_rle));
    EXPECT_GT(r.area, 7000);
    EXPECT_LT(r.area, 8500);
    // 右下边界不包含
    EXPECT_FLOAT_EQ(r.box.left, 50.0f);
    EXPECT_FLOAT_EQ(r.box.right, 151.0f);
    EXPECT_FALSE(has_logits());
}

TEST_F(PromptRouterTest, TextPromptValidation)
{
    prompt::TextPrompt p;
    p.text = "  ";
    EXPECT_THROW(router->segment_text("img", p), error::MalformedInput);

    p.text = "cat";
    p.confidence_threshold = 1.5f;
    EXPECT_THROW(router->segment_text("img", p), error::MalformedInput);

    p.confidence_threshold = 0.5f;
    EXPECT_THROW(router->segment_text("missing", p), error::NotFound);

    // 阈值由后端应用
    p.confidence_threshold = 0.96f;
    EXPECT_TRUE(router->segment_text("img", p).empty());
}

TEST_F(PromptRouterTest, SinglePointReturnsMultimaskCandidates)
{
    auto results = router->segment_points("img", points({PointPrompt(100, 100, 1)}));
    ASSERT_EQ(results.size(), 3u);
    EXPECT_FLOAT_EQ(results[0].score, 0.92f);
    EXPECT_FLOAT_EQ(results[1].score, 0.75f);
    EXPECT_FLOAT_EQ(results[2].score, 0.60f);

    auto call = backend->last_point_call();
    EXPECT_TRUE(call.multimask);
    EXPECT_FALSE(call.had_mask_input);
    // 单点预测不进入细化状态
    EXPECT_FALSE(has_logits());
}

TEST_F(PromptRouterTest, SinglePointKeepsBestAboveThreshold)
{
    auto p = points({PointPrompt(100, 100, 1)});
    p.confidence_threshold = 0.99f;
    auto results = router->segment_points("img", p);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FLOAT_EQ(results[0].score, 0.92f);
}

TEST_F(PromptRouterTest, RefinementTransitions)
{
    // Idle -> Refining
    router->segment_points("img", points({PointPrompt(100, 100, 1), PointPrompt(110, 105, 1)}));
    EXPECT_FALSE(backend->last_point_call().had_mask_input);
    ASSERT_TRUE(has_logits());
    EXPECT_FLOAT_EQ(MockInfer::logits_generation(*store->get_refinement_logits("img")), 1.0f);

    // Refining -> Refining, 缓存的 logits 作为输入
    auto results = router->segment_points("img", points({PointPrompt(100, 100, 1), PointPrompt(110, 105, 1), PointPrompt(60, 60, 0)}));
    auto call = backend->last_point_call();
    EXPECT_TRUE(call.had_mask_input);
    EXPECT_FALSE(call.multimask);
    EXPECT_FLOAT_EQ(call.mask_input_generation, 1.0f);
    EXPECT_EQ(results.size(), 1u);
    EXPECT_FLOAT_EQ(MockInfer::logits_generation(*store->get_refinement_logits("img")), 2.0f);

    // 显式重置 -> Idle
    EXPECT_TRUE(router->reset_mask_state("img"));
    EXPECT_FALSE(has_logits());
    EXPECT_FALSE(router->reset_mask_state("img"));

    // 重置后的下一次多点预测不会看到旧的 logits
    router->segment_points("img", points({PointPrompt(30, 30, 1), PointPrompt(35, 35, 1)}));
    EXPECT_FALSE(backend->last_point_call().had_mask_input);
    EXPECT_FLOAT_EQ(MockInfer::logits_generation(*store->get_refinement_logits("img")), 1.0f);
}

TEST_F(PromptRouterTest, ResetMaskFlagStartsNewSequence)
{
    router->segment_points("img", points({PointPrompt(100, 100, 1), PointPrompt(110, 105, 1)}));
    ASSERT_TRUE(has_logits());

    router->segment_points("img", points({PointPrompt(50, 50, 1), PointPrompt(55, 55, 1)}, true));
    EXPECT_FALSE(backend->last_point_call().had_mask_input);
    EXPECT_TRUE(backend->last_point_call().multimask);
    EXPECT_FLOAT_EQ(MockInfer::logits_generation(*store->get_refinement_logits("img")), 1.0f);

    // 单点 + reset_mask 只清除, 不会重新缓存
    router->segment_points("img", points({PointPrompt(50, 50, 1)}, true));
    EXPECT_FALSE(has_logits());
}

TEST_F(PromptRouterTest, SinglePointLeavesExistingLogitsUntouched)
{
    router->segment_points("img", points({PointPrompt(100, 100, 1), PointPrompt(110, 105, 1)}));
    router->segment_points("img", points({PointPrompt(20, 20, 1)}));
    EXPECT_FALSE(backend->last_point_call().had_mask_input);
    ASSERT_TRUE(has_logits());
    EXPECT_FLOAT_EQ(MockInfer::logits_generation(*store->get_refinement_logits("img")), 1.0f);
}

TEST_F(PromptRouterTest, ResetPromptsDoesNotTouchLogits)
{
    router->segment_points("img", points({PointPrompt(100, 100, 1), PointPrompt(110, 105, 1)}));
    router->reset_prompts("img");
    EXPECT_TRUE(has_logits());
}

TEST_F(PromptRouterTest, FallbackWhenBackendLacksRefinement)
{
    backend->set_point_refinement(false);
    auto results = router->segment_points("img", points({PointPrompt(100, 100, 1), PointPrompt(150, 150, 1)}));
    EXPECT_EQ(backend->point_call_count(), 0);
    EXPECT_EQ(backend->geometric_call_count(), 1);
    EXPECT_EQ(results.size(), 2u);
    for (const auto &r : results)
    {
        EXPECT_FLOAT_EQ(r.score, 0.9f);
        // 5% x 5% 的框
        EXPECT_LE(r.box.width(), 11.0f);
        EXPECT_LE(r.box.height(), 11.0f);
    }
    EXPECT_FALSE(has_logits());
}

TEST_F(PromptRouterTest, FallbackWhenPointPredictionFails)
{
    backend->set_fail_point_prediction(true);
    auto results = router->segment_points("img", points({PointPrompt(100, 100, 1), PointPrompt(120, 120, 1)}));
    EXPECT_EQ(backend->point_call_count(), 1);
    EXPECT_EQ(backend->geometric_call_count(), 1);
    EXPECT_FALSE(results.empty());
    EXPECT_FALSE(has_logits());
}

TEST_F(PromptRouterTest, FallbackNegativePointsProduceNoMask)
{
    backend->set_point_refinement(false);
    auto results = router->segment_points("img", points({PointPrompt(100, 100, 1), PointPrompt(20, 20, 0)}));
    // 负样本点只作为排除区域
    ASSERT_EQ(results.size(), 1u);
    EXPECT_GE(results[0].box.left, 90.0f);
}

TEST_F(PromptRouterTest, PointValidation)
{
    EXPECT_THROW(router->segment_points("img", points({})), error::MalformedInput);
    EXPECT_THROW(router->segment_points("img", points({PointPrompt(-1, 10, 1)})), error::MalformedInput);
    EXPECT_THROW(router->segment_points("img", points({PointPrompt(10, 201, 1)})), error::MalformedInput);
    EXPECT_THROW(router->segment_points("img", points({PointPrompt(10, 10, 2)})), error::MalformedInput);
    EXPECT_THROW(router->segment_points("missing", points({PointPrompt(10, 10, 1)})), error::NotFound);
    EXPECT_EQ(backend->point_call_count(), 0);
}

TEST_F(PromptRouterTest, BoxPromptNormalizedAgainstImage)
{
    prompt::BoxPrompt p;
    p.x1 = 20;
    p.y1 = 40;
    p.x2 = 120;
    p.y2 = 100;
    auto results = router->segment_box("img", p);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_GE(results[0].box.left, 19.0f);
    EXPECT_LE(results[0].box.right, 121.0f);
    EXPECT_GE(results[0].box.top, 39.0f);
    EXPECT_LE(results[0].box.bottom, 101.0f);
    EXPECT_FALSE(has_logits());
}

TEST_F(PromptRouterTest, BoxPromptValidation)
{
    prompt::BoxPrompt p;
    p.x1 = 50;
    p.y1 = 50;
    p.x2 = 50;
    p.y2 = 80;
    EXPECT_THROW(router->segment_box("img", p), error::MalformedInput);
    p.x2 = 40;
    EXPECT_THROW(router->segment_box("img", p), error::MalformedInput);
    p.x1 = -5;
    p.x2 = 40;
    EXPECT_THROW(router->segment_box("img", p), error::MalformedInput);
}

TEST_F(PromptRouterTest, TemplateUsesSourceDimensions)
{
    store->register_image("source", cv::Mat(100, 100, CV_8UC3, cv::Scalar::all(0)));

    prompt::TemplatePrompt p;
    p.source_image_id = "source";
    p.x1 = 25;
    p.y1 = 25;
    p.x2 = 75;
    p.y2 = 75;
    // 在 100x100 的模板图上是中间一半, 放到 200x200 的目标图上是 (50, 50) - (150, 150)
    auto results = router->segment_template("img", p);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_GE(results[0].box.left, 49.0f);
    EXPECT_LE(results[0].box.right, 151.0f);
    EXPECT_GT(results[0].box.width(), 90.0f);

    p.source_image_id = "unknown";
    EXPECT_THROW(router->segment_template("img", p), error::NotFound);
    p.source_image_id = "source";
    EXPECT_THROW(router->segment_template("unknown", p), error::NotFound);
}

TEST_F(PromptRouterTest, RunDispatchesVariant)
{
    prompt::TextPrompt text;
    text.text = "dog";
    EXPECT_EQ(router->run("img", prompt::Prompt(text)).size(), 1u);

    prompt::Prompt pts = points({PointPrompt(100, 100, 1), PointPrompt(105, 100, 1)});
    router->run("img", pts);
    EXPECT_EQ(backend->point_call_count(), 1);
    EXPECT_TRUE(has_logits());

    prompt::BoxPrompt box;
    box.x1 = 10;
    box.y1 = 10;
    box.x2 = 60;
    box.y2 = 60;
    router->run("img", box);
    EXPECT_EQ(backend->geometric_call_count(), 1);
}

TEST_F(PromptRouterTest, CancelledBeforeCallDoesNotReachBackend)
{
    prompt::PromptOptions options;
    options.cancel = std::make_shared<prompt::CancelToken>();
    options.cancel->cancel();

    EXPECT_THROW(router->segment_points("img", points({PointPrompt(100, 100, 1), PointPrompt(110, 110, 1)}), options),
                 error::Cancelled);
    EXPECT_EQ(backend->point_call_count(), 0);
    EXPECT_FALSE(has_logits());
}

TEST_F(PromptRouterTest, CancelledDuringCallDiscardsResult)
{
    router->segment_points("img", points({PointPrompt(100, 100, 1), PointPrompt(110, 110, 1)}));
    ASSERT_TRUE(has_logits());

    backend->set_latency(std::chrono::milliseconds(200));
    prompt::PromptOptions options;
    options.cancel = std::make_shared<prompt::CancelToken>();
    std::thread canceller([token = options.cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token->cancel();
    });
    EXPECT_THROW(router->segment_points("img", points({PointPrompt(100, 100, 1), PointPrompt(120, 120, 1)}), options),
                 error::Cancelled);
    canceller.join();

    // 后端被调用过, 但缓存的 logits 仍然是上一次的
    EXPECT_EQ(backend->point_call_count(), 2);
    EXPECT_FLOAT_EQ(MockInfer::logits_generation(*store->get_refinement_logits("img")), 1.0f);
}

TEST_F(PromptRouterTest, TimeoutDiscardsResult)
{
    backend->set_latency(std::chrono::milliseconds(60));
    prompt::PromptOptions options;
    options.timeout = std::chrono::milliseconds(10);

    EXPECT_THROW(router->segment_points("img", points({PointPrompt(100, 100, 1), PointPrompt(110, 110, 1)}), options),
                 error::Timeout);
    EXPECT_FALSE(has_logits());

    prompt::TextPrompt text;
    text.text = "person";
    EXPECT_THROW(router->segment_text("img", text, options), error::Timeout);
}

TEST_F(PromptRouterTest, DefaultTimeoutFromRouter)
{
    prompt::PromptRouter strict(store, backend, config::PromptConfig(), std::chrono::milliseconds(10));
    backend->set_latency(std::chrono::milliseconds(60));
    prompt::TextPrompt text;
    text.text = "person";
    EXPECT_THROW(strict.segment_text("img", text), error::Timeout);
}

TEST_F(PromptRouterTest, ConcurrentRefinementLosesNoUpdate)
{
    backend->set_latency(std::chrono::milliseconds(2));
    const int kThreads = 8;
    const int kCallsPerThread = 5;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([this, t] {
            for (int i = 0; i < kCallsPerThread; ++i)
            {
                router->segment_points("img", points({PointPrompt(100, 100, 1), PointPrompt(90.0f + t, 95.0f + i, 1)}));
            }
        });
    }
    for (auto &th : threads)
        th.join();

    // 每次调用都读到了上一次提交的 logits, 代数等于调用次数
    EXPECT_EQ(backend->point_call_count(), kThreads * kCallsPerThread);
    EXPECT_FLOAT_EQ(MockInfer::logits_generation(*store->get_refinement_logits("img")),
                    static_cast<float>(kThreads * kCallsPerThread));
}

TEST_F(PromptRouterTest, DifferentImagesRefineIndependently)
{
    store->register_image("other", cv::Mat(100, 100, CV_8UC3, cv::Scalar::all(0)));
    router->segment_points("img", points({PointPrompt(100, 100, 1), PointPrompt(110, 110, 1)}));
    router->segment_points("img", points({PointPrompt(100, 100, 1), PointPrompt(120, 110, 1)}));
    router->segment_points("other", points({PointPrompt(50, 50, 1), PointPrompt(55, 55, 1)}));

    EXPECT_FLOAT_EQ(MockInfer::logits_generation(*store->get_refinement_logits("img")), 2.0f);
    EXPECT_FLOAT_EQ(MockInfer::logits_generation(*store->get_refinement_logits("other")), 1.0f);
}

TEST(PromptRouterLogits, CachedLogitsBelongToReturnedMask)
{
    auto backend = std::make_shared<ScriptedPointBackend>();
    // 最高分的 mask 为空, 第二高的尺寸不对, 真正返回的是 0.5 分的圆
    backend->add(cv::Mat::zeros(200, 200, CV_8UC1), 0.9f, 1.0f);
    backend->add(cv::Mat::ones(10, 10, CV_8UC1), 0.8f, 2.0f);
    backend->add(disc_mask(200, 100, 100, 20), 0.5f, 3.0f);
    backend->add(disc_mask(200, 100, 100, 10), 0.3f, 4.0f);

    auto store = std::make_shared<session::SessionStore>(backend);
    prompt::PromptRouter router(store, backend, config::PromptConfig());
    store->register_image("img", cv::Mat(200, 200, CV_8UC3, cv::Scalar::all(0)));

    prompt::PointsPrompt p;
    p.points = {PointPrompt(100, 100, 1), PointPrompt(105, 100, 1)};
    auto results = router.segment_points("img", p);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FLOAT_EQ(results[0].score, 0.5f);

    auto logits = store->get_refinement_logits("img");
    ASSERT_TRUE(logits.has_value());
    EXPECT_FLOAT_EQ(logits->at<float>(0, 0), 3.0f);
}

TEST(PromptRouterLogits, NothingCachedWhenNoCandidateSurvives)
{
    auto backend = std::make_shared<ScriptedPointBackend>();
    backend->add(cv::Mat::zeros(200, 200, CV_8UC1), 0.9f, 1.0f);
    backend->add(cv::Mat::ones(50, 50, CV_8UC1), 0.7f, 2.0f);

    auto store = std::make_shared<session::SessionStore>(backend);
    prompt::PromptRouter router(store, backend, config::PromptConfig());
    store->register_image("img", cv::Mat(200, 200, CV_8UC3, cv::Scalar::all(0)));

    prompt::PointsPrompt p;
    p.points = {PointPrompt(100, 100, 1), PointPrompt(105, 100, 1)};
    EXPECT_TRUE(router.segment_points("img", p).empty());
    EXPECT_FALSE(store->get_refinement_logits("img").has_value());
}
