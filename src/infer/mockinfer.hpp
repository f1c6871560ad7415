#ifndef MOCKINFER_HPP__
#define MOCKINFER_HPP__

#include "infer/infer.hpp"
#include <atomic>
#include <chrono>
#include <mutex>

// 不依赖模型的确定性后端: 文本提示在图中心生成圆形 mask, 点提示以第一个正样本点为圆心,
// 几何提示在框内生成内切椭圆. 用于开发和测试, 通过配置 backend.type = mock 选择.
class MockInfer : public SegmentationBackend
{
public:
    // 最近一次 predict_points 调用的参数记录
    struct PointCall
    {
        int num_points = 0;
        bool had_mask_input = false;
        bool multimask = false;
        float mask_input_generation = 0.0f;
    };

    MockInfer() = default;
    virtual ~MockInfer() = default;

    std::string name() const override { return "mock"; }

    std::shared_ptr<EncoderState> encode_image(const cv::Mat &image) override;
    InferResult predict_text(EncoderState &state, const std::string &prompt, float confidence_threshold) override;
    PointPrediction predict_points(EncoderState &state,
                                   const std::vector<PointPrompt> &points,
                                   const std::optional<cv::Mat> &mask_input,
                                   bool multimask) override;
    InferResult predict_geometric(EncoderState &state,
                                  const std::vector<GeometricPrompt> &boxes,
                                  float confidence_threshold) override;
    void reset_prompts(EncoderState &state) override;
    bool supports_point_refinement() const override { return point_refinement_; }

    // --- 行为控制 ---
    void set_point_refinement(bool enable) { point_refinement_ = enable; }
    void set_fail_point_prediction(bool fail) { fail_point_prediction_ = fail; }
    void set_fail_all(bool fail) { fail_all_ = fail; }
    void set_latency(std::chrono::milliseconds latency) { latency_ms_ = static_cast<int>(latency.count()); }

    // --- 调用统计 ---
    int encode_count() const { return encode_count_.load(); }
    int point_call_count() const { return point_call_count_.load(); }
    int geometric_call_count() const { return geometric_call_count_.load(); }
    PointCall last_point_call() const;

    // logits 中记录了细化链的代数: 前景区域的值等于代数, 背景为其相反数
    static float logits_generation(const cv::Mat &logits);

    static constexpr int kLogitsSize = 64;

private:
    void simulate_latency() const;

    std::atomic<bool> point_refinement_{true};
    std::atomic<bool> fail_point_prediction_{false};
    std::atomic<bool> fail_all_{false};
    std::atomic<int> latency_ms_{0};

    std::atomic<int> encode_count_{0};
    std::atomic<int> point_call_count_{0};
    std::atomic<int> geometric_call_count_{0};

    mutable std::mutex call_lock_;
    PointCall last_point_call_;
};

#endif // MOCKINFER_HPP__
