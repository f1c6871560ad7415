#ifndef INFER_HPP__
#define INFER_HPP__

#include "infer/sam3type.hpp"
#include "common/object.hpp"
#include <iostream>
#include <vector>
#include <memory>
#include <optional>
#include <string>

namespace config
{
    struct BackendConfig;
}

using InferResult = object::DetectionBoxArray;

// 分割模型能力接口. 模型本身的推理不在本项目内实现, 任何实现只要满足这里的约定即可替换.
// 所有方法都可能抛出 error::BackendFailure
class SegmentationBackend
{
public:
    virtual ~SegmentationBackend() = default;

    virtual std::string name() const = 0;

    // 对整张图做一次视觉编码, 返回的状态由 session 持有, 之后每次提示原样传回
    virtual std::shared_ptr<EncoderState> encode_image(const cv::Mat &image) = 0;

    // 文本提示, 阈值由后端应用
    virtual InferResult predict_text(EncoderState &state, const std::string &prompt, float confidence_threshold) = 0;

    // 交互式点提示. mask_input 为上一次预测的低分辨率 logits;
    // multimask 为 true 时返回多个候选, 否则返回一个确定的结果
    virtual PointPrediction predict_points(EncoderState &state,
                                           const std::vector<PointPrompt> &points,
                                           const std::optional<cv::Mat> &mask_input,
                                           bool multimask) = 0;

    // 几何提示 (框 / 模板 / 点的降级路径)
    virtual InferResult predict_geometric(EncoderState &state,
                                          const std::vector<GeometricPrompt> &boxes,
                                          float confidence_threshold) = 0;

    // 清除 state 中累积的提示
    virtual void reset_prompts(EncoderState &state) = 0;

    // 是否支持基于 logits 的交互式点细化, 不支持时点提示走几何降级路径
    virtual bool supports_point_refinement() const { return true; }
};

// 工厂函数, 按配置创建后端, 类型未知时返回 nullptr
std::shared_ptr<SegmentationBackend> load_backend(const config::BackendConfig &config);

#endif // INFER_HPP__
