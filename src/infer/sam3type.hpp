#ifndef SAM3TYPE_HPP__
#define SAM3TYPE_HPP__

#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include <array>
#include <utility>

// 点提示: 像素坐标, label 1 为正样本, 0 为负样本
struct PointPrompt
{
    float x = 0.0f;
    float y = 0.0f;
    int label = 1;

    PointPrompt() = default;
    PointPrompt(float x, float y, int label) : x(x), y(y), label(label) {}
};

// 几何提示: 归一化的中心格式 {cx, cy, w, h}, 均为相对图片宽高的比例
struct GeometricPrompt
{
    std::array<float, 4> box = {0.0f, 0.0f, 0.0f, 0.0f};
    bool label = true;

    GeometricPrompt() = default;
    GeometricPrompt(const std::array<float, 4> &b, bool l) : box(b), label(l) {}
};

// predict_points 的输出, 三个 vector 一一对应
// logits 是低分辨率的 mask 激活 (CV_32FC1), 可以作为下一次细化的 mask_input
struct PointPrediction
{
    std::vector<cv::Mat> masks;
    std::vector<float> scores;
    std::vector<cv::Mat> logits;
};

// 后端为每张图生成的编码状态, 只有后端自己解释其内容
class EncoderState
{
public:
    virtual ~EncoderState() = default;
};

#endif // SAM3TYPE_HPP__
