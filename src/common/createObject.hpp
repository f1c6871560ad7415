#pragma once
#ifndef CREATEOBJECT_HPP
#define CREATEOBJECT_HPP
#include "common/object.hpp"
#include <optional>
#include <string>
#include <vector>

// 工厂方法，创建后端返回的 DetectionBox 以及路由层使用的 Candidate / NormalizedResult
namespace object
{
    DetectionBox createSegmentationBox(float left, float top, float right, float bottom, const cv::Mat &mask, float score, int class_id, const std::string &class_name);

    // mask 会被二值化为 0/1 并重新计算紧致框和面积; 没有前景像素时返回 std::nullopt
    std::optional<Candidate> createCandidate(const cv::Mat &mask, float score);

    // 把后端结果放回 image_width x image_height 的整图坐标系后再生成 Candidate.
    // mask 与整图同尺寸时直接使用; 与 box 同尺寸时按 box 左上角对齐; 其余情况先缩放到 box 大小
    std::optional<Candidate> createCandidate(const DetectionBox &detection, int image_width, int image_height);

    NormalizedResult createNormalizedResult(const Candidate &candidate);
}

#endif
