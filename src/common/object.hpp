#ifndef OBJECT_HPP
#define OBJECT_HPP

#include "mask/mask_codec.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <ostream>
#include <optional>
#include <nlohmann/json.hpp>
#include "opencv2/core.hpp"

namespace object
{
    struct Box
    {
        float left = 0.0f;
        float top = 0.0f;
        float right = 0.0f;
        float bottom = 0.0f;

        Box() = default;
        Box(float l, float t, float r, float b);

        float width() const noexcept { return right - left; }
        float height() const noexcept { return bottom - top; }

        // COCO 的 [x, y, width, height]
        std::array<float, 4> xywh() const noexcept { return {left, top, width(), height()}; }

        friend std::ostream &operator<<(std::ostream &os, const Box &box);
    };

    struct Segmentation
    {
        cv::Mat mask;
        // 原本的 mask 是相对于 (left, top) 的局部 mask, 放回 width x height 的整图坐标系
        Segmentation align_to_left_top(int left, int top, int width, int height) const;
        Segmentation& operator=(const Segmentation& other);
        Segmentation() = default;
        Segmentation(const Segmentation& other);
    };

    // 后端直接返回的检测结果, mask 可能是整图大小, 也可能只覆盖 box 区域
    struct DetectionBox
    {
        Box box;
        float score = 0.0f;
        int class_id = -1;
        std::string class_name;

        std::optional<Segmentation> segmentation;
    };

    using DetectionBoxArray = std::vector<DetectionBox>;

    // 一个分割候选: 整图大小的二值 mask (CV_8UC1, 0/1),
    // box 是包住所有前景像素的最小框 (right / bottom 不包含), area 是前景像素数
    struct Candidate
    {
        cv::Mat binary_mask;
        float score = 0.0f;
        Box box;
        int64_t area = 0;
    };

    using CandidateArray = std::vector<Candidate>;

    // 对外可见的标注表示, mask 替换为 RLE
    struct NormalizedResult
    {
        mask::Rle mask_rle;
        Box box;
        float score = 0.0f;
        int64_t area = 0;

        friend std::ostream &operator<<(std::ostream &os, const NormalizedResult &result);
    };

    using NormalizedResultArray = std::vector<NormalizedResult>;

    // {"mask_rle": {...}, "box": [x1, y1, x2, y2], "score": s, "area": a}
    void to_json(nlohmann::json &j, const NormalizedResult &result);

} // namespace object

#endif // OBJECT_HPP
