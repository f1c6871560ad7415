#include "common/object.hpp"
#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

namespace object
{
    // Box 的构造函数实现
    Box::Box(float l, float t, float r, float b)
        : left(l), top(t), right(r), bottom(b) {}

    // Box 的输出流操作符重载，用于打印
    std::ostream &operator<<(std::ostream &os, const Box &box) {
        os << "{ \"left\": " << box.left
           << ", \"top\": " << box.top
           << ", \"right\": " << box.right
           << ", \"bottom\": " << box.bottom
           << " }";
        return os;
    }

    Segmentation::Segmentation(const Segmentation& other)
        : mask(other.mask.clone())
    {
    }

    Segmentation& Segmentation::operator=(const Segmentation& other)
    {
        if (this == &other) {
            return *this;
        }
        this->mask = other.mask.clone();
        return *this;
    }

    Segmentation Segmentation::align_to_left_top(int left, int top, int width, int height) const
    {
        object::Segmentation aligned_seg;
        if (mask.empty() || width <= 0 || height <= 0) return aligned_seg;
        cv::Mat aligned_mask = cv::Mat::zeros(height, width, mask.type());
        // 计算放置位置, 左上角落在图外时裁掉 mask 对应的部分
        int x_offset = std::max(0, left);
        int y_offset = std::max(0, top);
        int src_x = std::max(0, -left);
        int src_y = std::max(0, -top);
        // 计算原mask在新mask中的有效区域
        int copy_width = std::min(mask.cols - src_x, width - x_offset);
        int copy_height = std::min(mask.rows - src_y, height - y_offset);
        if (copy_width > 0 && copy_height > 0) {
            cv::Rect src_roi(src_x, src_y, copy_width, copy_height);
            cv::Rect dst_roi(x_offset, y_offset, copy_width, copy_height);
            mask(src_roi).copyTo(aligned_mask(dst_roi));
        }
        aligned_seg.mask = aligned_mask;
        return aligned_seg;
    }

    std::ostream &operator<<(std::ostream &os, const NormalizedResult &result) {
        os << "{ \"score\": " << result.score
           << ", \"box\": " << result.box
           << ", \"area\": " << result.area
           << ", \"mask_rle\": { \"runs\": " << result.mask_rle.counts.size()
           << ", \"size\": [" << result.mask_rle.height << ", " << result.mask_rle.width << "] }"
           << " }";
        return os;
    }

    void to_json(nlohmann::json &j, const NormalizedResult &result)
    {
        j = nlohmann::json{
            {"mask_rle", result.mask_rle},
            {"box", {result.box.left, result.box.top, result.box.right, result.box.bottom}},
            {"score", result.score},
            {"area", result.area}};
    }

} // namespace object
