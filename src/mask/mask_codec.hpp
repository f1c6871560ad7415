#ifndef MASK_CODEC_HPP__
#define MASK_CODEC_HPP__

#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <ostream>
#include <utility>
#include <vector>

namespace mask
{
    // 行优先展开的游程编码, counts 交替表示 0 / 1 的长度, 第一个 run 一定是背景
    // (第 0 个像素是前景时第一个 count 为 0)
    struct Rle
    {
        std::vector<int> counts;
        int height = 0;
        int width = 0;

        Rle() = default;
        Rle(std::vector<int> c, int h, int w) : counts(std::move(c)), height(h), width(w) {}

        bool operator==(const Rle &other) const
        {
            return height == other.height && width == other.width && counts == other.counts;
        }
        bool operator!=(const Rle &other) const { return !(*this == other); }

        friend std::ostream &operator<<(std::ostream &os, const Rle &rle);
    };

    // mask: 单通道, 非 0 即前景. 输出尺寸为 [mask.rows, mask.cols]
    Rle encode(const cv::Mat &mask);

    // 返回 CV_8UC1, 前景为 1, 背景为 0
    cv::Mat decode(const Rle &rle);

    // counts 之和必须等于 height * width, count 不能为负, 尺寸必须为正
    // 失败抛出 error::MalformedRle
    void validate(const Rle &rle);

    // 前景像素数
    int64_t area(const Rle &rle);

    // 不解码整张 mask, 直接由 run 计算 [x, y, width, height], 空 mask 返回全 0
    std::array<int, 4> to_bbox(const Rle &rle);

    // {"counts": [...], "size": [h, w]}
    void to_json(nlohmann::json &j, const Rle &rle);
    // counts 必须都是整数, size 必须是两个整数, 否则抛出 error::MalformedRle
    void from_json(const nlohmann::json &j, Rle &rle);

} // namespace mask

#endif // MASK_CODEC_HPP__
