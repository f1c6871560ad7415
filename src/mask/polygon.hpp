#ifndef POLYGON_HPP__
#define POLYGON_HPP__

#include "mask/mask_codec.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace mask
{
    // 扁平坐标 [x1, y1, x2, y2, ...]
    using Polygon = std::vector<float>;
    using PolygonArray = std::vector<Polygon>;

    // 一个多边形至少 3 个顶点, 即 6 个坐标值
    constexpr int kMinPolygonVertices = 3;
    constexpr int kMinPolygonCoords   = 2 * kMinPolygonVertices;

    // 只提取前景连通域的外轮廓 (不表示孔洞), 用 Douglas-Peucker 在 simplify_tolerance 像素内简化.
    // 简化后不足 3 个顶点的轮廓被丢弃; 多个不相连的区域输出多个多边形.
    // 没有可用轮廓时返回空列表, 不抛异常.
    PolygonArray mask_to_polygons(const cv::Mat &mask, double simplify_tolerance = 1.0);

    // mask_to_polygons(decode(rle)), RLE 非法时抛出 error::MalformedRle
    PolygonArray rle_to_polygons(const Rle &rle, double simplify_tolerance = 1.0);

    // 反向: 扫描线填充多边形得到 CV_8UC1 (0 / 1), 少于 3 个顶点的多边形忽略
    cv::Mat polygons_to_mask(const PolygonArray &polygons, int height, int width);

    Rle polygons_to_rle(const PolygonArray &polygons, int height, int width);

} // namespace mask

#endif // POLYGON_HPP__
