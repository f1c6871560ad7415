#include "mask/polygon.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <string>

namespace mask
{
    PolygonArray mask_to_polygons(const cv::Mat &mask, double simplify_tolerance)
    {
        PolygonArray polygons;
        if (mask.empty()) return polygons;
        if (mask.channels() != 1)
        {
            throw error::MalformedInput("Mask must be single channel, got " + std::to_string(mask.channels()) + " channels");
        }

        // findContours 需要 CV_8UC1, 且会修改输入
        cv::Mat binary = (mask != 0);

        std::vector<std::vector<cv::Point>> contours;
        cv::findContours(binary, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_NONE);

        for (const auto &contour : contours)
        {
            std::vector<cv::Point> simplified;
            if (simplify_tolerance > 0.0)
                cv::approxPolyDP(contour, simplified, simplify_tolerance, true);
            else
                simplified = contour;

            if (static_cast<int>(simplified.size()) < kMinPolygonVertices)
                continue;

            Polygon polygon;
            polygon.reserve(simplified.size() * 2);
            for (const auto &p : simplified)
            {
                polygon.push_back(static_cast<float>(p.x));
                polygon.push_back(static_cast<float>(p.y));
            }
            if (static_cast<int>(polygon.size()) < kMinPolygonCoords)
                continue;
            polygons.emplace_back(std::move(polygon));
        }
        return polygons;
    }

    PolygonArray rle_to_polygons(const Rle &rle, double simplify_tolerance)
    {
        return mask_to_polygons(decode(rle), simplify_tolerance);
    }

    cv::Mat polygons_to_mask(const PolygonArray &polygons, int height, int width)
    {
        if (height <= 0 || width <= 0)
        {
            throw error::MalformedInput("Mask size must be positive, got [" + std::to_string(height) + ", " +
                                        std::to_string(width) + "]");
        }

        cv::Mat out = cv::Mat::zeros(height, width, CV_8UC1);
        std::vector<std::vector<cv::Point>> contours;
        for (const auto &polygon : polygons)
        {
            if (polygon.size() % 2 != 0)
            {
                throw error::MalformedInput("Polygon has an odd number of coordinates (" +
                                            std::to_string(polygon.size()) + ")");
            }
            if (static_cast<int>(polygon.size()) < kMinPolygonCoords)
            {
                INFOW("Skip polygon with %d coordinates", static_cast<int>(polygon.size()));
                continue;
            }
            std::vector<cv::Point> points;
            points.reserve(polygon.size() / 2);
            for (size_t i = 0; i < polygon.size(); i += 2)
            {
                points.emplace_back(static_cast<int>(std::lround(polygon[i])),
                                    static_cast<int>(std::lround(polygon[i + 1])));
            }
            contours.emplace_back(std::move(points));
        }
        if (!contours.empty())
        {
            cv::fillPoly(out, contours, cv::Scalar(1));
        }
        return out;
    }

    Rle polygons_to_rle(const PolygonArray &polygons, int height, int width)
    {
        return encode(polygons_to_mask(polygons, height, width));
    }

} // namespace mask
