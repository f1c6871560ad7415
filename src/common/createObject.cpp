#include "common/createObject.hpp"
#include "common/object.hpp"
#include "common/logger.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace
{
    // 8 位 mask 非 0 为前景, 浮点 mask (logits) 大于 0 为前景; 输出 CV_8UC1 0/1
    cv::Mat binarize(const cv::Mat &mask)
    {
        cv::Mat binary;
        if (mask.depth() == CV_32F || mask.depth() == CV_64F)
            binary = (mask > 0);
        else
            binary = (mask != 0);
        binary.setTo(1, binary);
        return binary;
    }

}

namespace object
{
    DetectionBox createSegmentationBox(float left, float top, float right, float bottom, const cv::Mat &mask, float score, int class_id, const std::string &class_name)
    {
        DetectionBox box;
        box.box = Box(left, top, right, bottom);
        box.score = score;
        box.class_id = class_id;
        box.class_name = class_name;
        box.segmentation.emplace();
        box.segmentation->mask = mask.clone();
        return box;
    }

    std::optional<Candidate> createCandidate(const cv::Mat &mask, float score)
    {
        if (mask.empty() || mask.channels() != 1) return std::nullopt;

        Candidate candidate;
        candidate.binary_mask = binarize(mask);
        candidate.area = cv::countNonZero(candidate.binary_mask);
        if (candidate.area == 0) return std::nullopt;

        cv::Rect rect = cv::boundingRect(candidate.binary_mask);
        candidate.box = Box(static_cast<float>(rect.x), static_cast<float>(rect.y),
                            static_cast<float>(rect.x + rect.width), static_cast<float>(rect.y + rect.height));
        candidate.score = std::min(1.0f, std::max(0.0f, score));
        return candidate;
    }

    std::optional<Candidate> createCandidate(const DetectionBox &detection, int image_width, int image_height)
    {
        if (!detection.segmentation.has_value() || detection.segmentation->mask.empty())
        {
            INFOW("Detection %s has no mask, dropped", detection.class_name.c_str());
            return std::nullopt;
        }

        const cv::Mat &mask = detection.segmentation->mask;
        if (mask.cols == image_width && mask.rows == image_height)
        {
            return createCandidate(mask, detection.score);
        }

        // 局部 mask: 对齐到 box 的左上角
        int left = static_cast<int>(std::floor(detection.box.left));
        int top = static_cast<int>(std::floor(detection.box.top));
        int box_width = std::max(1, static_cast<int>(std::lround(detection.box.width())));
        int box_height = std::max(1, static_cast<int>(std::lround(detection.box.height())));

        Segmentation local;
        if (mask.cols == box_width && mask.rows == box_height)
        {
            local.mask = mask;
        }
        else
        {
            cv::resize(mask, local.mask, cv::Size(box_width, box_height), 0, 0, cv::INTER_NEAREST);
        }
        Segmentation aligned = local.align_to_left_top(left, top, image_width, image_height);
        return createCandidate(aligned.mask, detection.score);
    }

    NormalizedResult createNormalizedResult(const Candidate &candidate)
    {
        NormalizedResult result;
        result.mask_rle = mask::encode(candidate.binary_mask);
        result.box = candidate.box;
        result.score = candidate.score;
        result.area = candidate.area;
        return result;
    }
}
