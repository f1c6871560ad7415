#include "infer/mockinfer.hpp"
#include "common/createObject.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <thread>

namespace
{
    struct MockEncoderState : public EncoderState
    {
        int width = 0;
        int height = 0;
        int prompt_count = 0;

        MockEncoderState(int w, int h) : width(w), height(h) {}
    };

    MockEncoderState &mock_state(EncoderState &state)
    {
        auto *s = dynamic_cast<MockEncoderState *>(&state);
        if (!s)
        {
            throw error::BackendFailure("Encoder state was not created by the mock backend");
        }
        return *s;
    }

    cv::Mat disc_mask(int width, int height, int cx, int cy, int radius)
    {
        cv::Mat mask = cv::Mat::zeros(height, width, CV_8UC1);
        cv::circle(mask, cv::Point(cx, cy), std::max(1, radius), cv::Scalar(1), cv::FILLED);
        return mask;
    }

    // 前景为 +generation, 背景为 -generation
    cv::Mat make_logits(const cv::Mat &mask, float generation)
    {
        cv::Mat small;
        cv::resize(mask, small, cv::Size(MockInfer::kLogitsSize, MockInfer::kLogitsSize), 0, 0, cv::INTER_NEAREST);
        cv::Mat logits(small.size(), CV_32FC1, cv::Scalar(-generation));
        logits.setTo(cv::Scalar(generation), small);
        return logits;
    }

    object::DetectionBox to_detection(const cv::Mat &mask, float score, const std::string &class_name)
    {
        cv::Rect rect = cv::boundingRect(mask);
        return object::createSegmentationBox(static_cast<float>(rect.x), static_cast<float>(rect.y),
                                             static_cast<float>(rect.x + rect.width), static_cast<float>(rect.y + rect.height),
                                             mask, score, 0, class_name);
    }
}

void MockInfer::simulate_latency() const
{
    int ms = latency_ms_.load();
    if (ms > 0)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }
}

std::shared_ptr<EncoderState> MockInfer::encode_image(const cv::Mat &image)
{
    if (fail_all_)
    {
        throw error::BackendFailure("Mock backend configured to fail");
    }
    if (image.empty())
    {
        throw error::BackendFailure("Cannot encode an empty image");
    }
    ++encode_count_;
    return std::make_shared<MockEncoderState>(image.cols, image.rows);
}

InferResult MockInfer::predict_text(EncoderState &state, const std::string &prompt, float confidence_threshold)
{
    if (fail_all_)
    {
        throw error::BackendFailure("Mock backend configured to fail");
    }
    auto &s = mock_state(state);
    simulate_latency();
    s.prompt_count++;

    InferResult result;
    const float score = 0.95f;
    if (prompt.empty() || score < confidence_threshold)
    {
        return result;
    }
    int radius = std::min(s.width, s.height) / 4;
    cv::Mat mask = disc_mask(s.width, s.height, s.width / 2, s.height / 2, radius);
    result.emplace_back(to_detection(mask, score, prompt));
    return result;
}

PointPrediction MockInfer::predict_points(EncoderState &state,
                                          const std::vector<PointPrompt> &points,
                                          const std::optional<cv::Mat> &mask_input,
                                          bool multimask)
{
    ++point_call_count_;
    {
        std::lock_guard<std::mutex> lock(call_lock_);
        last_point_call_.num_points = static_cast<int>(points.size());
        last_point_call_.had_mask_input = mask_input.has_value();
        last_point_call_.multimask = multimask;
        last_point_call_.mask_input_generation = mask_input ? logits_generation(*mask_input) : 0.0f;
    }

    if (fail_all_ || fail_point_prediction_)
    {
        throw error::BackendFailure("Mock point prediction configured to fail");
    }
    if (points.empty())
    {
        throw error::BackendFailure("predict_points called without points");
    }
    auto &s = mock_state(state);
    simulate_latency();
    s.prompt_count++;

    // 以第一个正样本点为圆心, 没有正样本时用第一个点
    auto center_it = std::find_if(points.begin(), points.end(), [](const PointPrompt &p) { return p.label == 1; });
    const PointPrompt &center = (center_it != points.end()) ? *center_it : points.front();
    int radius = std::max(1, std::min(s.width, s.height) / 8);
    float generation = mask_input ? logits_generation(*mask_input) + 1.0f : 1.0f;

    std::vector<std::pair<int, float>> proposals;
    if (multimask)
        proposals = {{std::max(1, radius / 2), 0.75f}, {radius, 0.92f}, {radius * 3 / 2, 0.60f}};
    else
        proposals = {{radius, 0.95f}};

    PointPrediction prediction;
    for (const auto &proposal : proposals)
    {
        cv::Mat mask = disc_mask(s.width, s.height, static_cast<int>(center.x), static_cast<int>(center.y), proposal.first);
        // 负样本点挖掉一个小圆
        for (const auto &p : points)
        {
            if (p.label == 0)
            {
                cv::circle(mask, cv::Point(static_cast<int>(p.x), static_cast<int>(p.y)),
                           std::max(1, radius / 4), cv::Scalar(0), cv::FILLED);
            }
        }
        prediction.logits.push_back(make_logits(mask, generation));
        prediction.masks.push_back(mask);
        prediction.scores.push_back(proposal.second);
    }
    return prediction;
}

InferResult MockInfer::predict_geometric(EncoderState &state,
                                         const std::vector<GeometricPrompt> &boxes,
                                         float confidence_threshold)
{
    if (fail_all_)
    {
        throw error::BackendFailure("Mock backend configured to fail");
    }
    ++geometric_call_count_;
    auto &s = mock_state(state);
    simulate_latency();
    s.prompt_count += static_cast<int>(boxes.size());

    auto to_rect = [&s](const GeometricPrompt &g) {
        float cx = g.box[0] * s.width, cy = g.box[1] * s.height;
        float w = g.box[2] * s.width, h = g.box[3] * s.height;
        cv::Rect rect(cv::Point(static_cast<int>(cx - w / 2), static_cast<int>(cy - h / 2)),
                      cv::Point(static_cast<int>(cx + w / 2), static_cast<int>(cy + h / 2)));
        return rect & cv::Rect(0, 0, s.width, s.height);
    };

    InferResult result;
    const float score = 0.9f;
    if (score < confidence_threshold)
    {
        return result;
    }

    std::vector<cv::Mat> masks;
    for (const auto &g : boxes)
    {
        if (!g.label) continue;
        cv::Rect rect = to_rect(g);
        if (rect.area() <= 0) continue;
        cv::Mat mask = cv::Mat::zeros(s.height, s.width, CV_8UC1);
        cv::Point center(rect.x + rect.width / 2, rect.y + rect.height / 2);
        cv::Size axes(std::max(1, rect.width / 2), std::max(1, rect.height / 2));
        cv::ellipse(mask, center, axes, 0, 0, 360, cv::Scalar(1), cv::FILLED);
        masks.push_back(mask);
    }
    for (const auto &g : boxes)
    {
        if (g.label) continue;
        cv::Rect rect = to_rect(g);
        if (rect.area() <= 0) continue;
        for (auto &mask : masks)
        {
            mask(rect).setTo(cv::Scalar(0));
        }
    }
    for (const auto &mask : masks)
    {
        if (cv::countNonZero(mask) == 0) continue;
        result.emplace_back(to_detection(mask, score, "visual"));
    }
    return result;
}

void MockInfer::reset_prompts(EncoderState &state)
{
    auto &s = mock_state(state);
    s.prompt_count = 0;
    INFOD("Mock backend prompts reset");
}

MockInfer::PointCall MockInfer::last_point_call() const
{
    std::lock_guard<std::mutex> lock(call_lock_);
    return last_point_call_;
}

float MockInfer::logits_generation(const cv::Mat &logits)
{
    if (logits.empty()) return 0.0f;
    double max_value = 0.0;
    cv::minMaxLoc(logits, nullptr, &max_value, nullptr, nullptr);
    return static_cast<float>(max_value);
}
