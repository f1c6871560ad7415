#include "prompt/prompt_router.hpp"
#include "common/createObject.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace prompt
{
    namespace
    {
        void check_threshold(float threshold)
        {
            if (!(threshold >= 0.0f && threshold <= 1.0f))
            {
                std::ostringstream ss;
                ss << "confidence_threshold must be in [0, 1], got " << threshold;
                throw error::MalformedInput(ss.str());
            }
        }

        void check_box(float x1, float y1, float x2, float y2)
        {
            bool finite = std::isfinite(x1) && std::isfinite(y1) && std::isfinite(x2) && std::isfinite(y2);
            if (!finite || x1 < 0 || y1 < 0 || x2 <= x1 || y2 <= y1)
            {
                std::ostringstream ss;
                ss << "Invalid box (" << x1 << ", " << y1 << ", " << x2 << ", " << y2
                   << "), expected non-negative coordinates with x2 > x1 and y2 > y1";
                throw error::MalformedInput(ss.str());
            }
        }

        void check_points(const std::vector<PointPrompt> &points, int width, int height)
        {
            if (points.empty())
            {
                throw error::MalformedInput("Point prompt requires at least one point");
            }
            for (const auto &p : points)
            {
                if (!std::isfinite(p.x) || !std::isfinite(p.y) || p.x < 0 || p.y < 0 || p.x > width || p.y > height)
                {
                    std::ostringstream ss;
                    ss << "Point (" << p.x << ", " << p.y << ") is outside the image (" << width << "x" << height << ")";
                    throw error::MalformedInput(ss.str());
                }
                if (p.label != 0 && p.label != 1)
                {
                    throw error::MalformedInput("Point label must be 0 or 1, got " + std::to_string(p.label));
                }
            }
        }

        // 像素坐标的框 -> 相对图片宽高的 {cx, cy, w, h}
        std::array<float, 4> normalize_box(float x1, float y1, float x2, float y2, int width, int height)
        {
            float w = static_cast<float>(width);
            float h = static_cast<float>(height);
            return {((x1 + x2) / 2) / w, ((y1 + y2) / 2) / h, std::fabs(x2 - x1) / w, std::fabs(y2 - y1) / h};
        }

        void sort_by_score(object::CandidateArray &candidates)
        {
            std::stable_sort(candidates.begin(), candidates.end(),
                             [](const object::Candidate &a, const object::Candidate &b) { return a.score > b.score; });
        }

        object::NormalizedResultArray to_results(const object::CandidateArray &candidates)
        {
            object::NormalizedResultArray results;
            results.reserve(candidates.size());
            for (const auto &c : candidates)
                results.push_back(object::createNormalizedResult(c));
            return results;
        }

        void check_cancel(const PromptOptions &options, const char *tag)
        {
            if (options.cancel && options.cancel->cancelled())
            {
                throw error::Cancelled(std::string(tag) + " request cancelled");
            }
        }
    }

    object::CandidateArray filter_candidates(object::CandidateArray candidates, float confidence_threshold)
    {
        if (candidates.empty()) return candidates;

        size_t best = 0;
        for (size_t i = 1; i < candidates.size(); ++i)
        {
            if (candidates[i].score > candidates[best].score)
                best = i;
        }

        object::CandidateArray kept;
        kept.reserve(candidates.size());
        for (size_t i = 0; i < candidates.size(); ++i)
        {
            if (i == best || candidates[i].score >= confidence_threshold)
                kept.push_back(std::move(candidates[i]));
        }
        sort_by_score(kept);
        return kept;
    }

    PromptRouter::PromptRouter(std::shared_ptr<session::SessionStore> store,
                               std::shared_ptr<SegmentationBackend> backend,
                               const config::PromptConfig &config,
                               std::chrono::milliseconds default_timeout)
        : store_(std::move(store)), backend_(std::move(backend)), config_(config), default_timeout_(default_timeout)
    {
        if (!store_ || !backend_)
        {
            throw std::invalid_argument("PromptRouter requires a session store and a backend");
        }
    }

    template <typename Fn>
    auto PromptRouter::call_backend(const char *tag, const PromptOptions &options, Fn &&fn) -> decltype(fn())
    {
        check_cancel(options, tag);

        auto start = std::chrono::steady_clock::now();
        auto result = [&]() {
            try
            {
                return fn();
            }
            catch (const error::BackendFailure &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                throw error::BackendFailure(std::string(tag) + " backend call failed: " + e.what());
            }
        }();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

        // 后端返回之后再检查, 已经取消或超时的结果直接丢弃
        check_cancel(options, tag);
        auto timeout = options.timeout.count() > 0 ? options.timeout : default_timeout_;
        if (timeout.count() > 0 && elapsed > timeout)
        {
            throw error::Timeout(std::string(tag) + " backend call took " + std::to_string(elapsed.count()) +
                                 " ms, exceeding the " + std::to_string(timeout.count()) + " ms timeout");
        }
        return result;
    }

    object::NormalizedResultArray PromptRouter::normalize(const InferResult &detections, int image_width, int image_height) const
    {
        object::CandidateArray candidates;
        candidates.reserve(detections.size());
        for (const auto &det : detections)
        {
            auto candidate = object::createCandidate(det, image_width, image_height);
            if (candidate)
                candidates.push_back(std::move(*candidate));
        }
        sort_by_score(candidates);
        return to_results(candidates);
    }

    object::NormalizedResultArray PromptRouter::run(const std::string &image_id, const Prompt &prompt, const PromptOptions &options)
    {
        return std::visit(
            [&](const auto &p) -> object::NormalizedResultArray {
                using T = std::decay_t<decltype(p)>;
                if constexpr (std::is_same_v<T, TextPrompt>)
                    return segment_text(image_id, p, options);
                else if constexpr (std::is_same_v<T, PointsPrompt>)
                    return segment_points(image_id, p, options);
                else if constexpr (std::is_same_v<T, BoxPrompt>)
                    return segment_box(image_id, p, options);
                else
                    return segment_template(image_id, p, options);
            },
            prompt);
    }

    object::NormalizedResultArray PromptRouter::segment_text(const std::string &image_id, const TextPrompt &prompt, const PromptOptions &options)
    {
        check_threshold(prompt.confidence_threshold);
        if (prompt.text.find_first_not_of(" \t\r\n") == std::string::npos)
        {
            throw error::MalformedInput("Text prompt must not be empty");
        }
        INFO("[segment_with_text] image_id=%s, prompt=%s", image_id.c_str(), prompt.text.c_str());

        auto guard = store_->lock(image_id);
        auto &session = guard.session();
        auto state = store_->get_or_init_encoder_state(guard);

        auto detections = call_backend("segment_with_text", options, [&] {
            return backend_->predict_text(*state, prompt.text, prompt.confidence_threshold);
        });
        auto results = normalize(detections, session.width(), session.height());
        INFO("[segment_with_text] results count: %d", static_cast<int>(results.size()));
        return results;
    }

    object::NormalizedResultArray PromptRouter::segment_points(const std::string &image_id, const PointsPrompt &prompt, const PromptOptions &options)
    {
        check_threshold(prompt.confidence_threshold);

        auto guard = store_->lock(image_id);
        auto &session = guard.session();
        check_points(prompt.points, session.width(), session.height());
        INFO("[segment_with_points] Processing %d points for image %s, size=(%dx%d)",
             static_cast<int>(prompt.points.size()), image_id.c_str(), session.width(), session.height());

        // 新标注开始, 丢弃之前的 logits
        if (prompt.reset_mask && store_->clear_refinement_logits(guard))
        {
            INFO("[segment_with_points] Reset mask logits for image %s", image_id.c_str());
        }

        auto state = store_->get_or_init_encoder_state(guard);

        if (!backend_->supports_point_refinement())
        {
            INFO("[segment_with_points] Backend %s has no point refinement, falling back to geometric prompt",
                 backend_->name().c_str());
            return segment_points_geometric(guard, *state, prompt, options);
        }

        // 多个点且有上一次的 logits 时用于细化, 并要求后端给出单一确定的结果
        std::optional<cv::Mat> mask_input;
        if (prompt.points.size() > 1)
        {
            mask_input = store_->get_refinement_logits(guard);
            if (mask_input)
                INFO("[segment_with_points] Using previous mask logits for refinement, shape: %dx%d",
                     mask_input->rows, mask_input->cols);
        }
        const bool multimask = !mask_input.has_value();

        PointPrediction prediction;
        try
        {
            prediction = call_backend("segment_with_points", options, [&] {
                auto p = backend_->predict_points(*state, prompt.points, mask_input, multimask);
                if (p.masks.size() != p.scores.size())
                {
                    throw error::BackendFailure("predict_points returned " + std::to_string(p.masks.size()) +
                                                " masks but " + std::to_string(p.scores.size()) + " scores");
                }
                return p;
            });
        }
        catch (const error::BackendFailure &e)
        {
            INFOW("[segment_with_points] predict_points failed: %s, falling back to geometric prompt", e.what());
            return segment_points_geometric(guard, *state, prompt, options);
        }
        INFO("[segment_with_points] Got %d masks", static_cast<int>(prediction.masks.size()));

        // source[k] 是 candidates[k] 在 prediction 中的下标
        object::CandidateArray candidates;
        std::vector<size_t> source;
        for (size_t i = 0; i < prediction.masks.size(); ++i)
        {
            if (prediction.masks[i].size() != session.image().size())
            {
                INFOW("[segment_with_points] Mask %d has size %dx%d, expected %dx%d, skipped", static_cast<int>(i),
                      prediction.masks[i].cols, prediction.masks[i].rows, session.width(), session.height());
                continue;
            }
            auto candidate = object::createCandidate(prediction.masks[i], prediction.scores[i]);
            if (candidate)
            {
                candidates.push_back(std::move(*candidate));
                source.push_back(i);
            }
        }

        // 只有多点预测或者用到了上一次的 logits 时才进入细化状态.
        // 缓存的是实际返回的最高分候选的 logits, 没有候选留下时不缓存
        if (!candidates.empty() && (prompt.points.size() >= 2 || mask_input.has_value()))
        {
            size_t best = 0;
            for (size_t k = 1; k < candidates.size(); ++k)
            {
                if (candidates[k].score > candidates[best].score)
                    best = k;
            }
            size_t index = source[best];
            if (index < prediction.logits.size() && !prediction.logits[index].empty())
            {
                store_->set_refinement_logits(guard, prediction.logits[index]);
                INFO("[segment_with_points] Stored mask logits of mask %d, shape: %dx%d", static_cast<int>(index),
                     prediction.logits[index].rows, prediction.logits[index].cols);
            }
        }
        candidates = filter_candidates(std::move(candidates), prompt.confidence_threshold);

        INFO("[segment_with_points] Returning %d results after filtering", static_cast<int>(candidates.size()));
        return to_results(candidates);
    }

    object::NormalizedResultArray PromptRouter::segment_points_geometric(session::SessionGuard &guard,
                                                                         EncoderState &state,
                                                                         const PointsPrompt &prompt,
                                                                         const PromptOptions &options)
    {
        auto &session = guard.session();
        const float fraction = config_.fallback_box_fraction;

        // 每个点换成以它为中心的小框, 不进入细化状态
        std::vector<GeometricPrompt> boxes;
        boxes.reserve(prompt.points.size());
        for (const auto &p : prompt.points)
        {
            std::array<float, 4> box = {p.x / session.width(), p.y / session.height(), fraction, fraction};
            boxes.emplace_back(box, p.label == 1);
            INFOD("[segment_points_geometric] Point (%.1f, %.1f) label=%d -> box=[%.4f, %.4f, %.4f, %.4f]",
                  p.x, p.y, p.label, box[0], box[1], box[2], box[3]);
        }

        auto detections = call_backend("segment_points_geometric", options, [&] {
            return backend_->predict_geometric(state, boxes, prompt.confidence_threshold);
        });
        return normalize(detections, session.width(), session.height());
    }

    object::NormalizedResultArray PromptRouter::segment_box(const std::string &image_id, const BoxPrompt &prompt, const PromptOptions &options)
    {
        check_threshold(prompt.confidence_threshold);
        check_box(prompt.x1, prompt.y1, prompt.x2, prompt.y2);

        auto guard = store_->lock(image_id);
        auto &session = guard.session();
        auto state = store_->get_or_init_encoder_state(guard);

        GeometricPrompt geometric(normalize_box(prompt.x1, prompt.y1, prompt.x2, prompt.y2, session.width(), session.height()),
                                  prompt.label);
        INFO("[segment_with_box] image_id=%s, box=[%.4f, %.4f, %.4f, %.4f], label=%d", image_id.c_str(),
             geometric.box[0], geometric.box[1], geometric.box[2], geometric.box[3], prompt.label ? 1 : 0);

        auto detections = call_backend("segment_with_box", options, [&] {
            return backend_->predict_geometric(*state, {geometric}, prompt.confidence_threshold);
        });
        return normalize(detections, session.width(), session.height());
    }

    object::NormalizedResultArray PromptRouter::segment_template(const std::string &image_id, const TemplatePrompt &prompt, const PromptOptions &options)
    {
        check_threshold(prompt.confidence_threshold);
        check_box(prompt.x1, prompt.y1, prompt.x2, prompt.y2);

        // 框按模板图自己的尺寸归一化. 原图不可变, 不需要拿模板图的锁
        session::ImageInfo source = store_->image_info(prompt.source_image_id);
        GeometricPrompt geometric(normalize_box(prompt.x1, prompt.y1, prompt.x2, prompt.y2, source.width, source.height), true);

        auto guard = store_->lock(image_id);
        auto &session = guard.session();
        auto state = store_->get_or_init_encoder_state(guard);
        INFO("[segment_with_template] image_id=%s, template=%s, box=[%.4f, %.4f, %.4f, %.4f]", image_id.c_str(),
             prompt.source_image_id.c_str(), geometric.box[0], geometric.box[1], geometric.box[2], geometric.box[3]);

        auto detections = call_backend("segment_with_template", options, [&] {
            return backend_->predict_geometric(*state, {geometric}, prompt.confidence_threshold);
        });
        return normalize(detections, session.width(), session.height());
    }

    bool PromptRouter::reset_mask_state(const std::string &image_id)
    {
        bool cleared = store_->clear_refinement_logits(image_id);
        if (cleared)
            INFO("[reset_mask_state] Cleared mask logits for image %s", image_id.c_str());
        return cleared;
    }

    void PromptRouter::reset_prompts(const std::string &image_id)
    {
        store_->reset_all_prompts(image_id);
        INFO("[reset_prompts] Prompts reset for image %s", image_id.c_str());
    }

} // namespace prompt
