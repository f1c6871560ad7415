#ifndef PROMPT_ROUTER_HPP__
#define PROMPT_ROUTER_HPP__

#include "infer/infer.hpp"
#include "session/session_store.hpp"
#include "common/config.hpp"
#include "common/object.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace prompt
{
    struct TextPrompt
    {
        std::string text;
        float confidence_threshold = 0.5f;
    };

    struct PointsPrompt
    {
        std::vector<PointPrompt> points;
        float confidence_threshold = 0.5f;
        // true 时丢弃之前缓存的 logits, 从头开始一个新的 mask
        bool reset_mask = false;
    };

    struct BoxPrompt
    {
        float x1 = 0.0f, y1 = 0.0f, x2 = 0.0f, y2 = 0.0f;
        bool label = true;
        float confidence_threshold = 0.5f;
    };

    // 以另一张已注册图片中的框作为视觉样例
    struct TemplatePrompt
    {
        std::string source_image_id;
        float x1 = 0.0f, y1 = 0.0f, x2 = 0.0f, y2 = 0.0f;
        float confidence_threshold = 0.5f;
    };

    using Prompt = std::variant<TextPrompt, PointsPrompt, BoxPrompt, TemplatePrompt>;

    class CancelToken
    {
    public:
        void cancel() { cancelled_ = true; }
        bool cancelled() const { return cancelled_.load(); }

    private:
        std::atomic<bool> cancelled_{false};
    };

    struct PromptOptions
    {
        std::shared_ptr<CancelToken> cancel;
        // 0 表示使用路由器的默认超时
        std::chrono::milliseconds timeout{0};
    };

    // 保留 score >= threshold 的候选, 以及无论分数多少都保留的最高分候选; 按分数降序
    object::CandidateArray filter_candidates(object::CandidateArray candidates, float confidence_threshold);

    // 把一个提示分发到后端并维护每张图的细化状态:
    //   Idle     -- 多点预测 -->           Refining (缓存 logits)
    //   Refining -- reset_mask / 显式重置 --> Idle
    //   Refining -- 点预测 -->             Refining (用缓存的 logits 作为输入, 并更新)
    // 同一张图的请求在 session 的票据锁内按到达顺序执行, 取消或超时的请求不会修改缓存的 logits
    class PromptRouter
    {
    public:
        PromptRouter(std::shared_ptr<session::SessionStore> store,
                     std::shared_ptr<SegmentationBackend> backend,
                     const config::PromptConfig &config,
                     std::chrono::milliseconds default_timeout = std::chrono::milliseconds(0));

        object::NormalizedResultArray run(const std::string &image_id, const Prompt &prompt, const PromptOptions &options = {});

        object::NormalizedResultArray segment_text(const std::string &image_id, const TextPrompt &prompt, const PromptOptions &options = {});
        object::NormalizedResultArray segment_points(const std::string &image_id, const PointsPrompt &prompt, const PromptOptions &options = {});
        object::NormalizedResultArray segment_box(const std::string &image_id, const BoxPrompt &prompt, const PromptOptions &options = {});
        object::NormalizedResultArray segment_template(const std::string &image_id, const TemplatePrompt &prompt, const PromptOptions &options = {});

        // 清除细化用的 logits, 返回是否真的清除了
        bool reset_mask_state(const std::string &image_id);

        // 清除后端状态中累积的提示, 与 logits 无关
        void reset_prompts(const std::string &image_id);

    private:
        template <typename Fn>
        auto call_backend(const char *tag, const PromptOptions &options, Fn &&fn) -> decltype(fn());

        object::NormalizedResultArray segment_points_geometric(session::SessionGuard &guard,
                                                               EncoderState &state,
                                                               const PointsPrompt &prompt,
                                                               const PromptOptions &options);

        object::NormalizedResultArray normalize(const InferResult &detections, int image_width, int image_height) const;

        std::shared_ptr<session::SessionStore> store_;
        std::shared_ptr<SegmentationBackend> backend_;
        config::PromptConfig config_;
        std::chrono::milliseconds default_timeout_;
    };

} // namespace prompt

#endif // PROMPT_ROUTER_HPP__
