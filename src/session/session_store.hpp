#ifndef SESSION_STORE_HPP__
#define SESSION_STORE_HPP__

#include "infer/infer.hpp"
#include <opencv2/core.hpp>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace session
{
    struct ImageInfo
    {
        std::string id;
        int width = 0;
        int height = 0;
    };

    class SessionGuard;

    // 一张注册过的图片对应的全部状态.
    // image 在构造后不再修改, 可以不加锁读取; encoder_state / refinement_logits 只能在持有 SessionGuard 时访问
    class ImageSession
    {
    public:
        ImageSession(const std::string &image_id, const cv::Mat &image);

        ImageSession(const ImageSession &) = delete;
        ImageSession &operator=(const ImageSession &) = delete;

        const std::string &image_id() const { return image_id_; }
        const cv::Mat &image() const { return image_; }
        int width() const { return image_.cols; }
        int height() const { return image_.rows; }

    private:
        friend class SessionGuard;
        friend class SessionStore;

        const std::string image_id_;
        const cv::Mat image_;

        std::shared_ptr<EncoderState> encoder_state_;
        std::optional<cv::Mat> refinement_logits_;

        // FIFO 票据锁, 同一张图的请求按到达顺序串行
        std::mutex mutex_;
        std::condition_variable cv_;
        uint64_t next_ticket_ = 0;
        uint64_t now_serving_ = 0;
    };

    // 持有某个 session 的独占访问权, 析构时释放给下一个排队的请求
    class SessionGuard
    {
    public:
        explicit SessionGuard(std::shared_ptr<ImageSession> session);
        ~SessionGuard();

        SessionGuard(SessionGuard &&other) noexcept;
        SessionGuard &operator=(SessionGuard &&) = delete;
        SessionGuard(const SessionGuard &) = delete;
        SessionGuard &operator=(const SessionGuard &) = delete;

        ImageSession &session() const { return *session_; }

    private:
        std::shared_ptr<ImageSession> session_;
    };

    // 进程内的 image_id -> session 表.
    // 表本身由读写锁保护且只在查找/插入/删除时短暂持有, 每个 session 各自一把票据锁,
    // 不同图片之间完全并行
    class SessionStore
    {
    public:
        explicit SessionStore(std::shared_ptr<SegmentationBackend> backend);

        // 保存图片的深拷贝; 已存在时覆盖 (旧 session 的编码状态和 logits 一并丢弃).
        // 不会创建 encoder_state
        void register_image(const std::string &image_id, const cv::Mat &image);

        bool remove_image(const std::string &image_id);
        bool contains(const std::string &image_id) const;
        size_t size() const;
        std::vector<std::string> image_ids() const;

        // 以下按 image_id 访问的接口在图片未注册时抛出 error::NotFound
        ImageInfo image_info(const std::string &image_id) const;

        // 不可变的原图, 不需要加锁
        cv::Mat image(const std::string &image_id) const;

        // 排队获取该图片的独占访问权
        SessionGuard lock(const std::string &image_id) const;

        std::shared_ptr<EncoderState> get_or_init_encoder_state(const std::string &image_id);
        std::optional<cv::Mat> get_refinement_logits(const std::string &image_id);
        void set_refinement_logits(const std::string &image_id, const cv::Mat &logits);
        bool clear_refinement_logits(const std::string &image_id);
        void reset_all_prompts(const std::string &image_id);

        // 已持有 guard 的版本, 供一次请求内组合多个步骤
        std::shared_ptr<EncoderState> get_or_init_encoder_state(SessionGuard &guard);
        std::optional<cv::Mat> get_refinement_logits(SessionGuard &guard) const;
        void set_refinement_logits(SessionGuard &guard, const cv::Mat &logits);
        bool clear_refinement_logits(SessionGuard &guard);
        void reset_all_prompts(SessionGuard &guard);

    private:
        std::shared_ptr<ImageSession> find(const std::string &image_id) const;

        std::shared_ptr<SegmentationBackend> backend_;

        mutable std::shared_mutex map_lock_;
        std::unordered_map<std::string, std::shared_ptr<ImageSession>> sessions_;
    };

} // namespace session

#endif // SESSION_STORE_HPP__
