#include "session/session_store.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace session
{
    ImageSession::ImageSession(const std::string &image_id, const cv::Mat &image)
        : image_id_(image_id), image_(image.clone())
    {
    }

    SessionGuard::SessionGuard(std::shared_ptr<ImageSession> session)
        : session_(std::move(session))
    {
        std::unique_lock<std::mutex> lock(session_->mutex_);
        const uint64_t ticket = session_->next_ticket_++;
        session_->cv_.wait(lock, [this, ticket] { return session_->now_serving_ == ticket; });
    }

    SessionGuard::SessionGuard(SessionGuard &&other) noexcept
        : session_(std::move(other.session_))
    {
    }

    SessionGuard::~SessionGuard()
    {
        if (!session_) return;
        {
            std::lock_guard<std::mutex> lock(session_->mutex_);
            session_->now_serving_++;
        }
        session_->cv_.notify_all();
    }

    SessionStore::SessionStore(std::shared_ptr<SegmentationBackend> backend)
        : backend_(std::move(backend))
    {
        if (!backend_)
        {
            throw std::invalid_argument("SessionStore requires a segmentation backend");
        }
    }

    void SessionStore::register_image(const std::string &image_id, const cv::Mat &image)
    {
        if (image_id.empty())
        {
            throw error::MalformedInput("image_id must not be empty");
        }
        if (image.empty())
        {
            throw error::MalformedInput("Image " + image_id + " is empty");
        }

        // 拷贝在锁外完成
        auto session = std::make_shared<ImageSession>(image_id, image);
        bool replaced = false;
        {
            std::unique_lock<std::shared_mutex> lock(map_lock_);
            auto it = sessions_.find(image_id);
            replaced = it != sessions_.end();
            sessions_[image_id] = std::move(session);
        }
        INFO("[register_image] %s image %s, size=(%dx%d), encoding deferred",
             replaced ? "Re-registered" : "Registered", image_id.c_str(), image.cols, image.rows);
    }

    bool SessionStore::remove_image(const std::string &image_id)
    {
        std::unique_lock<std::shared_mutex> lock(map_lock_);
        return sessions_.erase(image_id) > 0;
    }

    bool SessionStore::contains(const std::string &image_id) const
    {
        std::shared_lock<std::shared_mutex> lock(map_lock_);
        return sessions_.count(image_id) > 0;
    }

    size_t SessionStore::size() const
    {
        std::shared_lock<std::shared_mutex> lock(map_lock_);
        return sessions_.size();
    }

    std::vector<std::string> SessionStore::image_ids() const
    {
        std::vector<std::string> ids;
        {
            std::shared_lock<std::shared_mutex> lock(map_lock_);
            ids.reserve(sessions_.size());
            for (const auto &item : sessions_)
                ids.push_back(item.first);
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    std::shared_ptr<ImageSession> SessionStore::find(const std::string &image_id) const
    {
        std::shared_lock<std::shared_mutex> lock(map_lock_);
        auto it = sessions_.find(image_id);
        if (it == sessions_.end())
        {
            throw error::NotFound("Image " + image_id + " not found. Please upload first.");
        }
        return it->second;
    }

    ImageInfo SessionStore::image_info(const std::string &image_id) const
    {
        auto session = find(image_id);
        return ImageInfo{session->image_id(), session->width(), session->height()};
    }

    cv::Mat SessionStore::image(const std::string &image_id) const
    {
        return find(image_id)->image();
    }

    SessionGuard SessionStore::lock(const std::string &image_id) const
    {
        return SessionGuard(find(image_id));
    }

    std::shared_ptr<EncoderState> SessionStore::get_or_init_encoder_state(SessionGuard &guard)
    {
        ImageSession &s = guard.session();
        if (!s.encoder_state_)
        {
            auto state = backend_->encode_image(s.image());
            if (!state)
            {
                throw error::BackendFailure("Backend " + backend_->name() + " returned no encoder state for image " + s.image_id());
            }
            s.encoder_state_ = std::move(state);
            INFO("[encode_image] Encoded image %s with backend %s", s.image_id().c_str(), backend_->name().c_str());
        }
        return s.encoder_state_;
    }

    std::optional<cv::Mat> SessionStore::get_refinement_logits(SessionGuard &guard) const
    {
        const auto &logits = guard.session().refinement_logits_;
        if (!logits.has_value()) return std::nullopt;
        return logits->clone();
    }

    void SessionStore::set_refinement_logits(SessionGuard &guard, const cv::Mat &logits)
    {
        guard.session().refinement_logits_ = logits.clone();
    }

    bool SessionStore::clear_refinement_logits(SessionGuard &guard)
    {
        auto &logits = guard.session().refinement_logits_;
        if (!logits.has_value()) return false;
        logits.reset();
        return true;
    }

    void SessionStore::reset_all_prompts(SessionGuard &guard)
    {
        ImageSession &s = guard.session();
        // 还没有编码过说明没有累积任何提示
        if (s.encoder_state_)
        {
            backend_->reset_prompts(*s.encoder_state_);
        }
    }

    std::shared_ptr<EncoderState> SessionStore::get_or_init_encoder_state(const std::string &image_id)
    {
        auto guard = lock(image_id);
        return get_or_init_encoder_state(guard);
    }

    std::optional<cv::Mat> SessionStore::get_refinement_logits(const std::string &image_id)
    {
        auto guard = lock(image_id);
        return get_refinement_logits(guard);
    }

    void SessionStore::set_refinement_logits(const std::string &image_id, const cv::Mat &logits)
    {
        auto guard = lock(image_id);
        set_refinement_logits(guard, logits);
    }

    bool SessionStore::clear_refinement_logits(const std::string &image_id)
    {
        auto guard = lock(image_id);
        return clear_refinement_logits(guard);
    }

    void SessionStore::reset_all_prompts(const std::string &image_id)
    {
        auto guard = lock(image_id);
        reset_all_prompts(guard);
    }

} // namespace session
