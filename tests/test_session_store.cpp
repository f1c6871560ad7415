#include "session/session_store.hpp"
#include "infer/mockinfer.hpp"
#include "common/error.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

namespace
{
    cv::Mat make_image(int width, int height)
    {
        return cv::Mat(height, width, CV_8UC3, cv::Scalar(10, 20, 30));
    }

    class SessionStoreTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            backend = std::make_shared<MockInfer>();
            store = std::make_shared<session::SessionStore>(backend);
        }

        std::shared_ptr<MockInfer> backend;
        std::shared_ptr<session::SessionStore> store;
    };
}

TEST(SessionStore, RequiresBackend)
{
    EXPECT_THROW(session::SessionStore(nullptr), std::invalid_argument);
}

TEST_F(SessionStoreTest, RegisterAndLookup)
{
    store->register_image("img1", make_image(64, 48));
    EXPECT_TRUE(store->contains("img1"));
    EXPECT_EQ(store->size(), 1u);

    auto info = store->image_info("img1");
    EXPECT_EQ(info.id, "img1");
    EXPECT_EQ(info.width, 64);
    EXPECT_EQ(info.height, 48);
    // 注册不会触发编码
    EXPECT_EQ(backend->encode_count(), 0);
}

TEST_F(SessionStoreTest, RegisterRejectsInvalidInput)
{
    EXPECT_THROW(store->register_image("", make_image(8, 8)), error::MalformedInput);
    EXPECT_THROW(store->register_image("img", cv::Mat()), error::MalformedInput);
}

TEST_F(SessionStoreTest, UnknownImageIsNotFound)
{
    EXPECT_THROW(store->image_info("missing"), error::NotFound);
    EXPECT_THROW(store->get_or_init_encoder_state("missing"), error::NotFound);
    EXPECT_THROW(store->clear_refinement_logits("missing"), error::NotFound);
    try
    {
        store->lock("missing");
        FAIL() << "expected NotFound";
    }
    catch (const error::NotFound &e)
    {
        EXPECT_STREQ(e.what(), "Image missing not found. Please upload first.");
    }
}

TEST_F(SessionStoreTest, StoresDeepCopy)
{
    cv::Mat img = make_image(16, 16);
    store->register_image("img", img);
    img.setTo(cv::Scalar(255, 255, 255));
    EXPECT_TRUE(store->image("img").at<cv::Vec3b>(0, 0) == cv::Vec3b(10, 20, 30));
}

TEST_F(SessionStoreTest, EncoderStateCreatedOnce)
{
    store->register_image("img", make_image(32, 32));
    auto first = store->get_or_init_encoder_state("img");
    auto second = store->get_or_init_encoder_state("img");
    EXPECT_EQ(first, second);
    EXPECT_EQ(backend->encode_count(), 1);
}

TEST_F(SessionStoreTest, EncoderFailurePropagates)
{
    store->register_image("img", make_image(32, 32));
    backend->set_fail_all(true);
    EXPECT_THROW(store->get_or_init_encoder_state("img"), error::BackendFailure);
    backend->set_fail_all(false);
    EXPECT_NO_THROW(store->get_or_init_encoder_state("img"));
}

TEST_F(SessionStoreTest, RefinementLogitsLifecycle)
{
    store->register_image("img", make_image(32, 32));
    EXPECT_FALSE(store->get_refinement_logits("img").has_value());
    EXPECT_FALSE(store->clear_refinement_logits("img"));

    cv::Mat logits(8, 8, CV_32FC1, cv::Scalar(2.0f));
    store->set_refinement_logits("img", logits);
    // 存的是拷贝
    logits.setTo(cv::Scalar(-1.0f));
    auto stored = store->get_refinement_logits("img");
    ASSERT_TRUE(stored.has_value());
    EXPECT_FLOAT_EQ(stored->at<float>(0, 0), 2.0f);

    EXPECT_TRUE(store->clear_refinement_logits("img"));
    EXPECT_FALSE(store->get_refinement_logits("img").has_value());
}

TEST_F(SessionStoreTest, ReRegisterDropsState)
{
    store->register_image("img", make_image(32, 32));
    store->get_or_init_encoder_state("img");
    store->set_refinement_logits("img", cv::Mat(8, 8, CV_32FC1, cv::Scalar(1.0f)));

    store->register_image("img", make_image(40, 20));
    EXPECT_FALSE(store->get_refinement_logits("img").has_value());
    EXPECT_EQ(store->image_info("img").width, 40);
    store->get_or_init_encoder_state("img");
    EXPECT_EQ(backend->encode_count(), 2);
}

TEST_F(SessionStoreTest, ResetAllPromptsWithoutStateIsNoop)
{
    store->register_image("img", make_image(32, 32));
    EXPECT_NO_THROW(store->reset_all_prompts("img"));
    EXPECT_EQ(backend->encode_count(), 0);

    store->set_refinement_logits("img", cv::Mat(8, 8, CV_32FC1, cv::Scalar(1.0f)));
    store->get_or_init_encoder_state("img");
    store->reset_all_prompts("img");
    // 与 logits 无关
    EXPECT_TRUE(store->get_refinement_logits("img").has_value());
}

TEST_F(SessionStoreTest, RemoveAndList)
{
    store->register_image("b", make_image(8, 8));
    store->register_image("a", make_image(8, 8));
    store->register_image("c", make_image(8, 8));
    EXPECT_EQ(store->image_ids(), (std::vector<std::string>{"a", "b", "c"}));

    EXPECT_TRUE(store->remove_image("b"));
    EXPECT_FALSE(store->remove_image("b"));
    EXPECT_FALSE(store->contains("b"));
    EXPECT_EQ(store->size(), 2u);
}

TEST_F(SessionStoreTest, LockServesWaitersInArrivalOrder)
{
    store->register_image("img", make_image(8, 8));

    std::mutex order_lock;
    std::vector<int> order;
    std::vector<std::thread> threads;
    {
        auto guard = store->lock("img");
        for (int i = 0; i < 5; ++i)
        {
            threads.emplace_back([&, i] {
                auto g = store->lock("img");
                std::lock_guard<std::mutex> lock(order_lock);
                order.push_back(i);
            });
            // 让每个线程在下一个线程之前领到票据
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
        }
    }
    for (auto &t : threads)
        t.join();
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(SessionStoreTest, DifferentImagesDoNotBlockEachOther)
{
    store->register_image("a", make_image(8, 8));
    store->register_image("b", make_image(8, 8));

    auto guard_a = store->lock("a");
    std::atomic<bool> done{false};
    std::thread t([&] {
        auto guard_b = store->lock("b");
        done = true;
    });
    t.join();
    EXPECT_TRUE(done);
}

TEST_F(SessionStoreTest, GuardMoveKeepsOwnership)
{
    store->register_image("img", make_image(8, 8));
    {
        auto guard = store->lock("img");
        session::SessionGuard moved(std::move(guard));
        EXPECT_EQ(moved.session().image_id(), "img");
    }
    // 移动后只释放一次, 之后仍然可以加锁
    auto again = store->lock("img");
    EXPECT_EQ(again.session().width(), 8);
}
