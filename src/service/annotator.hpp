#ifndef ANNOTATOR_HPP__
#define ANNOTATOR_HPP__

#include "common/config.hpp"
#include "export/coco_export.hpp"
#include "infer/infer.hpp"
#include "prompt/prompt_router.hpp"
#include "session/session_store.hpp"
#include <opencv2/core.hpp>
#include <memory>
#include <string>
#include <vector>

// 对调用方暴露的全部操作, 与传输层无关. Python 绑定和 demo 都只通过这个类访问
class Annotator
{
public:
    // 按配置创建后端; 后端类型未知时返回 nullptr
    static std::shared_ptr<Annotator> create_instance(const config::AnnotatorConfig &config);

    // 使用外部提供的后端
    Annotator(const config::AnnotatorConfig &config, std::shared_ptr<SegmentationBackend> backend);
    virtual ~Annotator() = default;

    // ---- 图片 ----
    // image_id 为空时生成一个 32 位十六进制 id; 返回实际使用的 id
    std::string register_image(const std::string &image_id, const cv::Mat &image);
    std::string register_image_file(const std::string &image_id, const std::string &path);
    std::string register_image_bytes(const std::string &image_id, const std::vector<uint8_t> &bytes);

    session::ImageInfo image_info(const std::string &image_id) const;
    std::vector<std::string> image_ids() const;
    bool remove_image(const std::string &image_id);

    // ---- 提示 ----
    object::NormalizedResultArray segment(const std::string &image_id, const prompt::Prompt &prompt,
                                          const prompt::PromptOptions &options = {});

    // 以下便捷接口的阈值小于 0 时使用配置中的默认值
    object::NormalizedResultArray segment_text(const std::string &image_id, const std::string &text,
                                               float confidence_threshold = -1.0f);
    object::NormalizedResultArray segment_points(const std::string &image_id, const std::vector<PointPrompt> &points,
                                                 bool reset_mask = false, float confidence_threshold = -1.0f);
    object::NormalizedResultArray segment_box(const std::string &image_id, float x1, float y1, float x2, float y2,
                                              bool label = true, float confidence_threshold = -1.0f);
    object::NormalizedResultArray segment_template(const std::string &image_id, const std::string &source_image_id,
                                                   float x1, float y1, float x2, float y2,
                                                   float confidence_threshold = -1.0f);

    bool reset_mask_state(const std::string &image_id);
    void reset_prompts(const std::string &image_id);

    // ---- 导出 ----
    coco::ExportResult export_annotations(const coco::ExportRequest &request) const;
    coco::ExportResult export_annotations(const coco::ExportRequest &request, coco::Format format) const;
    coco::ValidationReport validate_export(const coco::ExportRequest &request) const;

    // path 为空时使用配置中的 export.output_path, 返回实际写入的路径
    std::string write_export(const coco::ExportResult &result, const std::string &path = "") const;

    const config::AnnotatorConfig &config() const { return config_; }
    std::shared_ptr<SegmentationBackend> backend() const { return backend_; }

private:
    coco::ExportOptions export_options() const;
    float threshold_or_default(float confidence_threshold) const;

    config::AnnotatorConfig config_;
    std::shared_ptr<SegmentationBackend> backend_;
    std::shared_ptr<session::SessionStore> store_;
    std::unique_ptr<prompt::PromptRouter> router_;
};

// 32 个十六进制字符的随机 id
std::string generate_image_id();

#endif // ANNOTATOR_HPP__
