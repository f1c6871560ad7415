#include "service/annotator.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <iomanip>
#include <random>
#include <sstream>

std::string generate_image_id()
{
    static thread_local std::mt19937_64 engine(std::random_device{}());
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(16) << engine() << std::setw(16) << engine();
    return ss.str();
}

std::shared_ptr<Annotator> Annotator::create_instance(const config::AnnotatorConfig &config)
{
    logger::set_log_level(logger::log_level_from_string(config.log_level));
    auto backend = load_backend(config.backend);
    if (!backend)
    {
        INFOE("Failed to create annotator, backend '%s' is not available", config.backend.type.c_str());
        return nullptr;
    }
    return std::make_shared<Annotator>(config, backend);
}

Annotator::Annotator(const config::AnnotatorConfig &config, std::shared_ptr<SegmentationBackend> backend)
    : config_(config), backend_(std::move(backend))
{
    store_ = std::make_shared<session::SessionStore>(backend_);
    router_ = std::make_unique<prompt::PromptRouter>(store_, backend_, config_.prompt,
                                                     std::chrono::milliseconds(config_.backend.timeout_ms));
    // 配置中的导出格式写错时尽早报告
    coco::format_from_string(config_.exporter.format);
}

std::string Annotator::register_image(const std::string &image_id, const cv::Mat &image)
{
    std::string id = image_id.empty() ? generate_image_id() : image_id;
    store_->register_image(id, image);
    return id;
}

std::string Annotator::register_image_file(const std::string &image_id, const std::string &path)
{
    cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
    if (image.empty())
    {
        throw error::MalformedInput("Cannot read image file " + path);
    }
    return register_image(image_id, image);
}

std::string Annotator::register_image_bytes(const std::string &image_id, const std::vector<uint8_t> &bytes)
{
    if (bytes.empty())
    {
        throw error::MalformedInput("Image data is empty");
    }
    cv::Mat image = cv::imdecode(bytes, cv::IMREAD_COLOR);
    if (image.empty())
    {
        throw error::MalformedInput("Cannot decode image data (" + std::to_string(bytes.size()) + " bytes)");
    }
    return register_image(image_id, image);
}

session::ImageInfo Annotator::image_info(const std::string &image_id) const
{
    return store_->image_info(image_id);
}

std::vector<std::string> Annotator::image_ids() const
{
    return store_->image_ids();
}

bool Annotator::remove_image(const std::string &image_id)
{
    bool removed = store_->remove_image(image_id);
    if (removed)
        INFO("[remove_image] Removed image %s", image_id.c_str());
    return removed;
}

object::NormalizedResultArray Annotator::segment(const std::string &image_id, const prompt::Prompt &prompt,
                                                 const prompt::PromptOptions &options)
{
    return router_->run(image_id, prompt, options);
}

float Annotator::threshold_or_default(float confidence_threshold) const
{
    return confidence_threshold < 0 ? config_.prompt.confidence_threshold : confidence_threshold;
}

object::NormalizedResultArray Annotator::segment_text(const std::string &image_id, const std::string &text,
                                                      float confidence_threshold)
{
    prompt::TextPrompt p;
    p.text = text;
    p.confidence_threshold = threshold_or_default(confidence_threshold);
    return router_->segment_text(image_id, p);
}

object::NormalizedResultArray Annotator::segment_points(const std::string &image_id, const std::vector<PointPrompt> &points,
                                                        bool reset_mask, float confidence_threshold)
{
    prompt::PointsPrompt p;
    p.points = points;
    p.reset_mask = reset_mask;
    p.confidence_threshold = threshold_or_default(confidence_threshold);
    return router_->segment_points(image_id, p);
}

object::NormalizedResultArray Annotator::segment_box(const std::string &image_id, float x1, float y1, float x2, float y2,
                                                     bool label, float confidence_threshold)
{
    prompt::BoxPrompt p;
    p.x1 = x1;
    p.y1 = y1;
    p.x2 = x2;
    p.y2 = y2;
    p.label = label;
    p.confidence_threshold = threshold_or_default(confidence_threshold);
    return router_->segment_box(image_id, p);
}

object::NormalizedResultArray Annotator::segment_template(const std::string &image_id, const std::string &source_image_id,
                                                          float x1, float y1, float x2, float y2,
                                                          float confidence_threshold)
{
    prompt::TemplatePrompt p;
    p.source_image_id = source_image_id;
    p.x1 = x1;
    p.y1 = y1;
    p.x2 = x2;
    p.y2 = y2;
    p.confidence_threshold = threshold_or_default(confidence_threshold);
    return router_->segment_template(image_id, p);
}

bool Annotator::reset_mask_state(const std::string &image_id)
{
    return router_->reset_mask_state(image_id);
}

void Annotator::reset_prompts(const std::string &image_id)
{
    router_->reset_prompts(image_id);
}

coco::ExportOptions Annotator::export_options() const
{
    coco::ExportOptions options;
    options.format = coco::format_from_string(config_.exporter.format);
    options.simplify_tolerance = config_.exporter.simplify_tolerance;
    options.description = config_.exporter.description;
    options.version = config_.exporter.version;
    return options;
}

coco::ExportResult Annotator::export_annotations(const coco::ExportRequest &request) const
{
    return coco::assemble(request, export_options());
}

coco::ExportResult Annotator::export_annotations(const coco::ExportRequest &request, coco::Format format) const
{
    auto options = export_options();
    options.format = format;
    return coco::assemble(request, options);
}

coco::ValidationReport Annotator::validate_export(const coco::ExportRequest &request) const
{
    auto report = coco::validate(export_annotations(request).document);
    if (!report.valid)
        INFOW("[validate_export] %d errors found", static_cast<int>(report.errors.size()));
    return report;
}

std::string Annotator::write_export(const coco::ExportResult &result, const std::string &path) const
{
    std::string target = path.empty() ? config_.exporter.output_path : path;
    coco::write_document(result.document, target);
    return target;
}
