#ifndef COCO_EXPORT_HPP__
#define COCO_EXPORT_HPP__

#include "mask/mask_codec.hpp"
#include "mask/polygon.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace coco
{
    // categories 的编号从 0 开始, images / annotations 从 1 开始
    constexpr int kCategoryIdBase = 0;
    constexpr int kImageIdBase = 1;
    constexpr int kAnnotationIdBase = 1;
    // 无法解析的引用
    constexpr int kInvalidId = -1;

    // ---- 调用方提供的输入 ----

    struct ImageMeta
    {
        std::string id;
        std::string file_name;   // 为空时使用 image_<n>.jpg
        int width = 0;
        int height = 0;
    };

    struct CategoryMeta
    {
        std::string id;          // 为空时使用它在列表中的下标
        std::string name;
        std::string supercategory;
    };

    struct Annotation
    {
        int64_t id = 0;
        std::string image_id;
        std::string category_id; // 数字 id 也按字符串保存
        std::string category_name;
        mask::Rle segmentation;
        std::array<float, 4> bbox = {0.0f, 0.0f, 0.0f, 0.0f};   // [x, y, width, height]
        double area = 0.0;
        float score = 0.0f;
    };

    struct ExportRequest
    {
        std::vector<ImageMeta> images;
        std::vector<CategoryMeta> categories;
        std::vector<Annotation> annotations;
    };

    enum class Format : int
    {
        Polygon = 0,
        Rle = 1
    };

    // "polygon" / "rle", 其余抛出 error::MalformedInput
    Format format_from_string(const std::string &name);
    const char *format_name(Format format);

    struct ExportOptions
    {
        Format format = Format::Polygon;
        double simplify_tolerance = 1.0;
        std::string description = "SAM3 Annotation Tool Export";
        std::string version = "1.0.0";
    };

    // ---- 输出文档 ----

    struct Info
    {
        std::string description;
        std::string version;
        int year = 0;
        std::string date_created;   // ISO 8601
    };

    struct License
    {
        int id = 1;
        std::string name = "Unknown";
        std::string url;
    };

    struct ImageRecord
    {
        int id = 0;
        std::string file_name;
        int width = 0;
        int height = 0;
    };

    struct CategoryRecord
    {
        int id = 0;
        std::string name;
        std::string supercategory;
    };

    using Segmentation = std::variant<mask::PolygonArray, mask::Rle>;

    struct AnnotationRecord
    {
        int id = 0;
        int64_t source_id = 0;   // 调用方的 id, 只用于诊断信息, 不写入 JSON
        int image_id = kInvalidId;
        int category_id = kInvalidId;
        Segmentation segmentation;
        std::array<float, 4> bbox = {0.0f, 0.0f, 0.0f, 0.0f};
        double area = 0.0;
        int iscrowd = 0;
        float score = 0.0f;
    };

    struct ExportDocument
    {
        Info info;
        std::vector<License> licenses;
        std::vector<ImageRecord> images;
        std::vector<AnnotationRecord> annotations;
        std::vector<CategoryRecord> categories;
    };

    struct ExportResult
    {
        ExportDocument document;
        std::vector<std::string> warnings;
    };

    struct ValidationSummary
    {
        size_t images = 0;
        size_t annotations = 0;
        size_t categories = 0;
    };

    struct ValidationReport
    {
        bool valid = true;
        std::vector<std::string> errors;
        ValidationSummary summary;
    };

    // 把一批标注组装成 COCO 文档. 单个标注转换失败只会被跳过并记录 warning, 不会中断整个导出
    ExportResult assemble(const std::vector<ImageMeta> &images,
                          const std::vector<CategoryMeta> &categories,
                          const std::vector<Annotation> &annotations,
                          const ExportOptions &options = {});

    inline ExportResult assemble(const ExportRequest &request, const ExportOptions &options = {})
    {
        return assemble(request.images, request.categories, request.annotations, options);
    }

    // 只读检查: 三个列表非空, 每个标注的 image_id / category_id 都能在对应列表中找到
    ValidationReport validate(const ExportDocument &document);

    // 整个文档先写到同目录下的临时文件, 成功后 rename 覆盖目标, 失败时抛出 std::runtime_error
    void write_document(const ExportDocument &document, const std::string &path, int indent = 2);

    // 解析导出请求 {"images": [...], "categories": [...], "annotations": [...]}, 格式错误抛出 error::MalformedInput
    ExportRequest parse_request(const std::string &text);
    ExportRequest parse_request(const nlohmann::json &j);

    void to_json(nlohmann::json &j, const Info &info);
    void to_json(nlohmann::json &j, const License &license);
    void to_json(nlohmann::json &j, const ImageRecord &image);
    void to_json(nlohmann::json &j, const CategoryRecord &category);
    void to_json(nlohmann::json &j, const AnnotationRecord &annotation);
    void to_json(nlohmann::json &j, const ExportDocument &document);
    void to_json(nlohmann::json &j, const ValidationReport &report);

    void from_json(const nlohmann::json &j, ImageMeta &image);
    void from_json(const nlohmann::json &j, CategoryMeta &category);
    void from_json(const nlohmann::json &j, Annotation &annotation);

} // namespace coco

#endif // COCO_EXPORT_HPP__
