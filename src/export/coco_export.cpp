#include "export/coco_export.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include <atomic>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <unistd.h>

namespace coco
{
    namespace
    {
        Info make_info(const ExportOptions &options)
        {
            Info info;
            info.description = options.description;
            info.version = options.version;

            std::time_t now = std::time(nullptr);
            std::tm local{};
            localtime_r(&now, &local);
            info.year = local.tm_year + 1900;
            std::ostringstream ss;
            ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
            info.date_created = ss.str();
            return info;
        }

        // RLE 得不到任何多边形时抛出 error::ConversionFailure
        mask::PolygonArray to_polygons(const mask::Rle &rle, double tolerance)
        {
            auto polygons = mask::rle_to_polygons(rle, tolerance);
            if (polygons.empty())
            {
                throw error::ConversionFailure("segmentation yields no polygon with at least " +
                                               std::to_string(mask::kMinPolygonVertices) + " vertices");
            }
            return polygons;
        }

        std::string annotation_label(const Annotation &ann)
        {
            return "Annotation " + std::to_string(ann.id);
        }

        // 数字或字符串形式的 id 统一转为字符串
        std::string id_to_string(const nlohmann::json &j, const char *field)
        {
            if (j.is_string()) return j.get<std::string>();
            if (j.is_number_integer()) return std::to_string(j.get<int64_t>());
            if (j.is_number()) return j.dump();
            throw error::MalformedInput(std::string("'") + field + "' must be a string or a number");
        }

        template <typename T>
        T required(const nlohmann::json &j, const char *field, const char *owner)
        {
            if (!j.is_object() || !j.contains(field))
            {
                throw error::MalformedInput(std::string(owner) + " is missing '" + field + "'");
            }
            try
            {
                return j.at(field).get<T>();
            }
            catch (const nlohmann::json::exception &e)
            {
                throw error::MalformedInput(std::string(owner) + " field '" + field + "' has the wrong type: " + e.what());
            }
        }

        std::string optional_string(const nlohmann::json &j, const char *field)
        {
            if (!j.contains(field) || j.at(field).is_null()) return std::string();
            if (!j.at(field).is_string())
            {
                throw error::MalformedInput(std::string("'") + field + "' must be a string");
            }
            return j.at(field).get<std::string>();
        }
    }

    Format format_from_string(const std::string &name)
    {
        if (name == "polygon") return Format::Polygon;
        if (name == "rle") return Format::Rle;
        throw error::MalformedInput("Unknown export format '" + name + "', expected 'polygon' or 'rle'");
    }

    const char *format_name(Format format)
    {
        return format == Format::Rle ? "rle" : "polygon";
    }

    ExportResult assemble(const std::vector<ImageMeta> &images,
                          const std::vector<CategoryMeta> &categories,
                          const std::vector<Annotation> &annotations,
                          const ExportOptions &options)
    {
        ExportResult result;
        ExportDocument &doc = result.document;
        auto warn = [&result](const std::string &message) {
            INFOW("[export] %s", message.c_str());
            result.warnings.push_back(message);
        };

        doc.info = make_info(options);
        doc.licenses.push_back(License{});

        // images: 按输入顺序编号, 重复 id 保留第一次出现的
        std::unordered_map<std::string, size_t> image_index;
        for (const auto &img : images)
        {
            if (image_index.count(img.id))
            {
                warn("Duplicate image id '" + img.id + "' ignored, first occurrence kept");
                continue;
            }
            ImageRecord record;
            record.id = kImageIdBase + static_cast<int>(doc.images.size());
            record.file_name = img.file_name.empty() ? "image_" + std::to_string(record.id) + ".jpg" : img.file_name;
            record.width = img.width;
            record.height = img.height;
            image_index.emplace(img.id, doc.images.size());
            doc.images.push_back(std::move(record));
        }

        // categories: 名字和原始 id 都可以作为连接键, 优先用名字
        std::unordered_map<std::string, int> category_by_name;
        std::unordered_map<std::string, int> category_by_id;
        for (size_t i = 0; i < categories.size(); ++i)
        {
            const auto &cat = categories[i];
            CategoryRecord record;
            record.id = kCategoryIdBase + static_cast<int>(i);
            record.name = cat.name;
            record.supercategory = cat.supercategory;

            std::string raw_id = cat.id.empty() ? std::to_string(i) : cat.id;
            if (!category_by_id.emplace(raw_id, record.id).second)
            {
                warn("Duplicate category id '" + raw_id + "', first occurrence kept for id lookup");
            }
            if (!cat.name.empty())
            {
                category_by_name.emplace(cat.name, record.id);
            }
            doc.categories.push_back(std::move(record));
        }

        for (const auto &ann : annotations)
        {
            AnnotationRecord record;
            record.source_id = ann.id;
            record.bbox = ann.bbox;
            record.area = ann.area;
            record.score = ann.score;

            // 无法解析的引用保留为 -1, 交给 validate 报告
            const ImageRecord *image = nullptr;
            auto img_it = image_index.find(ann.image_id);
            if (img_it != image_index.end())
            {
                image = &doc.images[img_it->second];
                record.image_id = image->id;
            }
            else
            {
                warn(annotation_label(ann) + " references unknown image '" + ann.image_id + "'");
            }

            auto by_name = ann.category_name.empty() ? category_by_name.end() : category_by_name.find(ann.category_name);
            if (by_name != category_by_name.end())
            {
                record.category_id = by_name->second;
            }
            else
            {
                auto by_id = category_by_id.find(ann.category_id);
                if (by_id != category_by_id.end())
                    record.category_id = by_id->second;
                else
                    warn(annotation_label(ann) + " references unknown category '" +
                         (ann.category_name.empty() ? ann.category_id : ann.category_name) + "'");
            }

            if (options.format == Format::Polygon)
            {
                try
                {
                    record.segmentation = to_polygons(ann.segmentation, options.simplify_tolerance);
                }
                catch (const error::ConversionFailure &e)
                {
                    warn(annotation_label(ann) + " skipped: " + e.what());
                    continue;
                }
                catch (const error::MalformedInput &e)
                {
                    warn(annotation_label(ann) + " skipped, invalid RLE: " + e.what());
                    continue;
                }
                record.iscrowd = 0;
            }
            else
            {
                try
                {
                    mask::validate(ann.segmentation);
                }
                catch (const error::MalformedRle &e)
                {
                    warn(annotation_label(ann) + " skipped, invalid RLE: " + e.what());
                    continue;
                }
                if (image && (ann.segmentation.height != image->height || ann.segmentation.width != image->width))
                {
                    std::ostringstream ss;
                    ss << annotation_label(ann) << " skipped, RLE size [" << ann.segmentation.height << ", "
                       << ann.segmentation.width << "] does not match image [" << image->height << ", " << image->width << "]";
                    warn(ss.str());
                    continue;
                }
                record.segmentation = ann.segmentation;
                record.iscrowd = 1;
            }

            record.id = kAnnotationIdBase + static_cast<int>(doc.annotations.size());
            doc.annotations.push_back(std::move(record));
        }

        INFO("[export] format=%s, images=%d, categories=%d, annotations=%d/%d, warnings=%d",
             format_name(options.format), static_cast<int>(doc.images.size()), static_cast<int>(doc.categories.size()),
             static_cast<int>(doc.annotations.size()), static_cast<int>(annotations.size()),
             static_cast<int>(result.warnings.size()));
        return result;
    }

    ValidationReport validate(const ExportDocument &document)
    {
        ValidationReport report;
        if (document.images.empty()) report.errors.push_back("No images found");
        if (document.annotations.empty()) report.errors.push_back("No annotations found");
        if (document.categories.empty()) report.errors.push_back("No categories found");

        std::unordered_set<int> image_ids;
        for (const auto &img : document.images) image_ids.insert(img.id);
        std::unordered_set<int> category_ids;
        for (const auto &cat : document.categories) category_ids.insert(cat.id);

        for (const auto &ann : document.annotations)
        {
            std::string prefix = "Annotation " + std::to_string(ann.id) + " (source " + std::to_string(ann.source_id) + ")";
            if (!image_ids.count(ann.image_id))
                report.errors.push_back(prefix + " references invalid image_id " + std::to_string(ann.image_id));
            if (!category_ids.count(ann.category_id))
                report.errors.push_back(prefix + " references invalid category_id " + std::to_string(ann.category_id));
        }

        report.valid = report.errors.empty();
        report.summary.images = document.images.size();
        report.summary.annotations = document.annotations.size();
        report.summary.categories = document.categories.size();
        return report;
    }

    void write_document(const ExportDocument &document, const std::string &path, int indent)
    {
        namespace fs = std::filesystem;
        fs::path target(path);
        if (target.has_parent_path())
        {
            std::error_code ec;
            fs::create_directories(target.parent_path(), ec);
            if (ec)
            {
                throw std::runtime_error("Cannot create directory " + target.parent_path().string() + ": " + ec.message());
            }
        }

        std::string text = nlohmann::json(document).dump(indent);
        // 同一路径的并发写入各用各的临时文件, 最后一次 rename 生效
        static std::atomic<uint64_t> write_counter{0};
        fs::path temp = target;
        temp += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(write_counter.fetch_add(1));
        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out)
            {
                throw std::runtime_error("Cannot open " + temp.string() + " for writing");
            }
            out << text;
            out.flush();
            if (!out)
            {
                out.close();
                std::error_code ignored;
                fs::remove(temp, ignored);
                throw std::runtime_error("Failed to write " + temp.string());
            }
        }

        std::error_code ec;
        fs::rename(temp, target, ec);
        if (ec)
        {
            std::error_code ignored;
            fs::remove(temp, ignored);
            throw std::runtime_error("Cannot move " + temp.string() + " to " + target.string() + ": " + ec.message());
        }
        INFO("[export] Wrote %s (%d bytes)", target.string().c_str(), static_cast<int>(text.size()));
    }

    ExportRequest parse_request(const std::string &text)
    {
        nlohmann::json j;
        try
        {
            j = nlohmann::json::parse(text);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw error::MalformedInput(std::string("Export request is not valid JSON: ") + e.what());
        }
        return parse_request(j);
    }

    ExportRequest parse_request(const nlohmann::json &j)
    {
        if (!j.is_object())
        {
            throw error::MalformedInput("Export request must be a JSON object");
        }
        ExportRequest request;
        for (const char *field : {"images", "categories", "annotations"})
        {
            if (!j.contains(field) || !j.at(field).is_array())
            {
                throw error::MalformedInput(std::string("Export request field '") + field + "' must be a list");
            }
        }
        try
        {
            request.images = j.at("images").get<std::vector<ImageMeta>>();
            request.categories = j.at("categories").get<std::vector<CategoryMeta>>();
            request.annotations = j.at("annotations").get<std::vector<Annotation>>();
        }
        catch (const nlohmann::json::exception &e)
        {
            throw error::MalformedInput(std::string("Export request is malformed: ") + e.what());
        }
        return request;
    }

    void to_json(nlohmann::json &j, const Info &info)
    {
        j = nlohmann::json{{"description", info.description},
                           {"version", info.version},
                           {"year", info.year},
                           {"date_created", info.date_created}};
    }

    void to_json(nlohmann::json &j, const License &license)
    {
        j = nlohmann::json{{"id", license.id}, {"name", license.name}, {"url", license.url}};
    }

    void to_json(nlohmann::json &j, const ImageRecord &image)
    {
        j = nlohmann::json{{"id", image.id}, {"file_name", image.file_name}, {"width", image.width}, {"height", image.height}};
    }

    void to_json(nlohmann::json &j, const CategoryRecord &category)
    {
        j = nlohmann::json{{"id", category.id}, {"name", category.name}, {"supercategory", category.supercategory}};
    }

    void to_json(nlohmann::json &j, const AnnotationRecord &annotation)
    {
        j = nlohmann::json{{"id", annotation.id},
                           {"image_id", annotation.image_id},
                           {"category_id", annotation.category_id},
                           {"bbox", annotation.bbox},
                           {"area", annotation.area},
                           {"iscrowd", annotation.iscrowd},
                           {"score", annotation.score}};
        std::visit([&j](const auto &seg) { j["segmentation"] = seg; }, annotation.segmentation);
    }

    void to_json(nlohmann::json &j, const ExportDocument &document)
    {
        j = nlohmann::json{{"info", document.info},
                           {"licenses", document.licenses},
                           {"images", document.images},
                           {"annotations", document.annotations},
                           {"categories", document.categories}};
    }

    void to_json(nlohmann::json &j, const ValidationReport &report)
    {
        j = nlohmann::json{{"valid", report.valid},
                           {"errors", report.errors},
                           {"summary",
                            {{"images", report.summary.images},
                             {"annotations", report.summary.annotations},
                             {"categories", report.summary.categories}}}};
    }

    void from_json(const nlohmann::json &j, ImageMeta &image)
    {
        if (!j.is_object() || !j.contains("id"))
        {
            throw error::MalformedInput("Image entry is missing 'id'");
        }
        image.id = id_to_string(j.at("id"), "id");
        image.file_name = optional_string(j, "file_name");
        image.width = required<int>(j, "width", "Image entry");
        image.height = required<int>(j, "height", "Image entry");
        if (image.width <= 0 || image.height <= 0)
        {
            throw error::MalformedInput("Image '" + image.id + "' must have a positive size");
        }
    }

    void from_json(const nlohmann::json &j, CategoryMeta &category)
    {
        if (!j.is_object())
        {
            throw error::MalformedInput("Category entry must be an object");
        }
        category.id = j.contains("id") && !j.at("id").is_null() ? id_to_string(j.at("id"), "id") : std::string();
        category.name = optional_string(j, "name");
        category.supercategory = optional_string(j, "supercategory");
        if (category.id.empty() && category.name.empty())
        {
            throw error::MalformedInput("Category entry needs an 'id' or a 'name'");
        }
    }

    void from_json(const nlohmann::json &j, Annotation &annotation)
    {
        annotation.id = required<int64_t>(j, "id", "Annotation entry");
        if (!j.contains("image_id"))
        {
            throw error::MalformedInput("Annotation " + std::to_string(annotation.id) + " is missing 'image_id'");
        }
        annotation.image_id = id_to_string(j.at("image_id"), "image_id");
        annotation.category_id = j.contains("category_id") && !j.at("category_id").is_null()
                                     ? id_to_string(j.at("category_id"), "category_id")
                                     : std::string();
        annotation.category_name = optional_string(j, "category_name");
        if (!j.contains("segmentation"))
        {
            throw error::MalformedInput("Annotation " + std::to_string(annotation.id) + " is missing 'segmentation'");
        }
        // RLE 的合法性在组装时检查, 这里只要求结构正确
        annotation.segmentation = j.at("segmentation").get<mask::Rle>();

        if (j.contains("bbox"))
        {
            auto bbox = j.at("bbox");
            if (!bbox.is_array() || bbox.size() != 4)
            {
                throw error::MalformedInput("Annotation " + std::to_string(annotation.id) + " bbox must be [x, y, width, height]");
            }
            for (size_t i = 0; i < 4; ++i)
                annotation.bbox[i] = bbox[i].get<float>();
        }
        else
        {
            auto box = mask::to_bbox(annotation.segmentation);
            annotation.bbox = {static_cast<float>(box[0]), static_cast<float>(box[1]),
                               static_cast<float>(box[2]), static_cast<float>(box[3])};
        }
        annotation.area = j.contains("area") ? j.at("area").get<double>()
                                             : static_cast<double>(mask::area(annotation.segmentation));
        annotation.score = j.contains("score") ? j.at("score").get<float>() : 1.0f;
    }

} // namespace coco
