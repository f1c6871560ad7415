#include "service/annotator.hpp"
#include "common/config.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include <opencv2/opencv.hpp>
#include <iostream>
#include <string>
#include <vector>

const std::string DEFAULT_CONFIG = "config/annotator.yaml";

// 没有图片文件时用一张合成图
cv::Mat load_image(const std::string &path)
{
    cv::Mat img;
    if (!path.empty())
        img = cv::imread(path);
    if (img.empty())
    {
        img = cv::Mat(480, 640, CV_8UC3, cv::Scalar(40, 40, 40));
        cv::circle(img, cv::Point(320, 240), 120, cv::Scalar(0, 200, 255), -1);
        cv::rectangle(img, cv::Rect(60, 60, 120, 90), cv::Scalar(255, 120, 0), -1);
    }
    return img;
}

coco::Annotation to_annotation(int64_t id, const std::string &image_id, const std::string &category,
                               const object::NormalizedResult &r)
{
    coco::Annotation ann;
    ann.id = id;
    ann.image_id = image_id;
    ann.category_name = category;
    ann.segmentation = r.mask_rle;
    ann.bbox = r.box.xywh();
    ann.area = static_cast<double>(r.area);
    ann.score = r.score;
    return ann;
}

void test_text_prompt(Annotator &annotator, const std::string &image_id, coco::ExportRequest &request)
{
    auto results = annotator.segment_text(image_id, "person");
    for (const auto &r : results)
        std::cout << r << std::endl;
    if (!results.empty())
        request.annotations.push_back(to_annotation(request.annotations.size() + 1, image_id, "person", results[0]));
}

void test_point_prompt(Annotator &annotator, const std::string &image_id, coco::ExportRequest &request)
{
    // 第一次点击开始一个新的 mask, 之后逐个加点细化
    std::vector<PointPrompt> points = {PointPrompt(320, 240, 1)};
    auto results = annotator.segment_points(image_id, points, true);
    std::cout << "1 point : " << results.size() << " candidates" << std::endl;

    points.emplace_back(340, 250, 1);
    results = annotator.segment_points(image_id, points);
    std::cout << "2 points : " << results.size() << " candidates" << std::endl;

    points.emplace_back(200, 200, 0);
    results = annotator.segment_points(image_id, points);
    std::cout << "3 points : " << results.size() << " candidates" << std::endl;
    for (const auto &r : results)
        std::cout << r << std::endl;

    if (!results.empty())
        request.annotations.push_back(to_annotation(request.annotations.size() + 1, image_id, "object", results[0]));
    annotator.reset_mask_state(image_id);
}

void test_box_prompt(Annotator &annotator, const std::string &image_id, coco::ExportRequest &request)
{
    auto results = annotator.segment_box(image_id, 60, 60, 180, 150);
    for (const auto &r : results)
        std::cout << r << std::endl;
    if (!results.empty())
        request.annotations.push_back(to_annotation(request.annotations.size() + 1, image_id, "box", results[0]));
}

void test_export(Annotator &annotator, const coco::ExportRequest &request)
{
    auto report = annotator.validate_export(request);
    std::cout << "valid : " << (report.valid ? "true" : "false") << ", errors : " << report.errors.size() << std::endl;
    for (const auto &e : report.errors)
        std::cout << "  " << e << std::endl;

    auto result = annotator.export_annotations(request);
    for (const auto &w : result.warnings)
        std::cout << "warning : " << w << std::endl;
    std::string path = annotator.write_export(result);
    std::cout << "export written to " << path << std::endl;
}

int main(int argc, char **argv)
{
    std::string config_path = argc > 1 ? argv[1] : DEFAULT_CONFIG;
    std::string image_path = argc > 2 ? argv[2] : "";

    auto cfg = config::load_config(config_path);
    auto annotator = Annotator::create_instance(cfg);
    if (!annotator)
        return 1;

    try
    {
        cv::Mat img = load_image(image_path);
        std::string image_id = annotator->register_image("", img);
        auto info = annotator->image_info(image_id);

        coco::ExportRequest request;
        request.images.push_back(coco::ImageMeta{info.id, image_path.empty() ? "synthetic.jpg" : image_path, info.width, info.height});
        request.categories.push_back(coco::CategoryMeta{"1", "person", ""});
        request.categories.push_back(coco::CategoryMeta{"2", "object", ""});
        request.categories.push_back(coco::CategoryMeta{"3", "box", ""});

        test_text_prompt(*annotator, image_id, request);
        test_point_prompt(*annotator, image_id, request);
        test_box_prompt(*annotator, image_id, request);
        test_export(*annotator, request);
    }
    catch (const std::exception &e)
    {
        INFOE("Demo failed: %s", e.what());
        return 1;
    }
    return 0;
}
