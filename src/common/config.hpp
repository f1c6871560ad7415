#ifndef CONFIG_HPP__
#define CONFIG_HPP__

#include <string>

namespace config
{
    struct BackendConfig
    {
        std::string type = "mock";
        int timeout_ms = 0;       // 0 表示不限时
        bool point_refinement = true;
    };

    struct PromptConfig
    {
        float confidence_threshold = 0.5f;
        float fallback_box_fraction = 0.05f;  // 点降级为框时, 框宽高占图片的比例
    };

    struct ExportConfig
    {
        std::string format = "polygon";   // polygon | rle
        double simplify_tolerance = 1.0;  // 像素
        std::string description = "SAM3 Annotation Tool Export";
        std::string version = "1.0.0";
        std::string output_path = "output/annotations_coco.json";
    };

    struct AnnotatorConfig
    {
        BackendConfig backend;
        PromptConfig prompt;
        ExportConfig exporter;

        std::string log_level = "info";
    };

    // 读取 YAML 配置, 缺失的字段使用默认值; 文件不存在或格式错误时打印错误并返回默认配置
    AnnotatorConfig load_config(const std::string &path);

    // 从 YAML 字符串解析, 格式错误时抛出 YAML::Exception
    AnnotatorConfig parse_config(const std::string &yaml_text);

} // namespace config

#endif // CONFIG_HPP__
