#include "common/config.hpp"
#include "common/logger.hpp"
#include <yaml-cpp/yaml.h>

namespace config
{
    namespace
    {
        AnnotatorConfig from_node(const YAML::Node &yaml)
        {
            AnnotatorConfig config;

            // backend
            if (yaml["backend"])
            {
                config.backend.type             = yaml["backend"]["type"].as<std::string>("mock");
                config.backend.timeout_ms       = yaml["backend"]["timeout_ms"].as<int>(0);
                config.backend.point_refinement = yaml["backend"]["point_refinement"].as<bool>(true);
            }

            // prompt
            if (yaml["prompt"])
            {
                config.prompt.confidence_threshold  = yaml["prompt"]["confidence_threshold"].as<float>(0.5f);
                config.prompt.fallback_box_fraction = yaml["prompt"]["fallback_box_fraction"].as<float>(0.05f);
            }

            // export
            if (yaml["export"])
            {
                config.exporter.format             = yaml["export"]["format"].as<std::string>("polygon");
                config.exporter.simplify_tolerance = yaml["export"]["simplify_tolerance"].as<double>(1.0);
                config.exporter.description        = yaml["export"]["description"].as<std::string>("SAM3 Annotation Tool Export");
                config.exporter.version            = yaml["export"]["version"].as<std::string>("1.0.0");
                config.exporter.output_path        = yaml["export"]["output_path"].as<std::string>("output/annotations_coco.json");
            }

            config.log_level = yaml["log_level"].as<std::string>("info");
            return config;
        }
    }

    AnnotatorConfig parse_config(const std::string &yaml_text)
    {
        return from_node(YAML::Load(yaml_text));
    }

    AnnotatorConfig load_config(const std::string &path)
    {
        AnnotatorConfig config;
        try
        {
            config = from_node(YAML::LoadFile(path));
            INFO("Config loaded from %s", path.c_str());
        }
        catch (const YAML::Exception &e)
        {
            INFOE("Config error: %s, using defaults", e.what());
        }
        return config;
    }

} // namespace config
