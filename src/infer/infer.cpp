#include "infer/infer.hpp"
#include "infer/mockinfer.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"

std::shared_ptr<SegmentationBackend> load_backend(const config::BackendConfig &config)
{
    if (config.type == "mock")
    {
        auto backend = std::make_shared<MockInfer>();
        backend->set_point_refinement(config.point_refinement);
        INFO("Loaded backend %s (point refinement %s)", backend->name().c_str(),
             config.point_refinement ? "on" : "off");
        return backend;
    }
    INFOE("Unknown backend type '%s'", config.type.c_str());
    return nullptr;
}
