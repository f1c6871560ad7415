#include <pybind11/pybind11.h>
#include <pybind11/stl.h>   // std::vector, std::optional, std::array, std::variant
#include <pybind11/numpy.h> // py::array_t
#include <opencv2/opencv.hpp>

#include "service/annotator.hpp"
#include "common/config.hpp"
#include "common/error.hpp"
#include "common/object.hpp"
#include "mask/mask_codec.hpp"
#include "mask/polygon.hpp"

namespace py = pybind11;

// --- 辅助函数：cv::Mat <-> numpy ---
// 将 cv::Mat 转换为 numpy array (拷贝数据)
py::array_t<uint8_t> mat_to_numpy(const cv::Mat &mat)
{
    if (mat.empty())
        return py::array_t<uint8_t>();

    std::vector<ssize_t> shape;
    std::vector<ssize_t> strides;

    if (mat.channels() == 1)
    {
        shape = {mat.rows, mat.cols};
        strides = {static_cast<ssize_t>(mat.step[0]), static_cast<ssize_t>(mat.step[1])};
    }
    else
    {
        shape = {mat.rows, mat.cols, mat.channels()};
        strides = {static_cast<ssize_t>(mat.step[0]), static_cast<ssize_t>(mat.step[1]), static_cast<ssize_t>(mat.elemSize1())};
    }
    return py::array_t<uint8_t>(shape, strides, mat.data);
}

// 将 numpy array 转换为 cv::Mat (共享内存，需要保存时调用方自行 clone)
cv::Mat numpy_to_mat(py::array_t<uint8_t, py::array::c_style | py::array::forcecast> &input)
{
    py::buffer_info buf = input.request();
    if (buf.ndim != 2 && buf.ndim != 3)
    {
        throw error::MalformedInput("Input numpy array must be 2D or 3D.");
    }
    int rows = static_cast<int>(buf.shape[0]);
    int cols = static_cast<int>(buf.shape[1]);
    int channels = (buf.ndim == 3) ? static_cast<int>(buf.shape[2]) : 1;
    if (channels != 1 && channels != 3)
    {
        throw error::MalformedInput("Input numpy array must have 1 or 3 channels.");
    }
    int type = (channels == 1) ? CV_8UC1 : CV_8UC3;
    return cv::Mat(rows, cols, type, buf.ptr, buf.strides[0]);
}

PYBIND11_MODULE(trtsam3annotator, m)
{
    m.doc() = "Python bindings for the SAM3 interactive annotator (sessions, prompts, COCO export) using pybind11";

    // --- 异常映射 ---
    // 后注册的先匹配, MalformedRle 放在 MalformedInput 之后
    auto malformed_input = py::register_exception<error::MalformedInput>(m, "MalformedInput", PyExc_ValueError);
    py::register_exception<error::MalformedRle>(m, "MalformedRle", malformed_input.ptr());
    py::register_exception<error::NotFound>(m, "NotFound", PyExc_KeyError);
    py::register_exception<error::BackendFailure>(m, "BackendFailure", PyExc_RuntimeError);
    py::register_exception<error::ConversionFailure>(m, "ConversionFailure", PyExc_RuntimeError);
    py::register_exception<error::Cancelled>(m, "Cancelled", PyExc_RuntimeError);
    py::register_exception<error::Timeout>(m, "Timeout", PyExc_TimeoutError);

    // --- 基础结构绑定 ---
    py::class_<object::Box>(m, "Box")
        .def(py::init<float, float, float, float>(),
             py::arg("left") = 0, py::arg("top") = 0, py::arg("right") = 0, py::arg("bottom") = 0)
        .def_readwrite("left", &object::Box::left)
        .def_readwrite("top", &object::Box::top)
        .def_readwrite("right", &object::Box::right)
        .def_readwrite("bottom", &object::Box::bottom)
        .def("__repr__", [](const object::Box &b)
             { return "<Box l=" + std::to_string(b.left) + ", t=" + std::to_string(b.top) +
                      ", r=" + std::to_string(b.right) + ", b=" + std::to_string(b.bottom) + ">"; });

    py::class_<mask::Rle>(m, "Rle")
        .def(py::init<>())
        .def(py::init<std::vector<int>, int, int>(), py::arg("counts"), py::arg("height"), py::arg("width"))
        .def_readwrite("counts", &mask::Rle::counts)
        .def_readwrite("height", &mask::Rle::height)
        .def_readwrite("width", &mask::Rle::width)
        .def("__eq__", [](const mask::Rle &a, const mask::Rle &b) { return a == b; })
        .def("__repr__", [](const mask::Rle &r)
             { return "<Rle size=[" + std::to_string(r.height) + ", " + std::to_string(r.width) +
                      "] runs=" + std::to_string(r.counts.size()) + ">"; });

    py::class_<object::NormalizedResult>(m, "NormalizedResult")
        .def(py::init<>())
        .def_readwrite("mask_rle", &object::NormalizedResult::mask_rle)
        .def_readwrite("box", &object::NormalizedResult::box)
        .def_readwrite("score", &object::NormalizedResult::score)
        .def_readwrite("area", &object::NormalizedResult::area)
        .def("to_json", [](const object::NormalizedResult &r) { return nlohmann::json(r).dump(); })
        .def("__repr__", [](const object::NormalizedResult &r)
             { return "<NormalizedResult score=" + std::to_string(r.score) + " area=" + std::to_string(r.area) + ">"; });

    py::class_<PointPrompt>(m, "PointPrompt")
        .def(py::init<float, float, int>(), py::arg("x"), py::arg("y"), py::arg("label") = 1)
        .def_readwrite("x", &PointPrompt::x)
        .def_readwrite("y", &PointPrompt::y)
        .def_readwrite("label", &PointPrompt::label);

    py::class_<session::ImageInfo>(m, "ImageInfo")
        .def_readonly("id", &session::ImageInfo::id)
        .def_readonly("width", &session::ImageInfo::width)
        .def_readonly("height", &session::ImageInfo::height)
        .def("__repr__", [](const session::ImageInfo &i)
             { return "<ImageInfo id='" + i.id + "' " + std::to_string(i.width) + "x" + std::to_string(i.height) + ">"; });

    py::enum_<coco::Format>(m, "ExportFormat")
        .value("POLYGON", coco::Format::Polygon)
        .value("RLE", coco::Format::Rle)
        .export_values();

    // --- mask 工具函数 ---
    m.def("encode_mask", [](py::array_t<uint8_t, py::array::c_style | py::array::forcecast> &mask)
          { return mask::encode(numpy_to_mat(mask)); }, py::arg("mask"));
    m.def("decode_mask", [](const mask::Rle &rle)
          { return mat_to_numpy(mask::decode(rle)); }, py::arg("rle"));
    m.def("rle_to_polygons", &mask::rle_to_polygons, py::arg("rle"), py::arg("simplify_tolerance") = 1.0);
    m.def("polygons_to_rle", &mask::polygons_to_rle, py::arg("polygons"), py::arg("height"), py::arg("width"));

    // --- 标注服务绑定 ---
    py::class_<Annotator, std::shared_ptr<Annotator>>(m, "Annotator")
        .def_static("create_instance",
                    [](const std::string &config_path)
                    {
                        auto cfg = config_path.empty() ? config::AnnotatorConfig() : config::load_config(config_path);
                        auto instance = Annotator::create_instance(cfg);
                        if (!instance) throw error::BackendFailure("Backend '" + cfg.backend.type + "' is not available");
                        return instance;
                    },
                    py::arg("config_path") = "",
                    "Create an Annotator from a YAML config file (defaults when empty).")
        .def("register_image",
             [](Annotator &self, const std::string &image_id, py::array_t<uint8_t, py::array::c_style | py::array::forcecast> &img)
             {
                 cv::Mat mat = numpy_to_mat(img).clone();
                 py::gil_scoped_release release;
                 return self.register_image(image_id, mat);
             },
             py::arg("image_id"), py::arg("image"))
        .def("register_image_file", &Annotator::register_image_file,
             py::arg("image_id"), py::arg("path"), py::call_guard<py::gil_scoped_release>())
        .def("register_image_bytes",
             [](Annotator &self, const std::string &image_id, const py::bytes &data)
             {
                 std::string raw = data;
                 std::vector<uint8_t> bytes(raw.begin(), raw.end());
                 py::gil_scoped_release release;
                 return self.register_image_bytes(image_id, bytes);
             },
             py::arg("image_id"), py::arg("data"))
        .def("image_info", &Annotator::image_info, py::arg("image_id"))
        .def("image_ids", &Annotator::image_ids)
        .def("remove_image", &Annotator::remove_image, py::arg("image_id"))
        .def("segment_text", &Annotator::segment_text,
             py::arg("image_id"), py::arg("text"), py::arg("confidence_threshold") = -1.0f,
             py::call_guard<py::gil_scoped_release>())
        .def("segment_points", &Annotator::segment_points,
             py::arg("image_id"), py::arg("points"), py::arg("reset_mask") = false, py::arg("confidence_threshold") = -1.0f,
             py::call_guard<py::gil_scoped_release>())
        .def("segment_box", &Annotator::segment_box,
             py::arg("image_id"), py::arg("x1"), py::arg("y1"), py::arg("x2"), py::arg("y2"),
             py::arg("label") = true, py::arg("confidence_threshold") = -1.0f,
             py::call_guard<py::gil_scoped_release>())
        .def("segment_template", &Annotator::segment_template,
             py::arg("image_id"), py::arg("source_image_id"), py::arg("x1"), py::arg("y1"), py::arg("x2"), py::arg("y2"),
             py::arg("confidence_threshold") = -1.0f,
             py::call_guard<py::gil_scoped_release>())
        .def("reset_mask_state", &Annotator::reset_mask_state, py::arg("image_id"))
        .def("reset_prompts", &Annotator::reset_prompts, py::arg("image_id"))
        // 导出请求和结果都用 JSON 字符串传递, Python 侧直接 json.loads
        .def("export_annotations",
             [](const Annotator &self, const std::string &request_json, const std::string &format)
             {
                 auto request = coco::parse_request(request_json);
                 auto result = format.empty() ? self.export_annotations(request)
                                              : self.export_annotations(request, coco::format_from_string(format));
                 nlohmann::json out{{"document", result.document}, {"warnings", result.warnings}};
                 return out.dump();
             },
             py::arg("request_json"), py::arg("format") = "")
        .def("validate_export",
             [](const Annotator &self, const std::string &request_json)
             { return nlohmann::json(self.validate_export(coco::parse_request(request_json))).dump(); },
             py::arg("request_json"))
        .def("write_export",
             [](const Annotator &self, const std::string &request_json, const std::string &path)
             {
                 auto result = self.export_annotations(coco::parse_request(request_json));
                 return self.write_export(result, path);
             },
             py::arg("request_json"), py::arg("path") = "");
}
