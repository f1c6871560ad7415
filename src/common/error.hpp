#ifndef ERROR_HPP__
#define ERROR_HPP__

#include <stdexcept>
#include <string>

// 对调用方可见的错误类型
namespace error
{
    // 引用的图片 / session 不存在
    class NotFound : public std::runtime_error
    {
    public:
        explicit NotFound(const std::string &what) : std::runtime_error(what) {}
    };

    // 提示几何非法、RLE 非法、导出请求格式错误
    class MalformedInput : public std::runtime_error
    {
    public:
        explicit MalformedInput(const std::string &what) : std::runtime_error(what) {}
    };

    class MalformedRle : public MalformedInput
    {
    public:
        explicit MalformedRle(const std::string &what) : MalformedInput(what) {}
    };

    // 分割后端调用抛出
    class BackendFailure : public std::runtime_error
    {
    public:
        explicit BackendFailure(const std::string &what) : std::runtime_error(what) {}
    };

    // RLE 转多边形没有得到任何结果, 导出时在本地恢复
    class ConversionFailure : public std::runtime_error
    {
    public:
        explicit ConversionFailure(const std::string &what) : std::runtime_error(what) {}
    };

    // 请求被取消, 结果丢弃
    class Cancelled : public std::runtime_error
    {
    public:
        explicit Cancelled(const std::string &what) : std::runtime_error(what) {}
    };

    // 后端调用超时, 结果丢弃
    class Timeout : public std::runtime_error
    {
    public:
        explicit Timeout(const std::string &what) : std::runtime_error(what) {}
    };

} // namespace error

#endif // ERROR_HPP__
