#include "mask/mask_codec.hpp"
#include "common/error.hpp"
#include <opencv2/core.hpp>
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>

namespace mask
{
    std::ostream &operator<<(std::ostream &os, const Rle &rle)
    {
        os << "{ \"counts\": [";
        for (size_t i = 0; i < rle.counts.size(); ++i)
        {
            os << rle.counts[i];
            if (i < rle.counts.size() - 1) os << ", ";
        }
        os << "], \"size\": [" << rle.height << ", " << rle.width << "] }";
        return os;
    }

    Rle encode(const cv::Mat &mask)
    {
        if (mask.empty())
        {
            throw error::MalformedInput("Cannot encode an empty mask");
        }
        if (mask.channels() != 1)
        {
            throw error::MalformedInput("Mask must be single channel, got " + std::to_string(mask.channels()) + " channels");
        }

        // 统一成 CV_8UC1, 非 0 为前景
        cv::Mat binary;
        if (mask.type() == CV_8UC1)
            binary = mask;
        else
            binary = mask != 0;

        Rle rle;
        rle.height = binary.rows;
        rle.width  = binary.cols;

        // 从背景开始计数, 第一个像素是前景时自然会先压入一个长度为 0 的背景 run
        unsigned char previous = 0;
        int run = 0;
        for (int y = 0; y < binary.rows; ++y)
        {
            const unsigned char *row = binary.ptr<unsigned char>(y);
            for (int x = 0; x < binary.cols; ++x)
            {
                unsigned char value = row[x] ? 1 : 0;
                if (value != previous)
                {
                    rle.counts.push_back(run);
                    run = 0;
                    previous = value;
                }
                ++run;
            }
        }
        rle.counts.push_back(run);
        return rle;
    }

    void validate(const Rle &rle)
    {
        if (rle.height <= 0 || rle.width <= 0)
        {
            throw error::MalformedRle("RLE size must be positive, got [" + std::to_string(rle.height) + ", " +
                                      std::to_string(rle.width) + "]");
        }
        int64_t total = 0;
        for (size_t i = 0; i < rle.counts.size(); ++i)
        {
            if (rle.counts[i] < 0)
            {
                throw error::MalformedRle("RLE count at index " + std::to_string(i) + " is negative");
            }
            total += rle.counts[i];
        }
        int64_t expected = static_cast<int64_t>(rle.height) * rle.width;
        if (total != expected)
        {
            throw error::MalformedRle("RLE counts sum to " + std::to_string(total) + ", expected " +
                                      std::to_string(expected));
        }
    }

    cv::Mat decode(const Rle &rle)
    {
        validate(rle);

        cv::Mat out = cv::Mat::zeros(rle.height, rle.width, CV_8UC1);
        unsigned char *data = out.data;
        size_t pos = 0;
        unsigned char value = 0;
        for (int count : rle.counts)
        {
            if (value && count > 0)
            {
                std::memset(data + pos, 1, static_cast<size_t>(count));
            }
            pos += static_cast<size_t>(count);
            value ^= 1;
        }
        return out;
    }

    int64_t area(const Rle &rle)
    {
        int64_t sum = 0;
        for (size_t i = 1; i < rle.counts.size(); i += 2)
        {
            sum += rle.counts[i];
        }
        return sum;
    }

    std::array<int, 4> to_bbox(const Rle &rle)
    {
        if (rle.width <= 0 || rle.height <= 0)
            return {0, 0, 0, 0};

        int64_t width = rle.width;
        int64_t xmin = width, ymin = rle.height, xmax = -1, ymax = -1;
        int64_t pos = 0;
        for (size_t i = 0; i < rle.counts.size(); ++i)
        {
            int64_t count = rle.counts[i];
            if (i % 2 == 1 && count > 0)
            {
                int64_t start = pos;
                int64_t end   = pos + count - 1;
                int64_t y0 = start / width, y1 = end / width;
                int64_t x0 = start % width, x1 = end % width;
                if (y0 != y1)
                {
                    // 跨行的 run 覆盖了整行宽度
                    x0 = 0;
                    x1 = width - 1;
                }
                xmin = std::min(xmin, x0);
                xmax = std::max(xmax, x1);
                ymin = std::min(ymin, y0);
                ymax = std::max(ymax, y1);
            }
            pos += count;
        }
        if (xmax < 0)
            return {0, 0, 0, 0};
        return {static_cast<int>(xmin), static_cast<int>(ymin),
                static_cast<int>(xmax - xmin + 1), static_cast<int>(ymax - ymin + 1)};
    }

    void to_json(nlohmann::json &j, const Rle &rle)
    {
        j = nlohmann::json{{"counts", rle.counts}, {"size", {rle.height, rle.width}}};
    }

    namespace
    {
        // get<int>() 对超出范围的整数会静默截断, 这里先按 64 位取出再检查
        int json_to_int(const nlohmann::json &value, const char *field)
        {
            constexpr int64_t kMax = std::numeric_limits<int>::max();
            bool too_large = value.is_number_unsigned() && value.get<uint64_t>() > static_cast<uint64_t>(kMax);
            int64_t v = too_large ? kMax : value.get<int64_t>();
            if (too_large || v < 0 || v > kMax)
            {
                throw error::MalformedRle(std::string("RLE '") + field + "' value " + value.dump() +
                                          " is out of range [0, " + std::to_string(kMax) + "]");
            }
            return static_cast<int>(v);
        }
    }

    void from_json(const nlohmann::json &j, Rle &rle)
    {
        if (!j.is_object() || !j.contains("counts") || !j.contains("size"))
        {
            throw error::MalformedRle("RLE must be an object with 'counts' and 'size'");
        }
        const auto &counts = j.at("counts");
        const auto &size   = j.at("size");
        if (!counts.is_array())
        {
            throw error::MalformedRle("RLE 'counts' must be a list of integers");
        }
        if (!size.is_array() || size.size() != 2 || !size[0].is_number_integer() || !size[1].is_number_integer())
        {
            throw error::MalformedRle("RLE 'size' must be [height, width]");
        }

        Rle parsed;
        parsed.counts.reserve(counts.size());
        for (const auto &c : counts)
        {
            if (!c.is_number_integer())
            {
                throw error::MalformedRle("RLE 'counts' must contain integers only");
            }
            parsed.counts.push_back(json_to_int(c, "counts"));
        }
        parsed.height = json_to_int(size[0], "size");
        parsed.width  = json_to_int(size[1], "size");
        rle = std::move(parsed);
    }

} // namespace mask
