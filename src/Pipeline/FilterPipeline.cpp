/**
 * @file FilterPipeline.cpp
 * @brief Chained kernel execution and chain text parsing
 */

#include <PixKit/Pipeline/FilterPipeline.h>
#include <PixKit/Core/Exception.h>
#include <PixKit/Pipeline/KernelDispatch.h>
#include <PixKit/Platform/Log.h>
#include <PixKit/Transform/Geometry.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <map>

namespace Pix::Kit::Pipeline {

namespace {

const char* TAG = "Pipeline";

std::string StageLabel(size_t index, const FilterRequest& request) {
    return "stage " + std::to_string(index) + " (" + GetStageName(request.Kind()) + ")";
}

// =============================================================================
// Parsing Helpers
// =============================================================================

std::string Trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::vector<std::string> Split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        parts.push_back(s.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
}

/**
 * @brief key=value arguments of one stage
 *
 * Every key must be consumed by the stage parser, leftovers are unknown keys.
 */
class StageArgs {
public:
    StageArgs(std::string stage, const std::string& text) : stage_(std::move(stage)) {
        if (text.empty()) {
            return;
        }
        for (const std::string& item : Split(text, ',')) {
            size_t eq = item.find('=');
            std::string key = Trim(item.substr(0, eq));
            if (eq == std::string::npos || key.empty()) {
                throw InvalidArgumentException(stage_ + ": expected key=value, got '" +
                                               Trim(item) + "'");
            }
            values_[key] = Trim(item.substr(eq + 1));
        }
    }

    std::optional<double> Double(const std::string& key) {
        auto text = Take(key);
        if (!text) return std::nullopt;
        errno = 0;
        char* end = nullptr;
        double v = std::strtod(text->c_str(), &end);
        if (text->empty() || *end != '\0' || errno == ERANGE) {
            throw InvalidArgumentException(stage_ + ": " + key + " is not a number: '" +
                                           *text + "'");
        }
        return v;
    }

    std::optional<int32_t> Int(const std::string& key) {
        auto text = Take(key);
        if (!text) return std::nullopt;
        errno = 0;
        char* end = nullptr;
        long long v = std::strtoll(text->c_str(), &end, 10);
        if (text->empty() || *end != '\0' || errno == ERANGE ||
            v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
            throw InvalidArgumentException(stage_ + ": " + key + " is not an integer: '" +
                                           *text + "'");
        }
        return static_cast<int32_t>(v);
    }

    std::optional<bool> Bool(const std::string& key) {
        auto text = Take(key);
        if (!text) return std::nullopt;
        std::string lower = *text;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        if (lower == "true" || lower == "1" || lower == "yes") return true;
        if (lower == "false" || lower == "0" || lower == "no") return false;
        throw InvalidArgumentException(stage_ + ": " + key + " is not a boolean: '" +
                                       *text + "'");
    }

    std::optional<std::string> String(const std::string& key) {
        return Take(key);
    }

    /// Throw if any key was not consumed
    void RequireAllUsed() const {
        if (!values_.empty()) {
            throw InvalidArgumentException(stage_ + ": unknown parameter '" +
                                           values_.begin()->first + "'");
        }
    }

private:
    std::optional<std::string> Take(const std::string& key) {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return std::nullopt;
        }
        std::string value = it->second;
        values_.erase(it);
        return value;
    }

    std::string stage_;
    std::map<std::string, std::string> values_;
};

} // anonymous namespace

// =============================================================================
// FilterPipeline
// =============================================================================

FilterPipeline::FilterPipeline(std::vector<FilterRequest> stages)
    : stages_(std::move(stages)) {}

FilterPipeline& FilterPipeline::Add(FilterRequest request) {
    stages_.push_back(std::move(request));
    return *this;
}

bool FilterPipeline::PrefersPng() const {
    return std::any_of(stages_.begin(), stages_.end(),
                       [](const FilterRequest& r) { return r.PrefersPng(); });
}

void FilterPipeline::Validate() const {
    for (size_t i = 0; i < stages_.size(); ++i) {
        try {
            stages_[i].Validate();
        } catch (const InvalidArgumentException& e) {
            Platform::LogError(TAG, StageLabel(i, stages_[i]) + " rejected: " + e.what());
            throw;
        }
    }
}

void FilterPipeline::Run(const PixelBuffer& image, PixelBuffer& output) const {
    Validate();

    PixelBuffer current(image);
    for (size_t i = 0; i < stages_.size(); ++i) {
        try {
            PixelBuffer next;
            ApplyKernel(current, next, stages_[i]);
            current = std::move(next);
        } catch (const std::exception& e) {
            Platform::LogError(TAG, StageLabel(i, stages_[i]) + " failed: " + e.what());
            throw;
        }
    }
    output = std::move(current);
}

EncodedImage FilterPipeline::Run(const EncodedImage& image, const EncodeOptions& options) const {
    Validate();

    PixelBuffer decoded;
    std::string error;
    if (!IO::TryDecodeImage(image, decoded, &error)) {
        Platform::LogWarning(TAG, "input not decodable, returning original bytes: " + error);
        return image;
    }

    PixelBuffer result;
    Run(decoded, result);

    IO::ImageFormat format = options.format.value_or(
        PrefersPng() ? IO::ImageFormat::PNG : IO::ImageFormat::JPEG);
    try {
        return IO::EncodeImage(result, format, options.jpegQuality);
    } catch (const IOException& e) {
        Platform::LogWarning(TAG, std::string("encode failed, returning original bytes: ") +
                             e.what());
        return image;
    }
}

// =============================================================================
// Chain Parsing
// =============================================================================

FilterRequest ParseFilterStage(const std::string& stage) {
    std::string text = Trim(stage);
    size_t colon = text.find(':');
    std::string name = Trim(text.substr(0, colon));
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);
    if (name.empty()) {
        throw InvalidArgumentException("empty filter stage");
    }

    StageArgs args(name, colon == std::string::npos ? std::string() : text.substr(colon + 1));
    FilterRequest request;

    if (name == "grayscale" || name == "gray") {
        request = GrayscaleParams{};
    } else if (name == "blur") {
        BlurParams p;
        p.sigma = args.Double("sigma").value_or(p.sigma);
        request = p;
    } else if (name == "brightness") {
        BrightnessParams p;
        p.factor = args.Double("factor").value_or(p.factor);
        request = p;
    } else if (name == "sepia") {
        request = SepiaParams{};
    } else if (name == "invert") {
        request = InvertParams{};
    } else if (name == "vignette") {
        VignetteParams p;
        p.intensity = args.Double("intensity").value_or(p.intensity);
        p.radius = args.Double("radius").value_or(p.radius);
        request = p;
    } else if (name == "watercolor") {
        WatercolorParams p;
        p.radius = args.Int("radius").value_or(p.radius);
        request = p;
    } else if (name == "oil_painting" || name == "oil") {
        OilPaintingParams p;
        p.radius = args.Int("radius").value_or(p.radius);
        p.levels = args.Int("levels").value_or(p.levels);
        request = p;
    } else if (name == "contrast") {
        ContrastParams p;
        p.factor = args.Double("factor").value_or(p.factor);
        request = p;
    } else if (name == "saturation") {
        SaturationParams p;
        p.factor = args.Double("factor").value_or(p.factor);
        request = p;
    } else if (name == "resize") {
        ResizeParams p;
        p.width = args.Int("width");
        p.height = args.Int("height");
        request = p;
    } else if (name == "rotate") {
        RotateParams p;
        p.degrees = args.Double("angle").value_or(p.degrees);
        request = p;
    } else if (name == "crop") {
        CropParams p;
        p.x = args.Int("x").value_or(p.x);
        p.y = args.Int("y").value_or(p.y);
        p.width = args.Int("width").value_or(p.width);
        p.height = args.Int("height").value_or(p.height);
        request = p;
    } else if (name == "flip") {
        FlipParams p;
        if (auto mode = args.String("mode")) {
            Transform::FlipMode m = Transform::ParseFlipMode(*mode);
            p.horizontal = (m == Transform::FlipMode::Horizontal || m == Transform::FlipMode::Both);
            p.vertical = (m == Transform::FlipMode::Vertical || m == Transform::FlipMode::Both);
        }
        p.horizontal = args.Bool("horizontal").value_or(p.horizontal);
        p.vertical = args.Bool("vertical").value_or(p.vertical);
        request = p;
    } else if (name == "watermark" || name == "detections") {
        throw InvalidArgumentException(name + ": stage needs binary input, build it in code");
    } else {
        throw InvalidArgumentException("Unknown filter stage: " + name);
    }

    args.RequireAllUsed();
    request.Validate();
    return request;
}

FilterPipeline ParseFilterChain(const std::string& chain) {
    if (Trim(chain).empty()) {
        throw InvalidArgumentException("empty filter chain");
    }

    FilterPipeline pipeline;
    for (const std::string& stage : Split(chain, '|')) {
        pipeline.Add(ParseFilterStage(stage));
    }
    return pipeline;
}

} // namespace Pix::Kit::Pipeline
