#include "rasterizer.hpp"
#include "../errors.hpp"
#include "../log.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <fstream>
#include <sstream>
#include <unistd.h>

#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>
#include <opencv2/freetype.hpp>

#include "cJSON.h"

namespace coolledx {

static coolledx::Logger::ptr g_logger = COOLLEDX_LOG_NAME("render");

static const int kCanvasWidth  = 2048;
static const int kCanvasHeight = 64;
static const int kTextTopOffset = 1;

// ==================== Helper Prototypes ======================
static cv::Scalar color_or_throw(const std::string& color);
static cv::Mat to_bgr(const cv::Mat& image);
static cv::Mat to_bgra(const cv::Mat& image);
static std::size_t utf8_length(const std::string& text);
static void append_u16(Bytes& out, std::size_t value);
static std::string resolve_font_path(const std::string& font);

// ==================== Color markers ==========================

static std::vector<std::string> split_on(const std::string& s, const std::string& sep) {
    std::vector<std::string> parts;
    if (sep.empty()) {
        parts.push_back(s);
        return parts;
    }
    std::size_t start = 0;
    while (true) {
        std::size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + sep.size();
    }
    return parts;
}

std::vector<ColorRun> split_color_runs(const std::string& text,
                                       const std::string& start_marker,
                                       const std::string& end_marker) {
    std::vector<ColorRun> runs;
    for (const auto& segment : split_on(text, end_marker)) {
        std::vector<std::string> pieces = split_on(segment, start_marker);
        ColorRun run;
        if (pieces.size() == 1) {
            run.text = pieces[0];
        } else {
            // "text<color" : the colour is the last piece and applies after the text
            run.has_color = true;
            run.color = pieces.back();
            for (std::size_t i = 0; i + 1 < pieces.size(); ++i) {
                run.text += pieces[i];
            }
        }
        runs.push_back(run);
    }
    return runs;
}

// ==================== Bit-plane packing ======================

BitPlanes pack_bit_planes(const cv::Mat& image, int output_width, int output_height,
                          const cv::Scalar& background,
                          HorizontalAlignment horizontal_alignment,
                          VerticalAlignment vertical_alignment) {
    if (output_height % Protocol::PIXELS_PER_BYTE != 0) {
        throw RenderError("target-height needs to be divisible by 8");
    }
    if (output_width < 0) {
        throw RenderError("target-width must not be negative");
    }

    cv::Mat img = image.empty() ? cv::Mat() : to_bgr(image);
    const int image_width  = img.cols;
    const int image_height = img.rows;

    int left_offset = 0, top_offset = 0;
    int crop_x = 0, crop_y = 0;

    switch (horizontal_alignment) {
        case HorizontalAlignment::Center:
            if (image_width < output_width) {
                left_offset = (output_width - image_width) / 2;
            } else if (image_width > output_width) {
                crop_x = (image_width - output_width) / 2;
            }
            break;
        case HorizontalAlignment::Right:
            if (image_width < output_width) {
                left_offset = output_width - image_width;
            } else if (image_width > output_width) {
                crop_x = image_width - output_width;
            }
            break;
        case HorizontalAlignment::Left:
        case HorizontalAlignment::None:
            break;
    }

    switch (vertical_alignment) {
        case VerticalAlignment::Center:
            if (image_height < output_height) {
                top_offset = (output_height - image_height) / 2;
            } else if (image_height > output_height) {
                crop_y = (image_height - output_height) / 2;
            }
            break;
        case VerticalAlignment::Bottom:
            if (image_height < output_height) {
                top_offset = output_height - image_height;
            } else if (image_height > output_height) {
                crop_y = image_height - output_height;
            }
            break;
        case VerticalAlignment::Top:
            break;
    }

    // background thresholded once
    const int bg_b = background[0] >= 128 ? 1 : 0;
    const int bg_g = background[1] >= 128 ? 1 : 0;
    const int bg_r = background[2] >= 128 ? 1 : 0;

    BitPlanes planes;
    const std::size_t plane_size = static_cast<std::size_t>(output_width) * (output_height / Protocol::PIXELS_PER_BYTE);
    planes.r.reserve(plane_size);
    planes.g.reserve(plane_size);
    planes.b.reserve(plane_size);

    int tmp_r = 0, tmp_g = 0, tmp_b = 0;
    for (int x = 0; x < output_width; ++x) {
        for (int y = 0; y < output_height; ++y) {
            int r, g, b;
            const int sx = x - left_offset + crop_x;
            const int sy = y - top_offset + crop_y;
            if (y < top_offset || x < left_offset ||
                sx >= image_width || sy >= image_height) {
                r = bg_r;
                g = bg_g;
                b = bg_b;
            } else {
                const cv::Vec3b& px = img.at<cv::Vec3b>(sy, sx);
                b = px[0] >= 128 ? 1 : 0;
                g = px[1] >= 128 ? 1 : 0;
                r = px[2] >= 128 ? 1 : 0;
            }

            tmp_r = (tmp_r << 1) | r;
            tmp_g = (tmp_g << 1) | g;
            tmp_b = (tmp_b << 1) | b;

            if (y % Protocol::PIXELS_PER_BYTE == Protocol::PIXELS_PER_BYTE - 1) {
                planes.r.push_back(static_cast<std::uint8_t>(tmp_r));
                planes.g.push_back(static_cast<std::uint8_t>(tmp_g));
                planes.b.push_back(static_cast<std::uint8_t>(tmp_b));
                tmp_r = tmp_g = tmp_b = 0;
            }
        }
    }
    return planes;
}

// ==================== Fitting ================================

cv::Mat fit_image(const cv::Mat& image, const PanelDimensions& panel,
                  WidthTreatment width_treatment, HeightTreatment height_treatment,
                  int& output_width) {
    const int width  = image.cols;
    const int height = image.rows;
    int new_width = width, new_height = height;
    output_width = width;

    if (width_treatment == WidthTreatment::Scale) {
        if (width == 0) {
            throw RenderError("cannot scale an empty image");
        }
        new_width = panel.width;
        output_width = panel.width;
        new_height = static_cast<int>(static_cast<long>(panel.width) * height / width);
    } else if (width_treatment == WidthTreatment::CropPad) {
        output_width = panel.width;
    }

    if (height_treatment == HeightTreatment::Scale) {
        if (height == 0) {
            throw RenderError("cannot scale an empty image");
        }
        new_height = panel.height;
        if (width_treatment == WidthTreatment::AsIs) {
            new_width = static_cast<int>(static_cast<long>(panel.height) * width / height);
            output_width = std::max<int>(new_width, panel.width);
        }
    }

    if (new_width == width && new_height == height) {
        return image;
    }
    if (new_width <= 0 || new_height <= 0) {
        std::ostringstream ss;
        ss << "cannot resize " << width << "x" << height << " image to "
           << new_width << "x" << new_height;
        throw RenderError(ss.str());
    }

    cv::Mat resized;
    cv::resize(image, resized, cv::Size(new_width, new_height), 0, 0, cv::INTER_CUBIC);
    return resized;
}

cv::Mat alpha_composite(const cv::Mat& dst, const cv::Mat& src) {
    cv::Mat d = to_bgra(dst);
    cv::Mat s = to_bgra(src);
    if (d.size() != s.size()) {
        throw RenderError("animation frames differ in size");
    }

    cv::Mat out(d.size(), CV_8UC4);
    for (int y = 0; y < d.rows; ++y) {
        for (int x = 0; x < d.cols; ++x) {
            const cv::Vec4b& dp = d.at<cv::Vec4b>(y, x);
            const cv::Vec4b& sp = s.at<cv::Vec4b>(y, x);
            const float sa = sp[3] / 255.0f;
            const float da = dp[3] / 255.0f;
            const float oa = sa + da * (1.0f - sa);

            cv::Vec4b& op = out.at<cv::Vec4b>(y, x);
            if (oa <= 0.0f) {
                op = cv::Vec4b(0, 0, 0, 0);
                continue;
            }
            for (int c = 0; c < 3; ++c) {
                const float v = (sp[c] * sa + dp[c] * da * (1.0f - sa)) / oa;
                op[c] = cv::saturate_cast<uchar>(v);
            }
            op[3] = cv::saturate_cast<uchar>(oa * 255.0f);
        }
    }
    return out;
}

// ==================== Rasterizer =============================

Rasterizer::Rasterizer(PanelDimensions panel)
    : panel_(panel)
{}

cv::Mat Rasterizer::render_text_image(const std::string& text, const TextOptions& text_options,
                                      const std::string& background_color) const {
    const cv::Scalar background = color_or_throw(background_color);
    cv::Mat canvas(kCanvasHeight, kCanvasWidth, CV_8UC3, background);

    std::vector<ColorRun> runs;
    if (text_options.use_markers) {
        runs = split_color_runs(text, text_options.start_marker, text_options.end_marker);
    } else {
        ColorRun run;
        run.text = text;
        runs.push_back(run);
    }

    // 1) font: freetype when the face loads, Hershey otherwise
    cv::Ptr<cv::freetype::FreeType2> ft2;
    const std::string font_path = resolve_font_path(text_options.font);
    if (!font_path.empty()) {
        try {
            ft2 = cv::freetype::createFreeType2();
            ft2->loadFontData(font_path, 0);
        } catch (const cv::Exception& e) {
            COOLLEDX_LOG_WARN(g_logger) << "Could not load font " << font_path
                                        << " (falling back to default font): " << e.what();
            ft2.reset();
        }
    } else {
        COOLLEDX_LOG_WARN(g_logger) << "Could not find font " << text_options.font
                                    << " (falling back to default font)";
    }

    const int hershey = cv::FONT_HERSHEY_SIMPLEX;
    const double hershey_scale = cv::getFontScaleFromHeight(hershey, text_options.font_height, 1);

    // 2) draw each run, advancing by its width
    int x_offset = 0;
    int y_max = kTextTopOffset;
    cv::Scalar color = color_or_throw(text_options.color);
    for (const auto& run : runs) {
        if (!run.text.empty()) {
            int baseline = 0;
            cv::Size size;
            if (ft2) {
                size = ft2->getTextSize(run.text, text_options.font_height, -1, &baseline);
                ft2->putText(canvas, run.text, cv::Point(x_offset, kTextTopOffset + size.height),
                             text_options.font_height, color, -1, cv::LINE_AA, false);
            } else {
                size = cv::getTextSize(run.text, hershey, hershey_scale, 1, &baseline);
                cv::putText(canvas, run.text, cv::Point(x_offset, kTextTopOffset + size.height),
                            hershey, hershey_scale, color, 1, cv::LINE_AA);
            }
            x_offset += size.width;
            y_max = std::max(y_max, size.height + baseline);
        }
        if (run.has_color) {
            color = color_or_throw(run.color);
        }
    }

    // 3) crop; anything past the canvas edge stays black
    cv::Mat out = cv::Mat::zeros(y_max + 1, x_offset, CV_8UC3);
    const cv::Rect src_rect(0, 0, std::min(x_offset, kCanvasWidth), std::min(y_max + 1, kCanvasHeight));
    if (src_rect.area() > 0) {
        canvas(src_rect).copyTo(out(src_rect));
    }
    return out;
}

Bytes Rasterizer::build_image_payload(const cv::Mat& image, const FitOptions& fit,
                                      const std::string* text) const {
    Bytes payload(Protocol::RESERVED_HEADER_SIZE, 0x00);

    if (text) {
        std::size_t buffer_length = Protocol::TEXT_BUFFER_SIZE;
        const std::size_t length = utf8_length(*text);
        if (length > Protocol::MAX_TEXT_LENGTH) {
            COOLLEDX_LOG_WARN(g_logger) << "Text message length exceeds 255 characters; may not work on all signs. "
                                        << *text;
            append_u16(payload, length);
            buffer_length = Protocol::TEXT_BUFFER_SIZE - 1;
        } else {
            payload.push_back(static_cast<std::uint8_t>(length));
        }

        // placeholder characters, the sign draws the bitmap anyway
        Bytes placeholder(buffer_length, 0x00);
        for (std::size_t i = 0; i < length && i < buffer_length; ++i) {
            placeholder[i] = Protocol::TEXT_PLACEHOLDER;
        }
        payload.insert(payload.end(), placeholder.begin(), placeholder.end());
    }

    int output_width = 0;
    cv::Mat fitted = fit_image(image, panel_, fit.width_treatment, fit.height_treatment, output_width);
    BitPlanes planes = pack_bit_planes(fitted, output_width, panel_.height,
                                       color_or_throw(fit.background_color),
                                       fit.horizontal_alignment, fit.vertical_alignment);

    const std::size_t bits = planes.r.size() + planes.g.size() + planes.b.size();
    if (bits > 0xFFFF) {
        throw RenderError("rendered image is too large for the sign (" + std::to_string(bits) + " bytes)");
    }
    append_u16(payload, bits);
    payload.insert(payload.end(), planes.r.begin(), planes.r.end());
    payload.insert(payload.end(), planes.g.begin(), planes.g.end());
    payload.insert(payload.end(), planes.b.begin(), planes.b.end());
    return payload;
}

Bytes Rasterizer::render_text(const std::string& text, const TextOptions& text_options,
                              const FitOptions& fit) const {
    cv::Mat image = render_text_image(text, text_options, fit.background_color);
    return build_image_payload(image, fit, text_options.render_as_text ? &text : nullptr);
}

Bytes Rasterizer::render_image(const cv::Mat& image, const FitOptions& fit) const {
    if (image.empty()) {
        throw RenderError("image is empty");
    }
    return build_image_payload(to_bgr(image), fit, nullptr);
}

Bytes Rasterizer::render_image_file(const std::string& path, const FitOptions& fit) const {
    cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw RenderError("Could not read image " + path);
    }
    return render_image(image, fit);
}

Bytes Rasterizer::render_animation(const std::vector<cv::Mat>& frames, int speed,
                                   const FitOptions& fit) const {
    if (frames.empty()) {
        throw RenderError("animation has no frames");
    }
    if (frames.size() > Protocol::MAX_ANIMATION_FRAMES) {
        throw RenderError("animation has " + std::to_string(frames.size()) +
                          " frames, the sign accepts at most 255");
    }
    if (speed < 0 || speed > 0xFFFF) {
        throw RenderError("animation speed must be between 0 and 65535");
    }

    // animations always fill the panel exactly
    const WidthTreatment width_treatment =
        fit.width_treatment == WidthTreatment::Scale ? WidthTreatment::Scale : WidthTreatment::CropPad;
    const cv::Scalar background = color_or_throw(fit.background_color);

    Bytes anim_r, anim_g, anim_b;
    cv::Mat combined;
    for (const auto& frame : frames) {
        // the sign does not clear between frames, so composite over the previous one
        combined = combined.empty() ? to_bgra(frame) : alpha_composite(combined, frame);

        int output_width = 0;
        cv::Mat fitted = fit_image(combined, panel_, width_treatment, fit.height_treatment, output_width);
        BitPlanes planes = pack_bit_planes(fitted, panel_.width, panel_.height, background,
                                           fit.horizontal_alignment, fit.vertical_alignment);
        anim_r.insert(anim_r.end(), planes.r.begin(), planes.r.end());
        anim_g.insert(anim_g.end(), planes.g.begin(), planes.g.end());
        anim_b.insert(anim_b.end(), planes.b.begin(), planes.b.end());
    }

    Bytes payload(Protocol::RESERVED_HEADER_SIZE, 0x00);
    payload.push_back(static_cast<std::uint8_t>(frames.size()));
    append_u16(payload, static_cast<std::size_t>(speed));
    payload.insert(payload.end(), anim_r.begin(), anim_r.end());
    payload.insert(payload.end(), anim_g.begin(), anim_g.end());
    payload.insert(payload.end(), anim_b.begin(), anim_b.end());
    if (payload.size() > Protocol::MAX_CHUNKED_PAYLOAD) {
        std::ostringstream ss;
        ss << "animation of " << frames.size() << " frames is " << payload.size()
           << " bytes, more than the sign accepts (" << Protocol::MAX_CHUNKED_PAYLOAD << ")";
        throw RenderError(ss.str());
    }
    return payload;
}

Bytes Rasterizer::render_animation_file(const std::string& path, int speed,
                                        const FitOptions& fit) const {
    cv::VideoCapture cap(path);
    if (!cap.isOpened()) {
        throw RenderError("Could not open animation " + path);
    }

    std::vector<cv::Mat> frames;
    cv::Mat frame;
    while (cap.read(frame)) {
        if (frame.empty()) {
            break;
        }
        frames.push_back(frame.clone());
    }
    cap.release();

    if (frames.size() < 2) {
        throw RenderError("image " + path + " is not animated");
    }
    COOLLEDX_LOG_DEBUG(g_logger) << "animation " << path << " has " << frames.size() << " frames";
    return render_animation(frames, speed, fit);
}

// ==================== JT container ===========================

// Reads an integer member; false if absent, throws if present but not an integer.
static bool jt_int(const cJSON* object, const char* key, long& out) {
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(object, key);
    if (!item) {
        return false;
    }
    if (!cJSON_IsNumber(item) || item->valuedouble != std::floor(item->valuedouble)) {
        throw RenderError(std::string("JT field '") + key + "' is not an integer");
    }
    out = static_cast<long>(item->valuedouble);
    return true;
}

static Bytes jt_bytes(const cJSON* array, const char* key) {
    if (!cJSON_IsArray(array)) {
        throw RenderError(std::string("JT field '") + key + "' is not an array");
    }
    Bytes out;
    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, array) {
        if (!cJSON_IsNumber(item) || item->valuedouble < 0 || item->valuedouble > 255 ||
            item->valuedouble != std::floor(item->valuedouble)) {
            throw RenderError(std::string("JT field '") + key + "' holds a value that is not a byte");
        }
        out.push_back(static_cast<std::uint8_t>(item->valuedouble));
    }
    return out;
}

JtPayload Rasterizer::render_jt(const std::string& json) const {
    std::unique_ptr<cJSON, void (*)(cJSON*)> doc(cJSON_Parse(json.c_str()), cJSON_Delete);
    const cJSON* root = doc.get();
    if (!root) {
        const char* where = cJSON_GetErrorPtr();
        throw RenderError(std::string("JT document is not valid JSON") +
                          (where ? std::string(" near: ") + std::string(where).substr(0, 32) : ""));
    }

    JtPayload result;
    const cJSON* first = cJSON_IsArray(root) ? cJSON_GetArrayItem(root, 0) : nullptr;
    const cJSON* data = first ? cJSON_GetObjectItemCaseSensitive(first, "data") : nullptr;
    if (!cJSON_IsObject(data)) {
        throw RenderError("JT document must be an array whose first element has a 'data' object");
    }

    long pixel_width = 0, pixel_height = 0;
    if (!jt_int(data, "pixelWidth", pixel_width) || !jt_int(data, "pixelHeight", pixel_height)) {
        throw RenderError("JT data is missing pixelWidth/pixelHeight");
    }
    if (pixel_width != panel_.width || pixel_height != panel_.height) {
        COOLLEDX_LOG_INFO(g_logger) << "JT content is " << pixel_width << "x" << pixel_height
                                    << ", sign is " << panel_.width << "x" << panel_.height;
    }

    long frames = 1, speed = 0;
    jt_int(data, "frameNum", frames);
    jt_int(data, "delays", speed);

    bool has_bits = false;
    Bytes bits;
    const cJSON* ani = cJSON_GetObjectItemCaseSensitive(data, "aniData");
    const cJSON* graffiti = cJSON_GetObjectItemCaseSensitive(data, "graffitiData");
    if (ani) {
        bits = jt_bytes(ani, "aniData");
        has_bits = true;
        result.is_static_image = false;
    }
    if (graffiti) {
        bits = jt_bytes(graffiti, "graffitiData");
        has_bits = true;
        result.is_static_image = true;
    }

    result.payload.assign(Protocol::RESERVED_HEADER_SIZE, 0x00);
    if (!result.is_static_image) {
        if (frames < 0 || frames > 0xFF) {
            throw RenderError("JT frameNum must be between 0 and 255");
        }
        if (speed < 0 || speed > 0xFFFF) {
            throw RenderError("JT delays must be between 0 and 65535");
        }
        result.payload.push_back(static_cast<std::uint8_t>(frames));
        append_u16(result.payload, static_cast<std::size_t>(speed));
    }

    if (has_bits) {
        if (bits.size() > 0xFFFF) {
            throw RenderError("JT bit-stream is too large");
        }
        append_u16(result.payload, bits.size());
        result.payload.insert(result.payload.end(), bits.begin(), bits.end());
    } else {
        COOLLEDX_LOG_WARN(g_logger) << "JT data has neither aniData nor graffitiData; sending header only";
    }
    return result;
}

JtPayload Rasterizer::render_jt_file(const std::string& path) const {
    std::ifstream in(path);
    if (!in) {
        throw RenderError("Could not open JT file " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return render_jt(ss.str());
}

// ==================== Helpers ================================

static cv::Scalar color_or_throw(const std::string& color) {
    cv::Scalar bgr;
    if (!parse_color(color, bgr)) {
        throw ValidationError("Unknown color: " + color);
    }
    return bgr;
}

static cv::Mat to_bgr(const cv::Mat& image) {
    if (image.depth() != CV_8U) {
        throw RenderError("only 8-bit images are supported");
    }
    cv::Mat out;
    switch (image.channels()) {
        case 1: cv::cvtColor(image, out, cv::COLOR_GRAY2BGR); break;
        case 3: out = image; break;
        case 4: cv::cvtColor(image, out, cv::COLOR_BGRA2BGR); break;
        default:
            throw RenderError("unsupported channel count " + std::to_string(image.channels()));
    }
    return out;
}

static cv::Mat to_bgra(const cv::Mat& image) {
    if (image.depth() != CV_8U) {
        throw RenderError("only 8-bit images are supported");
    }
    cv::Mat out;
    switch (image.channels()) {
        case 1: cv::cvtColor(image, out, cv::COLOR_GRAY2BGRA); break;
        case 3: cv::cvtColor(image, out, cv::COLOR_BGR2BGRA); break;
        case 4: out = image; break;
        default:
            throw RenderError("unsupported channel count " + std::to_string(image.channels()));
    }
    return out;
}

// code points, not bytes
static std::size_t utf8_length(const std::string& text) {
    std::size_t n = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

static void append_u16(Bytes& out, std::size_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

static bool readable(const std::string& path) {
    return ::access(path.c_str(), R_OK) == 0;
}

static std::string resolve_font_path(const std::string& font) {
    if (font.empty()) {
        return "";
    }
    if (readable(font)) {
        return font;
    }

    std::vector<std::string> names = {font, font + ".ttf", font + ".TTF", font + ".otf"};
    std::string lower = font;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower != font) {
        names.push_back(lower + ".ttf");
    }

    std::vector<std::string> dirs = {
        ".",
        "/usr/share/fonts/truetype/msttcorefonts",
        "/usr/share/fonts/truetype/dejavu",
        "/usr/share/fonts/truetype/liberation",
        "/usr/share/fonts/truetype",
        "/usr/share/fonts/TTF",
        "/usr/local/share/fonts",
        "/Library/Fonts",
    };
    if (const char* home = getenv("HOME")) {
        dirs.push_back(std::string(home) + "/.fonts");
        dirs.push_back(std::string(home) + "/.local/share/fonts");
    }

    for (const auto& dir : dirs) {
        for (const auto& name : names) {
            std::string candidate = dir + "/" + name;
            if (readable(candidate)) {
                return candidate;
            }
        }
    }
    return "";
}

}
