#pragma once

#include <string>
#include <cstdint>

#include <opencv2/core.hpp>

#include "../config.h"
#include "../protocol_data.hpp"

namespace coolledx {

// How a source raster is fitted to the panel.
enum class WidthTreatment  { Scale, CropPad, AsIs };
enum class HeightTreatment { Scale, CropPad };
enum class HorizontalAlignment { Left, Center, Right, None };
enum class VerticalAlignment   { Top, Center, Bottom };

struct FitOptions {
    WidthTreatment      width_treatment      = WidthTreatment::AsIs;
    HeightTreatment     height_treatment     = HeightTreatment::CropPad;
    HorizontalAlignment horizontal_alignment = HorizontalAlignment::None;
    VerticalAlignment   vertical_alignment   = VerticalAlignment::Center;
    std::string         background_color     = kDefaultBackgroundColor;
};

struct TextOptions {
    std::string font         = kDefaultFont;
    int         font_height  = kDefaultFontSize;
    std::string color        = kDefaultColor;
    std::string start_marker = kDefaultStartColorMarker;
    std::string end_marker   = kDefaultEndColorMarker;
    bool        use_markers  = true;
    // false sends the rendered text as a plain image
    bool        render_as_text = true;
};

// Animations are always centered and scaled to the panel unless told otherwise.
inline FitOptions default_animation_fit() {
    FitOptions f;
    f.width_treatment      = WidthTreatment::Scale;
    f.height_treatment     = HeightTreatment::Scale;
    f.horizontal_alignment = HorizontalAlignment::Center;
    f.vertical_alignment   = VerticalAlignment::Center;
    return f;
}

// "#rgb", "#rrggbb" or a colour name. Output is BGR, as OpenCV draws.
bool parse_color(const std::string& text, cv::Scalar& bgr);

bool parse_width_treatment(const std::string& s, WidthTreatment& out);
bool parse_height_treatment(const std::string& s, HeightTreatment& out);
bool parse_horizontal_alignment(const std::string& s, HorizontalAlignment& out);
bool parse_vertical_alignment(const std::string& s, VerticalAlignment& out);

const char* to_string(WidthTreatment v);
const char* to_string(HeightTreatment v);
const char* to_string(HorizontalAlignment v);
const char* to_string(VerticalAlignment v);

}
