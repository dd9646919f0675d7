#include "render_types.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace coolledx {

static std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Same values as the CSS/X11 names, so "green" is #008000 and "lime" is #00ff00.
static const std::map<std::string, std::uint32_t>& color_names() {
    static const std::map<std::string, std::uint32_t> names = {
        {"black",     0x000000}, {"white",     0xffffff}, {"red",       0xff0000},
        {"lime",      0x00ff00}, {"green",     0x008000}, {"blue",      0x0000ff},
        {"yellow",    0xffff00}, {"cyan",      0x00ffff}, {"aqua",      0x00ffff},
        {"magenta",   0xff00ff}, {"fuchsia",   0xff00ff}, {"orange",    0xffa500},
        {"purple",    0x800080}, {"pink",      0xffc0cb}, {"brown",     0xa52a2a},
        {"gray",      0x808080}, {"grey",      0x808080}, {"silver",    0xc0c0c0},
        {"maroon",    0x800000}, {"navy",      0x000080}, {"olive",     0x808000},
        {"teal",      0x008080}, {"gold",      0xffd700}, {"violet",    0xee82ee},
        {"indigo",    0x4b0082}, {"coral",     0xff7f50}, {"salmon",    0xfa8072},
        {"crimson",   0xdc143c}, {"orchid",    0xda70d6}, {"turquoise", 0x40e0d0},
        {"darkred",   0x8b0000}, {"darkgreen", 0x006400}, {"darkblue",  0x00008b},
        {"lightblue", 0xadd8e6}, {"lightgreen",0x90ee90}, {"skyblue",   0x87ceeb},
        {"orangered", 0xff4500}, {"chartreuse",0x7fff00}, {"springgreen",0x00ff7f},
        {"deeppink",  0xff1493}, {"hotpink",   0xff69b4}, {"tomato",    0xff6347},
    };
    return names;
}

bool parse_color(const std::string& text, cv::Scalar& bgr) {
    std::string s = lower(text);
    s.erase(std::remove_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); }), s.end());
    if (s.empty()) {
        return false;
    }

    std::uint32_t rgb = 0;
    if (s[0] == '#') {
        std::string digits = s.substr(1);
        if (digits.size() == 3) {
            // #rgb -> #rrggbb
            digits = {digits[0], digits[0], digits[1], digits[1], digits[2], digits[2]};
        }
        if (digits.size() != 6) {
            return false;
        }
        for (char c : digits) {
            int v = hex_digit(c);
            if (v < 0) return false;
            rgb = (rgb << 4) | static_cast<std::uint32_t>(v);
        }
    } else {
        auto it = color_names().find(s);
        if (it == color_names().end()) {
            return false;
        }
        rgb = it->second;
    }

    bgr = cv::Scalar(rgb & 0xFF, (rgb >> 8) & 0xFF, (rgb >> 16) & 0xFF);
    return true;
}

bool parse_width_treatment(const std::string& s, WidthTreatment& out) {
    std::string v = lower(s);
    if (v == "scale")                     { out = WidthTreatment::Scale;   return true; }
    if (v == "croppad" || v == "crop_pad") { out = WidthTreatment::CropPad; return true; }
    if (v == "asis" || v == "leftasis" || v == "left_as_is") { out = WidthTreatment::AsIs; return true; }
    return false;
}

bool parse_height_treatment(const std::string& s, HeightTreatment& out) {
    std::string v = lower(s);
    if (v == "scale")                     { out = HeightTreatment::Scale;   return true; }
    if (v == "croppad" || v == "crop_pad") { out = HeightTreatment::CropPad; return true; }
    return false;
}

bool parse_horizontal_alignment(const std::string& s, HorizontalAlignment& out) {
    std::string v = lower(s);
    if (v == "left")   { out = HorizontalAlignment::Left;   return true; }
    if (v == "center") { out = HorizontalAlignment::Center; return true; }
    if (v == "right")  { out = HorizontalAlignment::Right;  return true; }
    if (v == "none")   { out = HorizontalAlignment::None;   return true; }
    return false;
}

bool parse_vertical_alignment(const std::string& s, VerticalAlignment& out) {
    std::string v = lower(s);
    if (v == "top")    { out = VerticalAlignment::Top;    return true; }
    if (v == "center") { out = VerticalAlignment::Center; return true; }
    if (v == "bottom") { out = VerticalAlignment::Bottom; return true; }
    return false;
}

const char* to_string(WidthTreatment v) {
    switch (v) {
        case WidthTreatment::Scale:   return "scale";
        case WidthTreatment::CropPad: return "croppad";
        case WidthTreatment::AsIs:    return "asis";
    }
    return "?";
}

const char* to_string(HeightTreatment v) {
    return v == HeightTreatment::Scale ? "scale" : "croppad";
}

const char* to_string(HorizontalAlignment v) {
    switch (v) {
        case HorizontalAlignment::Left:   return "left";
        case HorizontalAlignment::Center: return "center";
        case HorizontalAlignment::Right:  return "right";
        case HorizontalAlignment::None:   return "none";
    }
    return "?";
}

const char* to_string(VerticalAlignment v) {
    switch (v) {
        case VerticalAlignment::Top:    return "top";
        case VerticalAlignment::Center: return "center";
        case VerticalAlignment::Bottom: return "bottom";
    }
    return "?";
}

}
