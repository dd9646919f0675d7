#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "render_types.hpp"
#include "../protocol_data.hpp"

namespace coolledx {

// One run of text and the colour that takes effect after it.
struct ColorRun {
    std::string text;
    bool        has_color = false;
    std::string color;
};

struct BitPlanes {
    Bytes r;
    Bytes g;
    Bytes b;
};

struct JtPayload {
    Bytes payload;
    bool  is_static_image = false;
};

std::vector<ColorRun> split_color_runs(const std::string& text,
                                       const std::string& start_marker,
                                       const std::string& end_marker);

// Packs one frame column by column, MSB = top row of each 8-row group.
// Pixels outside the aligned source take the background colour.
BitPlanes pack_bit_planes(const cv::Mat& image, int output_width, int output_height,
                          const cv::Scalar& background,
                          HorizontalAlignment horizontal_alignment,
                          VerticalAlignment vertical_alignment);

// Resizes the image per the treatments; output_width receives the width to pack at.
cv::Mat fit_image(const cv::Mat& image, const PanelDimensions& panel,
                  WidthTreatment width_treatment, HeightTreatment height_treatment,
                  int& output_width);

// PIL-style "over" of src onto dst, both BGRA.
cv::Mat alpha_composite(const cv::Mat& dst, const cv::Mat& src);

class Rasterizer {
public:
    explicit Rasterizer(PanelDimensions panel);

    const PanelDimensions& panel() const { return panel_; }

    // Colour-marked text on a background-filled canvas, cropped to the drawn extent.
    cv::Mat render_text_image(const std::string& text, const TextOptions& text_options,
                              const std::string& background_color) const;

    Bytes render_text(const std::string& text, const TextOptions& text_options,
                      const FitOptions& fit) const;
    Bytes render_image(const cv::Mat& image, const FitOptions& fit) const;
    Bytes render_image_file(const std::string& path, const FitOptions& fit) const;
    Bytes render_animation(const std::vector<cv::Mat>& frames, int speed, const FitOptions& fit) const;
    Bytes render_animation_file(const std::string& path, int speed, const FitOptions& fit) const;

    JtPayload render_jt(const std::string& json) const;
    JtPayload render_jt_file(const std::string& path) const;

private:
    Bytes build_image_payload(const cv::Mat& image, const FitOptions& fit,
                              const std::string* text) const;

    PanelDimensions panel_;
};

}
