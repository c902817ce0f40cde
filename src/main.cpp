// main.cpp
#include "types.hpp"
#include "pixel_grid.hpp"
#include "mask_source.hpp"
#include "component_labeler.hpp"
#include "blob_renderer.hpp"
#include "dynamic_threshold.hpp"

#include <opencv2/core.hpp>
#include <filesystem>
#include <fstream>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using clk = std::chrono::high_resolution_clock;

static long long ms_since(clk::time_point t0) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clk::now() - t0).count();
}

static void print_usage(const char* prog) {
    std::cout
        << "Usage:\n"
        << "  " << prog << " blobs <image> [options]\n"
        << "  " << prog << " dynthres <image> -o <out> [options]\n\n"
        << "blobs options:\n"
        << "  --source threshold|color   mask source (default threshold)\n"
        << "  --percentile P             luminance percentile in [0,1] (default 0.2)\n"
        << "  --direction below|above    side of the cutoff that is foreground (default below)\n"
        << "  --target RRGGBB            color for --source color\n"
        << "  --distance D               max RGB distance for --source color (default 0)\n"
        << "  --connectivity 4|8         neighborhood (default 4)\n"
        << "  --min-area N               drop smaller blobs (default 1)\n"
        << "  --mode outline|fill|heatmap|report   (default report)\n"
        << "  --fill solid|palette       fill policy (default palette)\n"
        << "  --fill-color RRGGBB        color for --fill solid (default 00ff00)\n"
        << "  --outline-color RRGGBB     (default ff0000)\n"
        << "  --background original|black|transparent   (default original)\n"
        << "  -o <path>                  output image, or report file\n\n"
        << "dynthres options:\n"
        << "  --lower F --upper F        dark/bright pixel fractions (default 0.2/0.2)\n"
        << "  --dark RRGGBB --mid RRGGBB --bright RRGGBB\n\n"
        << "  --debug                    print stage timings and statistics\n";
}

struct CliOptions {
    std::string command;
    std::string input;
    std::string output;
    bool debug = false;

    std::string source = "threshold";
    ThresholdParams threshold;
    ColorMaskParams color;
    LabelingParams labeling;
    RenderMode mode = RenderMode::REPORT;
    RenderParams render;
    TriThresholdParams tri;
};

static bool fail(SegError se, const std::string& what) {
    std::cerr << "[error] " << se_to_cstr(se) << ": " << what << "\n";
    return false;
}

static bool parse_number(const std::string& text, double& v) {
    try {
        size_t used = 0;
        v = std::stod(text, &used);
        return used == text.size();
    }
    catch (const std::exception&) {
        return false;
    }
}

static bool parse_args(int argc, char** argv, CliOptions& o) {
    if (argc < 3) return false;
    o.command = argv[1];
    o.input = argv[2];
    for (int i = 3; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--debug") { o.debug = true; continue; }
        if (i + 1 >= argc) { std::cerr << "Missing value for " << a << "\n"; return false; }
        const std::string v = argv[++i];
        double num = 0.0;
        cv::Vec3b rgb;

        if (a == "-o" || a == "--output") o.output = v;
        else if (a == "--source") {
            if (v != "threshold" && v != "color") { std::cerr << "Unknown mask source " << v << "\n"; return false; }
            o.source = v;
        }
        else if (a == "--percentile") {
            if (!parse_number(v, num)) return fail(SegError::BAD_PERCENTILE, v);
            o.threshold.percentile = num;
        }
        else if (a == "--direction") {
            if (v == "below") o.threshold.direction = ThresholdDirection::BELOW;
            else if (v == "above") o.threshold.direction = ThresholdDirection::ABOVE;
            else { std::cerr << "Direction must be below or above\n"; return false; }
        }
        else if (a == "--target") {
            if (parse_hex_color(v, rgb) != SegError::NONE) return fail(SegError::BAD_COLOR, v);
            o.color.target = rgb;
        }
        else if (a == "--distance") {
            if (!parse_number(v, num)) return fail(SegError::BAD_DISTANCE, v);
            o.color.max_distance = num;
        }
        else if (a == "--connectivity") {
            if (!parse_int(v, o.labeling.connectivity)) return fail(SegError::BAD_CONNECTIVITY, v);
        }
        else if (a == "--min-area") {
            if (!parse_int(v, o.labeling.min_area)) return fail(SegError::BAD_MIN_AREA, v);
        }
        else if (a == "--mode") {
            if (parse_render_mode(v, o.mode) != SegError::NONE) return fail(SegError::BAD_RENDER_MODE, v);
        }
        else if (a == "--fill") {
            if (v == "solid") o.render.fill = FillPolicy::SOLID;
            else if (v == "palette") o.render.fill = FillPolicy::PALETTE;
            else { std::cerr << "Fill must be solid or palette\n"; return false; }
        }
        else if (a == "--fill-color" || a == "--outline-color" ||
                 a == "--dark" || a == "--mid" || a == "--bright") {
            if (parse_hex_color(v, rgb) != SegError::NONE) return fail(SegError::BAD_COLOR, v);
            if (a == "--fill-color") o.render.fill_color = rgb;
            else if (a == "--outline-color") o.render.outline_color = rgb;
            else if (a == "--dark") o.tri.dark = rgb;
            else if (a == "--mid") o.tri.mid = rgb;
            else o.tri.bright = rgb;
        }
        else if (a == "--background") {
            if (parse_background(v, o.render.background) != SegError::NONE) return fail(SegError::BAD_BACKGROUND, v);
        }
        else if (a == "--lower" || a == "--upper") {
            if (!parse_number(v, num)) return fail(SegError::BAD_PERCENTILE, v);
            (a == "--lower" ? o.tri.lower : o.tri.upper) = num;
        }
        else {
            std::cerr << "Unknown option " << a << "\n";
            return false;
        }
    }
    o.labeling.debug = o.debug;
    return true;
}

static int run_dynthres(const CliOptions& o, const cv::Mat& grid) {
    if (o.output.empty()) { std::cerr << "dynthres needs -o <out>\n"; return 1; }
    auto t0 = clk::now();
    cv::Mat out;
    SegError se = tri_threshold(grid, o.tri, out);
    if (se != SegError::NONE) { fail(se, o.input); return 1; }
    if (!write_grid(o.output, out)) { std::cerr << "[error] cannot write " << o.output << "\n"; return 1; }
    if (o.debug) std::cout << "[timing] dynthres " << ms_since(t0) << " ms\n";
    return 0;
}

static int run_blobs(const CliOptions& o, const cv::Mat& grid) {
    std::unique_ptr<MaskSource> source;
    if (o.source == "color") source = std::make_unique<ColorMaskSource>(o.color);
    else                     source = std::make_unique<ThresholdMaskSource>(o.threshold);

    // 1) Foreground mask
    auto t0 = clk::now();
    cv::Mat mask;
    SegError se = source->build(grid, mask);
    if (se != SegError::NONE) { fail(se, std::string("mask source ") + source->name()); return 1; }
    if (o.debug) {
        std::cout << "[timing] mask (" << source->name() << ") " << ms_since(t0) << " ms, foreground="
                  << cv::countNonZero(mask) << "/" << mask.total() << "\n";
    }

    // 2) Connected components
    t0 = clk::now();
    Labeling lab;
    se = label_components(mask, grid, o.labeling, lab);
    if (se != SegError::NONE) { fail(se, "labeling"); return 1; }
    if (o.debug) std::cout << "[timing] labeling " << ms_since(t0) << " ms, blobs=" << lab.blobs.size() << "\n";

    // 3) Render or report
    t0 = clk::now();
    RenderOutput out;
    se = render(grid, lab.labels, lab.blobs, o.mode, o.render, out);
    if (se != SegError::NONE) { fail(se, render_mode_name(o.mode)); return 1; }
    if (o.debug) std::cout << "[timing] render (" << render_mode_name(o.mode) << ") " << ms_since(t0) << " ms\n";

    if (o.mode == RenderMode::REPORT) {
        if (o.output.empty()) { std::cout << out.report << "\n"; return 0; }
        std::ofstream f(o.output);
        f << out.report << "\n";
        if (!f) { std::cerr << "[error] cannot write " << o.output << "\n"; return 1; }
        return 0;
    }
    if (o.output.empty()) { std::cerr << "image modes need -o <out>\n"; return 1; }
    if (!write_grid(o.output, out.image)) { std::cerr << "[error] cannot write " << o.output << "\n"; return 1; }
    return 0;
}

int main(int argc, char** argv) {
    CliOptions o;
    if (!parse_args(argc, argv, o)) {
        print_usage(argv[0]);
        return 1;
    }
    if (o.command != "blobs" && o.command != "dynthres") {
        std::cerr << "Unknown command " << o.command << "\n";
        print_usage(argv[0]);
        return 1;
    }
    if (!std::filesystem::exists(o.input)) {
        std::cerr << o.input << " is not a valid picture path\n";
        return 1;
    }

    auto t0 = clk::now();
    cv::Mat grid;
    SegError se = read_grid(o.input, grid);
    if (se != SegError::NONE) { fail(se, "cannot decode " + o.input); return 1; }
    if (o.debug) std::cout << "[timing] decode " << grid.cols << "x" << grid.rows << " " << ms_since(t0) << " ms\n";

    return o.command == "dynthres" ? run_dynthres(o, grid) : run_blobs(o, grid);
}
