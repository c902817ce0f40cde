#include "report.hpp"
#include "nlohmann/json.hpp"
#include <cstdint>
#include <iostream>
#include <limits>
using json = nlohmann::json;

std::string blobs_to_json(const std::vector<Blob>& blobs, int width, int height, int indent) {
    json doc;
    doc["width"] = width;
    doc["height"] = height;
    doc["count"] = blobs.size();
    doc["blobs"] = json::array();
    for (const Blob& b : blobs) {
        json jb;
        jb["id"] = b.id;
        jb["area"] = b.area;
        jb["bbox"] = {
            { "min_x", b.box.min_x }, { "min_y", b.box.min_y },
            { "max_x", b.box.max_x }, { "max_y", b.box.max_y }
        };
        jb["centroid"] = { { "x", b.centroid.x }, { "y", b.centroid.y } };
        jb["color"] = json::array({ (int)b.color[0], (int)b.color[1], (int)b.color[2] });
        doc["blobs"].push_back(jb);
    }
    return doc.dump(indent);
}

// Integral JSON number in int range; floats like 3.7 are not truncated.
static bool read_int(const json& j, int& v) {
    if (!j.is_number_integer()) return false;
    const int64_t wide = j.get<int64_t>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) return false;
    v = (int)wide;
    return true;
}

SegError blobs_from_json(const std::string& text, std::vector<Blob>& blobs) {
    blobs.clear();
    try {
        const json doc = json::parse(text);
        std::vector<Blob> parsed;
        for (const json& jb : doc.at("blobs")) {
            Blob b;
            const json& box = jb.at("bbox");
            if (!read_int(jb.at("id"), b.id) || !read_int(jb.at("area"), b.area) ||
                !read_int(box.at("min_x"), b.box.min_x) || !read_int(box.at("min_y"), b.box.min_y) ||
                !read_int(box.at("max_x"), b.box.max_x) || !read_int(box.at("max_y"), b.box.max_y))
                return SegError::BAD_REPORT;
            b.centroid.x = jb.at("centroid").at("x").get<double>();
            b.centroid.y = jb.at("centroid").at("y").get<double>();
            const json& color = jb.at("color");
            if (!color.is_array() || color.size() != 3) return SegError::BAD_REPORT;
            for (int c = 0; c < 3; ++c) {
                int v = 0;
                if (!read_int(color[c], v) || v < 0 || v > 255) return SegError::BAD_REPORT;
                b.color[c] = (uchar)v;
            }
            if (b.id < 1 || b.area < 1) return SegError::BAD_REPORT;
            parsed.push_back(b);
        }
        blobs.swap(parsed);
    }
    catch (const json::exception& e) {
        std::cerr << "[warn] report parse: " << e.what() << "\n";
        return SegError::BAD_REPORT;
    }
    return SegError::NONE;
}
