#include "objmap_export.h"

#include <fstream>

using nlohmann::json;

namespace objmap {

json to_json(const ObjectRecord& obj) {
    json j;
    j["label"] = obj.label;
    j["name"] = obj.name;
    j["display_flag"] = obj.display_flag;
    j["copy_flag"] = obj.copy_flag;
    j["mirror"] = obj.mirror;
    j["status"] = obj.status;
    j["n_used"] = obj.n_used;
    j["shades"] = obj.shades;
    j["start_color"] = obj.start_color;
    j["end_color"] = obj.end_color;
    j["rotation"] = obj.rotation;
    j["translation"] = obj.translation;
    j["center"] = obj.center;
    j["rotation_increment"] = obj.rotation_increment;
    j["translation_increment"] = obj.translation_increment;
    j["min_bound"] = obj.min_bound;
    j["max_bound"] = obj.max_bound;
    j["opacity"] = obj.opacity;
    j["opacity_thickness"] = obj.opacity_thickness;
    j["blend_factor"] = obj.blend_factor;
    return j;
}

json to_json(const ObjectMap& map) {
    json doc;
    doc["version_code"] = map.version_code();
    doc["version"] = map.version();
    doc["width"] = map.width();
    doc["height"] = map.height();
    doc["depth"] = map.depth();
    doc["object_count"] = map.object_count();
    doc["volume_count"] = map.volume_count();
    doc["element_width"] = map.header().element_width();

    json objects = json::array();
    for (const auto& obj : map.objects()) {
        objects.push_back(to_json(obj));
    }
    doc["objects"] = std::move(objects);

    json volumes = json::array();
    for (std::size_t i = 0; i < map.volumes().size(); ++i) {
        const VolumeData& vol = map.volumes()[i];
        json counts = json::object();
        for (const auto& [label, count] : vol.label_histogram()) {
            counts[std::to_string(label)] = count;
        }
        json entry;
        entry["index"] = i;
        entry["shape"] = vol.shape();
        entry["label_counts"] = std::move(counts);
        volumes.push_back(std::move(entry));
    }
    doc["volumes"] = std::move(volumes);
    return doc;
}

bool write_json(const std::string& path, const json& doc, std::string& err) {
    err.clear();
    std::ofstream out(path);
    if (!out) {
        err = "cannot open file";
        return false;
    }
    out << doc.dump(2) << "\n";
    if (!out) {
        err = "write error";
        return false;
    }
    return true;
}

}  // namespace objmap
