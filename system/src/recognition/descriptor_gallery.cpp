#include "recognition/descriptor_gallery.hpp"
#include "database/attendance_database.hpp"
#include <spdlog/spdlog.h>
#include <utility>

DescriptorGallery::DescriptorGallery(int descriptor_dim)
    : descriptor_dim(descriptor_dim),
      snapshot(std::make_shared<const std::vector<GalleryEntry>>())
{
}

GalleryLoadResult DescriptorGallery::load(AttendanceDatabase& db) {
    GalleryLoadResult result;

    std::vector<DescriptorRow> rows;
    AttendanceError err = db.load_descriptor_rows(rows);
    if (err != AttendanceError::None) {
        spdlog::error("Error loading known faces: {}", to_string(err));
        result.error = err;
        result.entries = all();
        return result;
    }

    auto entries = std::make_shared<std::vector<GalleryEntry>>();
    entries->reserve(rows.size());

    for (const auto& row : rows) {
        if (!row.has_encoding) {
            spdlog::warn("Warning: No face encoding found for {}", row.name);
            result.skipped++;
            continue;
        }

        Descriptor descriptor;
        if (!deserialize_descriptor(row.encoding.data(), row.encoding.size(),
                                    descriptor_dim, descriptor) ||
            !is_valid_descriptor(descriptor, descriptor_dim)) {
            spdlog::warn("Warning: Malformed face encoding for {} (ID={}, {} bytes, expected {})",
                         row.name, row.staff_id, row.encoding.size(),
                         static_cast<size_t>(descriptor_dim) * DESCRIPTOR_VALUE_BYTES);
            result.skipped++;
            continue;
        }

        entries->push_back({row.staff_id, row.name, std::move(descriptor)});
    }

    GallerySnapshot fresh = std::move(entries);
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex);
        snapshot = fresh;
    }

    spdlog::info("Gallery loaded: {} faces ({} skipped)", fresh->size(), result.skipped);

    result.ok = true;
    result.entries = fresh;
    return result;
}

GallerySnapshot DescriptorGallery::all() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex);
    return snapshot;
}
