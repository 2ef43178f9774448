// ============= include/recognition/descriptor_gallery.hpp =============
/*
 * Descriptor Gallery - cache en memoria de (nombre, descriptor)
 *
 * - Proyeccion reconstruible de la tabla staff, nunca fuente de verdad
 * - load() arma una lista nueva aparte y luego cambia el puntero
 *   (swap atomico bajo snapshot_mutex). Un lector que ya tiene un
 *   snapshot sigue viendo la lista vieja completa.
 * - Filas sin encoding o con bytes mal formados se saltan con warning
 */

#pragma once
#include "core/attendance_error.hpp"
#include "recognition/descriptor.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class AttendanceDatabase;

struct GalleryEntry {
    int staff_id;
    std::string name;
    Descriptor descriptor;
};

using GallerySnapshot = std::shared_ptr<const std::vector<GalleryEntry>>;

struct GalleryLoadResult {
    bool ok = false;
    AttendanceError error = AttendanceError::None;
    GallerySnapshot entries;   // snapshot vigente tras la llamada
    size_t skipped = 0;        // filas sin encoding o mal formadas
};

class DescriptorGallery {
public:
    explicit DescriptorGallery(int descriptor_dim = DEFAULT_DESCRIPTOR_DIM);

    // Reconstruye desde la base. Si la base no responde se conserva el
    // snapshot anterior y se devuelve ConnectionError.
    GalleryLoadResult load(AttendanceDatabase& db);

    GallerySnapshot all() const;

    size_t size() const { return all()->size(); }
    bool empty() const { return all()->empty(); }
    int get_descriptor_dim() const { return descriptor_dim; }

private:
    int descriptor_dim;
    mutable std::mutex snapshot_mutex;
    GallerySnapshot snapshot;
};
