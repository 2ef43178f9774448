// ============= include/recognition/matcher.hpp =============
/*
 * Face Matcher - distancia euclidiana + umbral + argmin
 *
 * PROTOCOLO identify():
 * 1. Galeria vacia -> "Unknown"
 * 2. argmin de las distancias; empate -> primera aparicion en el orden
 *    de la galeria (comparacion estricta "<")
 * 3. Marca de coincidencia por entrada: distancia < threshold
 * 4. Si la entrada del argmin esta marcada -> su nombre, si no "Unknown"
 *
 * Gana la mas cercana entre las que pasan el umbral, no la primera que
 * lo pasa. Funcion pura: no modifica la galeria, sin I/O.
 */

#pragma once
#include "config.hpp"
#include "recognition/descriptor_gallery.hpp"
#include <limits>
#include <string>
#include <vector>

struct MatchResult {
    std::string name = Config::UNKNOWN_NAME;
    int index = -1;                                             // argmin en la galeria
    double distance = std::numeric_limits<double>::infinity();  // distancia del argmin
    bool recognized = false;                                    // el argmin pasa el umbral
};

class FaceMatcher {
public:
    explicit FaceMatcher(double threshold = Config::DEFAULT_MATCH_THRESHOLD);

    MatchResult identify(const Descriptor& query,
                         const std::vector<GalleryEntry>& gallery) const;

    // Toma un snapshot de la galeria y compara contra el
    MatchResult identify(const Descriptor& query,
                         const DescriptorGallery& gallery) const;

    static std::vector<double> face_distance(const std::vector<GalleryEntry>& gallery,
                                             const Descriptor& query);

    static std::vector<bool> compare_faces(const std::vector<GalleryEntry>& gallery,
                                           const Descriptor& query,
                                           double threshold);

    double get_threshold() const { return threshold; }

private:
    double threshold;
};
