#include "recognition/matcher.hpp"

FaceMatcher::FaceMatcher(double threshold)
    : threshold(threshold)
{
}

std::vector<double> FaceMatcher::face_distance(const std::vector<GalleryEntry>& gallery,
                                               const Descriptor& query) {
    std::vector<double> distances;
    distances.reserve(gallery.size());
    for (const auto& entry : gallery) {
        distances.push_back(euclidean_distance(entry.descriptor, query));
    }
    return distances;
}

std::vector<bool> FaceMatcher::compare_faces(const std::vector<GalleryEntry>& gallery,
                                             const Descriptor& query,
                                             double threshold) {
    std::vector<bool> matches;
    matches.reserve(gallery.size());
    for (double d : face_distance(gallery, query)) {
        matches.push_back(d < threshold);
    }
    return matches;
}

MatchResult FaceMatcher::identify(const Descriptor& query,
                                  const std::vector<GalleryEntry>& gallery) const {
    MatchResult result;

    if (gallery.empty()) {
        return result;
    }

    std::vector<double> distances = face_distance(gallery, query);
    std::vector<bool> matches = compare_faces(gallery, query, threshold);

    size_t best_index = 0;
    for (size_t i = 1; i < distances.size(); ++i) {
        if (distances[i] < distances[best_index]) {
            best_index = i;
        }
    }

    result.index = static_cast<int>(best_index);
    result.distance = distances[best_index];

    if (matches[best_index]) {
        result.name = gallery[best_index].name;
        result.recognized = true;
    }

    return result;
}

MatchResult FaceMatcher::identify(const Descriptor& query,
                                  const DescriptorGallery& gallery) const {
    GallerySnapshot snapshot = gallery.all();
    return identify(query, *snapshot);
}
