#include "recognition/descriptor.hpp"
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <utility>

// ==================== SERIALIZATION ====================

std::vector<unsigned char> serialize_descriptor(const Descriptor& descriptor) {
    std::vector<unsigned char> blob;
    blob.reserve(descriptor.size() * DESCRIPTOR_VALUE_BYTES);

    for (double value : descriptor) {
        std::uint64_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        for (size_t b = 0; b < DESCRIPTOR_VALUE_BYTES; ++b) {
            blob.push_back(static_cast<unsigned char>((bits >> (8 * b)) & 0xFF));
        }
    }
    return blob;
}

bool deserialize_descriptor(const unsigned char* data, size_t size, int dim,
                            Descriptor& out) {
    if (dim <= 0 || data == nullptr) return false;
    if (size != static_cast<size_t>(dim) * DESCRIPTOR_VALUE_BYTES) return false;

    Descriptor descriptor(static_cast<size_t>(dim));
    for (size_t i = 0; i < descriptor.size(); ++i) {
        const unsigned char* p = data + i * DESCRIPTOR_VALUE_BYTES;
        std::uint64_t bits = 0;
        for (size_t b = 0; b < DESCRIPTOR_VALUE_BYTES; ++b) {
            bits |= static_cast<std::uint64_t>(p[b]) << (8 * b);
        }
        std::memcpy(&descriptor[i], &bits, sizeof(bits));
    }

    out = std::move(descriptor);
    return true;
}

// ==================== VALIDATION ====================

bool is_valid_descriptor(const Descriptor& descriptor, int dim) {
    if (dim <= 0 || descriptor.size() != static_cast<size_t>(dim)) return false;
    for (double value : descriptor) {
        if (!std::isfinite(value)) return false;
    }
    return true;
}

// ==================== DISTANCE ====================

double euclidean_distance(const Descriptor& a, const Descriptor& b) {
    if (a.size() != b.size() || a.empty()) {
        return std::numeric_limits<double>::infinity();
    }

    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double diff = a[i] - b[i];
        sum += diff * diff;
    }
    return std::sqrt(sum);
}
