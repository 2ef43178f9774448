// ============= include/recognition/descriptor.hpp =============
/*
 * Face Descriptor - vector de doubles de dimension fija
 *
 * FORMATO BLOB (columna staff.face_encoding):
 * - dim valores IEEE-754 float64
 * - little-endian, sin cabecera
 * - 128 valores = 1024 bytes
 *
 * La dimension no va en el blob: quien deserializa la conoce de antemano
 * (constante del modelo, configurable en config.toml).
 */

#pragma once
#include <cstddef>
#include <vector>

using Descriptor = std::vector<double>;

constexpr int DEFAULT_DESCRIPTOR_DIM = 128;
constexpr size_t DESCRIPTOR_VALUE_BYTES = 8;

std::vector<unsigned char> serialize_descriptor(const Descriptor& descriptor);

// Falla (false) si size != 8 * dim. `out` solo se modifica en exito.
bool deserialize_descriptor(const unsigned char* data, size_t size, int dim,
                            Descriptor& out);

// dim correcta y todos los valores finitos
bool is_valid_descriptor(const Descriptor& descriptor, int dim);

// Distancia euclidiana. Dimensiones distintas -> +infinito (nunca coincide).
double euclidean_distance(const Descriptor& a, const Descriptor& b);
