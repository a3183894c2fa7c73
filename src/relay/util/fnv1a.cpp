#include <relay/util/fnv1a.hpp>

namespace relay {

uint64_t FNV1a::compute(const uint8_t* data, size_t len) {
    return update(OFFSET_BASIS, data, len);
}

uint64_t FNV1a::compute(const char* data, size_t len) {
    return compute(reinterpret_cast<const uint8_t*>(data), len);
}

uint64_t FNV1a::compute(const std::string& data) {
    return compute(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

uint64_t FNV1a::update(uint64_t hash, const uint8_t* data, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        hash ^= data[i];
        hash *= PRIME;
    }
    return hash;
}

uint64_t FNV1a::update(uint64_t hash, const std::string& data) {
    return update(hash, reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

}  // namespace relay
