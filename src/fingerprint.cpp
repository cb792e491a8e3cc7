#include "ark/fingerprint.h"
#include <cstring>

namespace ark {

namespace {

constexpr uint64_t kFnvOffsetBasis64 = 1469598103934665603ULL;
constexpr uint64_t kFnvPrime64 = 1099511628211ULL;
constexpr uint64_t kGoldenGamma = 0x9e3779b97f4a7c15ULL;
constexpr uint64_t kSplitMixMul1 = 0xbf58476d1ce4e5b9ULL;
constexpr uint64_t kSplitMixMul2 = 0x94d049bb133111ebULL;
constexpr uint64_t kSecondStreamSalt = 0x5bf03635f0b7a54dULL;

uint64_t fnv1a64(const std::string& bytes, uint64_t seed) {
    uint64_t hash = kFnvOffsetBasis64 ^ seed;
    for (unsigned char c : bytes) {
        hash ^= static_cast<uint64_t>(c);
        hash *= kFnvPrime64;
    }
    return hash;
}

uint64_t splitMixFinalize(uint64_t x) {
    x += kGoldenGamma;
    x = (x ^ (x >> 30)) * kSplitMixMul1;
    x = (x ^ (x >> 27)) * kSplitMixMul2;
    return x ^ (x >> 31);
}

void appendU64(std::string& out, uint64_t v) {
    for (int i = 0; i < 8; i++) {
        out += static_cast<char>((v >> (8 * i)) & 0xFF);
    }
}

void appendHex(std::string& out, uint64_t v) {
    static const char* hex = "0123456789abcdef";
    for (int shift = 60; shift >= 0; shift -= 4) {
        out += hex[(v >> shift) & 0xF];
    }
}

} // namespace

// Layout: row length, then per value a type tag followed by its payload.
// Ints and floats carry distinct tags, so 1 and 1.0 serialize differently.
std::string DefaultFingerprinter::serialize(const std::vector<Value>& row) {
    std::string out;
    appendU64(out, row.size());
    for (auto& v : row) {
        out += static_cast<char>(v.type());
        switch (v.type()) {
            case Value::Type::Nil:
                break;
            case Value::Type::Bool:
                out += v.asBool() ? '\1' : '\0';
                break;
            case Value::Type::Int:
                appendU64(out, static_cast<uint64_t>(v.asInt()));
                break;
            case Value::Type::Float: {
                double d = v.asFloat();
                if (d == 0.0) d = 0.0;  // -0.0 and 0.0 are the same key
                uint64_t bits;
                std::memcpy(&bits, &d, sizeof(bits));
                appendU64(out, bits);
                break;
            }
            case Value::Type::String:
                appendU64(out, v.asString().size());
                out += v.asString();
                break;
        }
    }
    return out;
}

Fingerprint DefaultFingerprinter::fingerprint(const std::vector<Value>& row) const {
    std::string bytes = serialize(row);
    Fingerprint result;
    result.reserve(32);
    appendHex(result, splitMixFinalize(fnv1a64(bytes, 0)));
    appendHex(result, splitMixFinalize(fnv1a64(bytes, kSecondStreamSalt)));
    return result;
}

} // namespace ark
