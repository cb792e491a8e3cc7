#pragma once

#include "value.h"
#include <cstdint>
#include <string>
#include <vector>

namespace ark {

/// Opaque fixed-length digest of one key row.
using Fingerprint = std::string;

/// Abstract row hasher. ark ships with DefaultFingerprinter.
/// Host applications can provide their own (e.g. a cryptographic digest) by
/// subclassing this. Same row -> same fingerprint; different rows should get
/// different fingerprints with overwhelming probability.
class Fingerprinter {
public:
    virtual ~Fingerprinter() = default;

    virtual Fingerprint fingerprint(const std::vector<Value>& row) const = 0;
};

/// Built-in fingerprinter: a type-tagged serialization of the row hashed by
/// two independently seeded FNV-1a streams, each finished with SplitMix64.
/// Produces 32 lowercase hex characters. Not cryptographic.
class DefaultFingerprinter : public Fingerprinter {
public:
    Fingerprint fingerprint(const std::vector<Value>& row) const override;

    /// Serialized bytes hashed for a row. Exposed for tests.
    static std::string serialize(const std::vector<Value>& row);
};

} // namespace ark
