#pragma once

#include "value.h"
#include "name_space.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ark {

class AllocationEngine;
class Fingerprinter;
class Registry;

struct ArkOptions {
    /// Return only alliterations unless a call says otherwise.
    bool alliterate = false;

    /// Seed for the shuffles. Without one the engine seeds from std::random_device.
    std::optional<uint64_t> seed;

    /// Placed between the words of a pseudonym.
    std::string separator = " ";
};

/// A pseudonym archive. Remembers every key it has seen and gives it the same
/// pseudonym on every call; no pseudonym is handed out twice.
class Ark {
public:
    /// Archive over the default adjectives and animals.
    explicit Ark(ArkOptions options = {});

    /// Archive over custom name parts. Parts are cleaned with cleanNameParts().
    explicit Ark(std::vector<Category> parts, ArkOptions options = {});

    ~Ark();
    Ark(Ark&&) noexcept;
    Ark& operator=(Ark&&) noexcept;

    /// One pseudonym per row of the key table formed by the columns.
    /// Throws InconsistentLengthError if the columns differ in length and
    /// CapacityExhaustedError if too few pseudonyms are left.
    std::vector<std::string> pseudonymize(const std::vector<Column>& columns,
                                          std::optional<bool> alliterate = std::nullopt);
    std::vector<std::string> pseudonymize(const Column& column,
                                          std::optional<bool> alliterate = std::nullopt);
    std::vector<std::string> pseudonymize(const std::vector<std::string>& column,
                                          std::optional<bool> alliterate = std::nullopt);

    // Inspection
    size_t size() const;
    size_t alliterationCount() const;
    LinearIndex total() const;
    size_t alliterationTotal() const;
    bool alliterates() const;
    const Registry& registry() const;
    const AllocationEngine& engine() const;

    /// Summary plus the first n registered entries. n must be positive.
    std::string toString(size_t n = 10) const;

    /// Replace the row hasher. The archive does not take ownership; passing
    /// nullptr restores the built-in one. Changing it after keys were
    /// registered makes those keys unreachable.
    void setFingerprinter(Fingerprinter* fingerprinter);
    const Fingerprinter& fingerprinter() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ark
