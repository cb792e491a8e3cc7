#include "ark/archive.h"
#include "ark/allocation_engine.h"
#include "ark/error.h"
#include "ark/fingerprint.h"
#include "ark/log.h"
#include "ark/name_parts.h"
#include <algorithm>
#include <cstdio>
#include <random>

namespace ark {

static std::mt19937 seededRng(const std::optional<uint64_t>& seed) {
    if (seed) {
        std::seed_seq seq{static_cast<uint32_t>(*seed), static_cast<uint32_t>(*seed >> 32)};
        return std::mt19937(seq);
    }
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return std::mt19937(seq);
}

struct Ark::Impl {
    ArkOptions options;
    std::unique_ptr<AllocationEngine> engine;
    DefaultFingerprinter defaultFingerprinter;
    Fingerprinter* fingerprinter = nullptr;

    Impl(std::vector<Category> parts, ArkOptions opts) : options(std::move(opts)) {
        auto rng = seededRng(options.seed);
        engine = std::make_unique<AllocationEngine>(NameSpace(std::move(parts)), rng,
                                                    options.separator);
        fingerprinter = &defaultFingerprinter;
    }
};

Ark::Ark(ArkOptions options)
    : impl_(std::make_unique<Impl>(defaultNameParts(), std::move(options))) {}

Ark::Ark(std::vector<Category> parts, ArkOptions options)
    : impl_(std::make_unique<Impl>(cleanNameParts(std::move(parts)), std::move(options))) {}

Ark::~Ark() = default;
Ark::Ark(Ark&&) noexcept = default;
Ark& Ark::operator=(Ark&&) noexcept = default;

std::vector<std::string> Ark::pseudonymize(const std::vector<Column>& columns,
                                           std::optional<bool> alliterate) {
    if (columns.empty()) {
        throw ArkError("pseudonymize needs at least one key column");
    }
    size_t rows = columns[0].size();
    for (auto& column : columns) {
        if (column.size() != rows) {
            throw InconsistentLengthError("All key columns must have the same length, got " +
                                          std::to_string(rows) + " and " +
                                          std::to_string(column.size()));
        }
    }
    if (rows == 0) return {};

    bool allIntegralFloats = std::all_of(columns.begin(), columns.end(), [](const Column& c) {
        return std::all_of(c.begin(), c.end(), [](const Value& v) { return v.isIntegralFloat(); });
    });
    if (allIntegralFloats) {
        logger()->warn("All numerical keys are whole numbers stored as floats. "
                       "Floats and integers with the same numeric value are different keys "
                       "and get different pseudonyms; convert explicitly to avoid surprises.");
    }

    std::vector<Fingerprint> keys;
    keys.reserve(rows);
    std::vector<Value> row(columns.size());
    for (size_t r = 0; r < rows; r++) {
        for (size_t c = 0; c < columns.size(); c++) {
            row[c] = columns[c][r];
        }
        keys.push_back(impl_->fingerprinter->fingerprint(row));
    }

    return impl_->engine->pseudonymize(keys, alliterate.value_or(impl_->options.alliterate));
}

std::vector<std::string> Ark::pseudonymize(const Column& column, std::optional<bool> alliterate) {
    return pseudonymize(std::vector<Column>{column}, alliterate);
}

std::vector<std::string> Ark::pseudonymize(const std::vector<std::string>& column,
                                           std::optional<bool> alliterate) {
    return pseudonymize(std::vector<Column>{stringColumn(column)}, alliterate);
}

size_t Ark::size() const { return impl_->engine->size(); }
size_t Ark::alliterationCount() const { return impl_->engine->alliterationCount(); }
LinearIndex Ark::total() const { return impl_->engine->total(); }
size_t Ark::alliterationTotal() const { return impl_->engine->alliterationTotal(); }
bool Ark::alliterates() const { return impl_->options.alliterate; }
const Registry& Ark::registry() const { return impl_->engine->registry(); }
const AllocationEngine& Ark::engine() const { return *impl_->engine; }

void Ark::setFingerprinter(Fingerprinter* fingerprinter) {
    impl_->fingerprinter = fingerprinter ? fingerprinter : &impl_->defaultFingerprinter;
}

const Fingerprinter& Ark::fingerprinter() const {
    return *impl_->fingerprinter;
}

static std::string usageLine(size_t used, uint64_t total, const char* what) {
    double percent = total == 0 ? 0.0 : 100.0 * static_cast<double>(used) / static_cast<double>(total);
    char buf[128];
    std::snprintf(buf, sizeof(buf), "# %zu / %llu %s used (%0.0f%%)\n", used,
                  static_cast<unsigned long long>(total), what, percent);
    return buf;
}

std::string Ark::toString(size_t n) const {
    if (n == 0) {
        throw ArkError("Ark::toString: number of entries must be positive");
    }
    auto& engine = *impl_->engine;
    std::string out = impl_->options.alliterate ? "# An alliterating Ark\n" : "# An Ark\n";
    out += usageLine(engine.size(), engine.total(), "pseudonyms");
    out += usageLine(engine.alliterationCount(), engine.alliterationTotal(), "alliterations");
    out += "\n";

    if (engine.size() == 0) {
        out += "The Ark is empty.\n";
        return out;
    }
    if (engine.size() >= engine.total()) {
        out += "The Ark is full.\n";
        return out;
    }

    auto& entries = engine.registry().entries();
    size_t shown = std::min(n, entries.size());
    int width = static_cast<int>(std::to_string(shown).size());
    char buf[256];

    std::snprintf(buf, sizeof(buf), "%*s key %7s pseudonym\n", width, "", "");
    out += buf;
    std::snprintf(buf, sizeof(buf), "%*s <fingerprint> <Attribute Animal>\n", width, "");
    out += buf;
    for (size_t i = 0; i < shown; i++) {
        auto& e = entries[i];
        out += std::string(static_cast<size_t>(width) - std::to_string(i + 1).size(), ' ');
        out += std::to_string(i + 1) + " " + e.fingerprint.substr(0, 8) + "... " + e.pseudonym + "\n";
    }
    if (shown < entries.size()) {
        out += "# ...with " + std::to_string(entries.size() - shown) + " more entries\n";
    }
    return out;
}

} // namespace ark
