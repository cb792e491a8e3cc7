#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ark {

/// Fingerprint -> pseudonym map that remembers insertion order.
/// Entries are never removed or overwritten.
class Registry {
public:
    struct Entry {
        std::string fingerprint;
        std::string pseudonym;
    };

    /// Pseudonym stored for a fingerprint, or nullptr.
    const std::string* find(std::string_view fingerprint) const;

    bool contains(std::string_view fingerprint) const { return index_.count(fingerprint) > 0; }

    /// Store a new pair. Returns false, changing nothing, if the fingerprint
    /// is already registered.
    bool insert(std::string fingerprint, std::string pseudonym);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /// Entries in insertion order.
    const std::deque<Entry>& entries() const { return entries_; }

private:
    // deque doesn't invalidate references on growth, so string_view keys stay valid
    std::deque<Entry> entries_;
    std::unordered_map<std::string_view, size_t> index_;
};

} // namespace ark
