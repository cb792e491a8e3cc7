#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace ark {

/// Base class of every error thrown by the ark library.
class ArkError : public std::runtime_error {
public:
    explicit ArkError(const std::string& message) : std::runtime_error(message) {}
};

/// A name-part category has no words.
class EmptyCategoryError : public ArkError {
public:
    explicit EmptyCategoryError(const std::string& category)
        : ArkError("Name-part category '" + category + "' has no words"), category_(category) {}

    const std::string& category() const { return category_; }

private:
    std::string category_;
};

/// A name-part category lists the same word twice.
class DuplicateWordError : public ArkError {
public:
    DuplicateWordError(const std::string& category, const std::string& word)
        : ArkError("Name-part category '" + category + "' repeats the word '" + word + "'"),
          category_(category), word_(word) {}

    const std::string& category() const { return category_; }
    const std::string& word() const { return word_; }

private:
    std::string category_;
    std::string word_;
};

/// The cartesian product of the categories is larger than the pools can hold.
class NameSpaceTooLargeError : public ArkError {
public:
    NameSpaceTooLargeError() : ArkError("Name space has too many combinations") {}
};

/// A linear index or subscript outside the name space. Indicates a bug in the caller.
class IndexOutOfRangeError : public ArkError {
public:
    explicit IndexOutOfRangeError(const std::string& message) : ArkError(message) {}
};

/// A pool was asked for more indices than it has left. State is unchanged.
class InsufficientCapacityError : public ArkError {
public:
    InsufficientCapacityError(size_t requested, size_t remaining)
        : ArkError("Requested " + std::to_string(requested) + " indices but only " +
                   std::to_string(remaining) + " remain"),
          requested_(requested), remaining_(remaining) {}

    size_t requested() const { return requested_; }
    size_t remaining() const { return remaining_; }

private:
    size_t requested_;
    size_t remaining_;
};

/// Not enough unused pseudonyms left to serve a pseudonymize call.
/// Carries both pool capacities so the caller can tell whether turning
/// alliteration off would help.
class CapacityExhaustedError : public ArkError {
public:
    CapacityExhaustedError(size_t requested, size_t remainingTotal,
                           size_t remainingAlliterations, bool alliterate);

    size_t requested() const { return requested_; }
    size_t remainingTotal() const { return remainingTotal_; }
    size_t remainingAlliterations() const { return remainingAlliterations_; }
    bool alliterate() const { return alliterate_; }

    /// True when alliterations ran out but the full pool could serve the request.
    bool alliterationsOnly() const { return alliterate_ && requested_ <= remainingTotal_; }

private:
    size_t requested_;
    size_t remainingTotal_;
    size_t remainingAlliterations_;
    bool alliterate_;
};

/// Key columns passed together have different lengths.
class InconsistentLengthError : public ArkError {
public:
    explicit InconsistentLengthError(const std::string& message) : ArkError(message) {}
};

/// A Value accessor was used on a value of another type.
class ValueTypeError : public ArkError {
public:
    explicit ValueTypeError(const std::string& message) : ArkError(message) {}
};

} // namespace ark
