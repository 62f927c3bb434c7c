#pragma once

#include <stdexcept>
#include <string>

namespace libwnedit {

// Referenced id is absent from the active lexicon.
class NotFoundError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

// Required field missing or enumeration value not recognized.
class InvalidShapeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// A lemma/pos lookup matched more than one entry where one was required.
class AmbiguousMatchError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// The bulk load path found the store's schema different from what it expects.
class SchemaMismatchError : public std::runtime_error {
public:
    enum class Reason {
        MissingInterface,
        MissingSchemaElement,
        VersionMismatch
    };

    SchemaMismatchError(Reason reason, const std::string& message)
        : std::runtime_error(message), reason_(reason) {}

    [[nodiscard]] Reason reason() const noexcept { return reason_; }

private:
    Reason reason_;
};

class BackingStoreError : public std::runtime_error {
public:
    explicit BackingStoreError(const std::string& message, int code = 0)
        : std::runtime_error(message), code_(code) {}

    // SQLite result code, 0 when the failure did not come from the engine.
    [[nodiscard]] int code() const noexcept { return code_; }

private:
    int code_;
};

}  // namespace libwnedit
