// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace srcmap {

/// Where in a mappings string a decoding error was detected.
struct MappingLocation {
    int generated_line{}; ///< Zero-based generated line (index of the ';'-separated group).
    size_t offset{};      ///< Character offset of the offending segment within the whole mappings string.

    bool operator==(const MappingLocation&) const = default;
};

inline std::string to_string(const MappingLocation& location) {
    return "generated line " + std::to_string(location.generated_line) + ", offset " +
           std::to_string(location.offset);
}

class SourceMapError : public std::runtime_error {
  public:
    explicit SourceMapError(const std::string& what) : std::runtime_error(what) {}
};

/// Errors found while reading a mappings string.
/// The location is attached by the decoder once the failing segment is known.
class MappingError : public SourceMapError {
    std::string reason_;
    std::optional<MappingLocation> location_;

    static std::string describe(const std::string& reason, const std::optional<MappingLocation>& location) {
        if (!location) {
            return reason;
        }
        return to_string(*location) + ": " + reason;
    }

  protected:
    MappingError(std::string reason, std::optional<MappingLocation> location)
        : SourceMapError(describe(reason, location)), reason_(std::move(reason)), location_(location) {}

  public:
    [[nodiscard]]
    const std::string& reason() const noexcept {
        return reason_;
    }

    [[nodiscard]]
    const std::optional<MappingLocation>& location() const noexcept {
        return location_;
    }
};

/// Invalid base64 character, truncated continuation chain, or a value that does not fit 32 bits.
class MalformedVlq final : public MappingError {
  public:
    explicit MalformedVlq(std::string reason, std::optional<MappingLocation> location = {})
        : MappingError(std::move(reason), location) {}
};

/// A segment with the wrong number of fields, or one that decodes to a negative line or column.
class MalformedMapping final : public MappingError {
  public:
    MalformedMapping(std::string reason, const MappingLocation& location)
        : MappingError(std::move(reason), location) {}

    [[nodiscard]]
    int generated_line() const {
        return location()->generated_line;
    }

    [[nodiscard]]
    size_t offset() const {
        return location()->offset;
    }
};

/// A decoded source or name index that falls outside the supplied tables.
class IndexOutOfRange final : public MappingError {
  public:
    explicit IndexOutOfRange(std::string reason, std::optional<MappingLocation> location = {})
        : MappingError(std::move(reason), location) {}
};

/// Encoder precondition violation. Raised before any output is produced.
class InvalidPosition final : public SourceMapError {
  public:
    explicit InvalidPosition(const std::string& what) : SourceMapError(what) {}
};

/// The JSON envelope is not a v3 source map.
class InvalidDocument final : public SourceMapError {
  public:
    explicit InvalidDocument(const std::string& what) : SourceMapError(what) {}
};

} // namespace srcmap
