#pragma once

/// \file error.h
/// \brief Typed error hierarchy for LabelSheet.
///
/// All public functions throw subclasses of LabelSheet::Error instead of
/// plain std::runtime_error, so callers can catch specific categories.

#include "export.h"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace LabelSheet {

/// Error categories returned by Error::code().
enum class ErrorCode : int {
    Ok = 0,
    InvalidInput,   ///< Caller supplied invalid arguments or data.
    IOError,        ///< File or stream I/O failure.
    FormatError,    ///< Data format / parsing error (CSV, JSON).
    ConfigMismatch, ///< Inconsistent layout configuration.
    MissingColumns, ///< Required order columns could not be resolved.
    EmptyInput,     ///< Order table has no rows.
    InternalError,  ///< Logic error inside the library.
};

/// Base exception for all LabelSheet errors.
class LABELSHEET_API Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/// File / stream I/O failure.
class LABELSHEET_API IOError : public Error {
public:
    explicit IOError(const std::string& msg)
        : Error(ErrorCode::IOError, msg) {}
};

/// Invalid input arguments or data.
class LABELSHEET_API InputError : public Error {
public:
    explicit InputError(const std::string& msg)
        : Error(ErrorCode::InvalidInput, msg) {}
};

/// Data format / parsing failure (CSV, JSON).
class LABELSHEET_API FormatError : public Error {
public:
    explicit FormatError(const std::string& msg)
        : Error(ErrorCode::FormatError, msg) {}
};

/// Inconsistent grid or page configuration.
class LABELSHEET_API ConfigError : public Error {
public:
    explicit ConfigError(const std::string& msg)
        : Error(ErrorCode::ConfigMismatch, msg) {}
};

/// One or more canonical order columns are absent from the input headers.
/// The message lists every missing field, not only the first.
class LABELSHEET_API SchemaError : public Error {
public:
    explicit SchemaError(std::vector<std::string> missing)
        : Error(ErrorCode::MissingColumns, BuildMessage(missing)), missing_(std::move(missing)) {}

    const std::vector<std::string>& missing_fields() const noexcept { return missing_; }

private:
    static std::string BuildMessage(const std::vector<std::string>& missing) {
        std::string msg = "Missing required columns: ";
        for (size_t i = 0; i < missing.size(); ++i) {
            if (i > 0) { msg += ", "; }
            msg += missing[i];
        }
        return msg;
    }

    std::vector<std::string> missing_;
};

/// The order table holds no rows. Raised by callers before invoking the engine.
class LABELSHEET_API EmptyInputError : public Error {
public:
    explicit EmptyInputError(const std::string& msg)
        : Error(ErrorCode::EmptyInput, msg) {}
};

/// Broken internal invariant (e.g. misuse of a drawing surface).
class LABELSHEET_API InternalError : public Error {
public:
    explicit InternalError(const std::string& msg)
        : Error(ErrorCode::InternalError, msg) {}
};

} // namespace LabelSheet
