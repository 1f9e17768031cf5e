/**
 * @file Errors.hpp
 * @brief Exception types for trimerge
 *
 * Merge failures (all fatal to a single merge call):
 * - MergeError: Base class
 * - StructuralKindMismatch: base/local/remote differ in kind at a path
 * - UnsupportedValueKind: a scalar reached a point requiring structural merge
 * - ContractViolation: an internal decision-builder precondition failed
 * - DepthExceeded: document nesting deeper than the configured limit
 * - InvalidEditScript: malformed or inconsistent edit script
 *
 * I/O and configuration failures:
 * - FileNotFoundError: input file not found
 * - ParseError: JSON/TOML syntax errors
 * - SettingsError: setting with wrong type or out of range
 *
 * Conflicts are regular merge output and never raise.
 */

#ifndef TRIMERGE_ERRORS_HPP
#define TRIMERGE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace trimerge {

/**
 * @brief Base class for all trimerge exceptions
 */
class MergeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief base, local and remote do not share one structural kind
 */
class StructuralKindMismatch : public MergeError {
public:
    /**
     * @param path Path where the kinds diverge
     * @param base Kind name of the base value
     * @param local Kind name of the local value
     * @param remote Kind name of the remote value
     */
    StructuralKindMismatch(std::string path, std::string base,
                           std::string local, std::string remote)
        : MergeError("Structural kind mismatch at '" + path + "': base is " + base +
                     ", local is " + local + ", remote is " + remote)
        , path_(std::move(path))
        , base_(std::move(base))
        , local_(std::move(local))
        , remote_(std::move(remote))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& base_kind() const noexcept { return base_; }
    const std::string& local_kind() const noexcept { return local_; }
    const std::string& remote_kind() const noexcept { return remote_; }

private:
    std::string path_;
    std::string base_;
    std::string local_;
    std::string remote_;
};

/**
 * @brief A value kind outside {map, sequence, text} needs a structural merge
 */
class UnsupportedValueKind : public MergeError {
public:
    UnsupportedValueKind(std::string path, std::string kind)
        : MergeError("Cannot merge value of kind " + kind + " at '" + path + "'")
        , path_(std::move(path))
        , kind_(std::move(kind))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& kind() const noexcept { return kind_; }

private:
    std::string path_;
    std::string kind_;
};

/**
 * @brief A decision-builder precondition was violated
 *
 * Indicates a defect in the merge engine, not bad input data.
 */
class ContractViolation : public MergeError {
public:
    explicit ContractViolation(const std::string& what)
        : MergeError("Contract violation: " + what)
    {}
};

/**
 * @brief Recursion went deeper than the configured maximum
 */
class DepthExceeded : public MergeError {
public:
    DepthExceeded(std::string path, std::size_t limit)
        : MergeError("Document too deeply nested at '" + path +
                     "' (maximum depth " + std::to_string(limit) + ")")
        , path_(std::move(path))
        , limit_(limit)
    {}

    const std::string& path() const noexcept { return path_; }
    std::size_t limit() const noexcept { return limit_; }

private:
    std::string path_;
    std::size_t limit_;
};

/**
 * @brief Edit script is malformed or does not fit the value it targets
 */
class InvalidEditScript : public MergeError {
public:
    explicit InvalidEditScript(const std::string& details)
        : MergeError("Invalid edit script: " + details)
    {}
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public MergeError {
public:
    explicit FileNotFoundError(std::string path)
        : MergeError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief JSON/TOML syntax error in an input or settings file
 */
class ParseError : public MergeError {
public:
    /**
     * @param file Path to the file with the parse error
     * @param line Line number (1-based, 0 if unknown)
     * @param column Column number (1-based, 0 if unknown)
     * @param details Message from the parser
     */
    ParseError(std::string file, int line, int column, std::string details)
        : MergeError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line);
            if (column > 0) {
                msg += ", column " + std::to_string(column);
            }
        }
        return msg + ": " + details;
    }
};

/**
 * @brief A setting has the wrong type or is out of range
 */
class SettingsError : public MergeError {
public:
    SettingsError(std::string key, const std::string& details)
        : MergeError("Invalid setting '" + key + "': " + details)
        , key_(std::move(key))
    {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

} // namespace trimerge

#endif // TRIMERGE_ERRORS_HPP
