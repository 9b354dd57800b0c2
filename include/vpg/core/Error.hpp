#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace vpg::core {

class Error : public std::runtime_error {
public:
    explicit Error(std::string message);
    virtual ~Error() = default;
};

inline Error::Error(std::string message)
    : std::runtime_error(std::move(message)) {}

enum class ErrorKind {
    NotFound,
    Parse,
    Io
};

constexpr const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Parse:    return "Parse";
        case ErrorKind::Io:       return "IO";
    }
    return "Unknown";
}

// Failure tied to one file or directory.
class FileError : public Error {
public:
    FileError(ErrorKind kind, std::string path, std::string details);

    ErrorKind kind() const noexcept { return m_kind; }
    const std::string& path() const noexcept { return m_path; }
    const std::string& details() const noexcept { return m_details; }

private:
    static std::string BuildMessage(ErrorKind kind,
                                    std::string_view path,
                                    const std::string& details);

    ErrorKind m_kind;
    std::string m_path;
    std::string m_details;
};

inline std::string FileError::BuildMessage(ErrorKind kind,
                                           std::string_view path,
                                           const std::string& details) {
    std::string message;
    message.reserve(path.size() + details.size() + 24);
    message.append(ErrorKindName(kind));
    message.append(" error [");
    message.append(path);
    message.append("]");
    if (!details.empty()) {
        message.append(": ");
        message.append(details);
    }
    return message;
}

inline FileError::FileError(ErrorKind kind, std::string path, std::string details)
    : Error(BuildMessage(kind, path, details)),
      m_kind(kind),
      m_path(std::move(path)),
      m_details(std::move(details)) {}

class NotFoundError : public FileError {
public:
    NotFoundError(std::string path, std::string details)
        : FileError(ErrorKind::NotFound, std::move(path), std::move(details)) {}
};

class ParseError : public FileError {
public:
    ParseError(std::string path, std::string details)
        : FileError(ErrorKind::Parse, std::move(path), std::move(details)) {}
};

class IoError : public FileError {
public:
    IoError(std::string path, std::string details)
        : FileError(ErrorKind::Io, std::move(path), std::move(details)) {}
};

// Invalid option or configuration value.
class ConfigError : public Error {
public:
    ConfigError(std::string_view option, std::string details);

    std::string_view option() const noexcept { return m_option; }

private:
    std::string m_option;
};

inline ConfigError::ConfigError(std::string_view option, std::string details)
    : Error("Invalid value for '" + std::string(option) + "': " + details),
      m_option(option) {}

} // namespace vpg::core
