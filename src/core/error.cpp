/// @file error.cpp
/// @brief Error code names, context bookkeeping and chain formatting

#include <attest/core/error.hpp>

#include <algorithm>
#include <array>
#include <sstream>

namespace attest_core {

namespace {

constexpr std::array<const char*, 8> k_code_names = {
    "Unknown", "NotFound", "InvalidArgument", "InvalidState",
    "IOError", "ParseError", "ValidationError", "NotSupported",
};

/// Appends " (label: value)" unless the message already mentions value
void append_field(std::ostringstream& out, const std::string& message,
                  const char* label, const std::string& value) {
    if (!value.empty() && message.find(value) == std::string::npos) {
        out << " (" << label << ": " << value << ")";
    }
}

struct DetailWriter {
    std::ostringstream& out;
    const std::string& message;

    void operator()(std::monostate) const {}

    void operator()(const ArchiveError& err) const {
        out << " <archive>";
        append_field(out, message, "archive", err.archive);
        append_field(out, message, "entry", err.entry);
    }

    void operator()(const ClassFileError& err) const {
        out << " <class file>";
        append_field(out, message, "source", err.source);
    }

    void operator()(const ConfigError& err) const {
        out << " <config>";
        append_field(out, message, "key", err.key);
    }
};

} // namespace

const char* error_code_name(ErrorCode code) {
    const auto index = static_cast<std::size_t>(code);
    return index < k_code_names.size() ? k_code_names[index] : "Unknown";
}

Error& Error::with_context(const std::string& key, const std::string& value) {
    auto it = std::find_if(m_context.begin(), m_context.end(),
                           [&key](const auto& entry) { return entry.first == key; });
    if (it != m_context.end()) {
        it->second = value;
    } else {
        m_context.emplace_back(key, value);
    }
    return *this;
}

const std::string* Error::get_context(const std::string& key) const {
    for (const auto& [name, value] : m_context) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

std::string build_error_chain(const Error& error) {
    std::ostringstream out;
    out << '[' << error_code_name(error.code()) << "] " << error.message();
    std::visit(DetailWriter{out, error.message()}, error.detail());
    for (const auto& [key, value] : error.context()) {
        out << "\n  " << key << ": " << value;
    }
    return out.str();
}

template class Result<void, Error>;
template class Result<std::string, Error>;

} // namespace attest_core
