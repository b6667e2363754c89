#include <mcp_fleet/core/types.hpp>

#include <iomanip>
#include <random>
#include <sstream>

namespace mcp_fleet {

namespace {

constexpr size_t kMaxBackendNameLength = 64;

bool IsBackendNameChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '_';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// BackendName
// ---------------------------------------------------------------------------
Result<BackendName, std::string> BackendName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<BackendName, std::string>::Err("backend name must not be empty");
    }
    if (name.size() > kMaxBackendNameLength) {
        return Result<BackendName, std::string>::Err(
            "backend name exceeds " + std::to_string(kMaxBackendNameLength) +
            " characters");
    }
    for (char c : name) {
        if (!IsBackendNameChar(c)) {
            return Result<BackendName, std::string>::Err(
                "backend name contains invalid character '" + std::string(1, c) + "'");
        }
    }
    return Result<BackendName, std::string>::Ok(BackendName(std::string(name)));
}

// ---------------------------------------------------------------------------
// QualifiedToolName
// ---------------------------------------------------------------------------
Result<QualifiedToolName, std::string> QualifiedToolName::Parse(std::string_view qualified) {
    auto dot = qualified.find('.');
    if (dot == std::string_view::npos) {
        return Result<QualifiedToolName, std::string>::Err(
            "tool name must be qualified as 'backend.tool'");
    }
    if (dot == 0) {
        return Result<QualifiedToolName, std::string>::Err("missing backend before '.'");
    }
    if (dot + 1 == qualified.size()) {
        return Result<QualifiedToolName, std::string>::Err("missing tool after '.'");
    }
    return Result<QualifiedToolName, std::string>::Ok(QualifiedToolName(
        std::string(qualified.substr(0, dot)), std::string(qualified.substr(dot + 1))));
}

QualifiedToolName QualifiedToolName::Join(const std::string& backend, const std::string& tool) {
    return QualifiedToolName(backend, tool);
}

std::string GenerateSessionId() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << rng() << std::setw(16) << rng();
    return oss.str();
}

} // namespace mcp_fleet
