#include <mcp_fleet/gateway/request_gate.hpp>

namespace mcp_fleet {

namespace {

// Compares every byte instead of stopping at the first mismatch.
bool ConstantTimeEquals(const std::string& a, const std::string& b) {
    unsigned char diff = a.size() == b.size() ? 0 : 1;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i % (b.empty() ? 1 : b.size())]);
    }
    return diff == 0 && !b.empty();
}

Error Unauthorized(const std::string& message) {
    return Error::Make(ErrorCategory::Unauthorized, "Authorize", "", message);
}

} // anonymous namespace

Result<void, Error> AllowAllGate::Admit(const HeaderLookup& /*headers*/) const {
    return Result<void, Error>::Ok();
}

ApiKeyGate::ApiKeyGate(std::string api_key) : api_key_(std::move(api_key)) {}

Result<void, Error> ApiKeyGate::Admit(const HeaderLookup& headers) const {
    std::optional<std::string> presented = headers("X-API-Key");
    if (!presented) {
        auto authorization = headers("Authorization");
        const std::string bearer = "Bearer ";
        if (authorization && authorization->compare(0, bearer.size(), bearer) == 0) {
            presented = authorization->substr(bearer.size());
        }
    }
    if (!presented) {
        return Result<void, Error>::Err(Unauthorized("missing API key"));
    }
    if (!ConstantTimeEquals(*presented, api_key_)) {
        return Result<void, Error>::Err(Unauthorized("invalid API key"));
    }
    return Result<void, Error>::Ok();
}

std::unique_ptr<IRequestGate> MakeRequestGate(const std::optional<std::string>& api_key) {
    if (api_key && !api_key->empty()) {
        return std::make_unique<ApiKeyGate>(*api_key);
    }
    return std::make_unique<AllowAllGate>();
}

} // namespace mcp_fleet
